#include "provider/stdio_tool_provider.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolbridge::provider {

using core::errors::ErrorCategory;
using core::errors::WorkerError;
using nlohmann::json;

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr int kMaxListPages = 64;
constexpr auto kCloseGrace = std::chrono::milliseconds(2000);

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string rpc_error_message(const json& error) {
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    return "json-rpc error";
}

std::string collect_text(const json& content) {
    std::string text;
    if (!content.is_array()) {
        return text;
    }
    for (const auto& item : content) {
        if (item.is_object() && item.value("type", "") == "text" &&
            item.contains("text") && item["text"].is_string()) {
            if (!text.empty()) {
                text += "\n";
            }
            text += item["text"].get<std::string>();
        }
    }
    return text;
}

// Maps a tools/call result onto the value a snippet sees.
core::errors::Result<json> extract_tool_value(const std::string& name, const json& result) {
    if (!result.is_object()) {
        return WorkerError{ErrorCategory::Execution,
                           "Malformed response from tool " + name, "tool_bad_response"};
    }

    const bool is_error = result.value("isError", false);
    if (is_error) {
        std::string text = collect_text(result.value("content", json::array()));
        if (text.empty()) {
            text = "Tool reported an error";
        }
        return WorkerError{ErrorCategory::Execution, text, "tool_error"};
    }

    if (result.contains("content") && result["content"].is_array() &&
        !result["content"].empty()) {
        const auto& first = result["content"].front();
        const std::string type = first.is_object() ? first.value("type", "") : "";
        if (type != "text") {
            return WorkerError{ErrorCategory::Execution,
                               "Unexpected content type: " + type, "tool_bad_response"};
        }
        const std::string text =
            first.contains("text") && first["text"].is_string() ? first["text"].get<std::string>() : "";
        const std::string trimmed = trim(text);
        if (!trimmed.empty() && (trimmed.front() == '{' || trimmed.front() == '[')) {
            json parsed = json::parse(trimmed, nullptr, false);
            if (!parsed.is_discarded()) {
                return parsed;
            }
        }
        return json(text);
    }

    if (result.contains("toolResult")) {
        return result["toolResult"];
    }

    return WorkerError{ErrorCategory::Execution, "No content in tool response",
                       "tool_bad_response"};
}

}  // namespace

StdioToolProvider::StdioToolProvider(core::config::ProviderConfig config)
    : config_(std::move(config)) {}

StdioToolProvider::~StdioToolProvider() {
    static_cast<void>(close());
}

bool StdioToolProvider::is_connected() const {
    return connected_;
}

WorkerError StdioToolProvider::connection_lost(const std::string& message) {
    connected_ = false;
    return WorkerError{ErrorCategory::Connection, message, "connection_lost"};
}

core::errors::Result<json> StdioToolProvider::connect() {
    if (connected_) {
        return json::object();
    }
    release_process();

    // A dead child must surface as EPIPE, not kill the worker.
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    if (pipe(to_child) != 0 || pipe(from_child) != 0) {
        close_fd(to_child[0]);
        close_fd(to_child[1]);
        return WorkerError{ErrorCategory::Connection,
                           "Failed to create provider pipes: " + std::string(std::strerror(errno)),
                           "pipe_creation_failed"};
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(config_.command);
    for (const auto& arg : config_.args) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    LOG_INFO("StdioToolProvider: starting " + config_.command);
    const pid_t pid = fork();
    if (pid < 0) {
        close_fd(to_child[0]);
        close_fd(to_child[1]);
        close_fd(from_child[0]);
        close_fd(from_child[1]);
        return WorkerError{ErrorCategory::Connection, "Failed to fork provider process.",
                           "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(to_child[0], STDIN_FILENO));
        static_cast<void>(dup2(from_child[1], STDOUT_FILENO));
        static_cast<void>(::close(to_child[0]));
        static_cast<void>(::close(to_child[1]));
        static_cast<void>(::close(from_child[0]));
        static_cast<void>(::close(from_child[1]));
        static_cast<void>(setenv("MCP_CODE_EXECUTION_MODE", "true", 1));
        static_cast<void>(setenv("MCP_CODE_FIRST_MODE", "false", 1));
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(::close(to_child[0]));
    static_cast<void>(::close(from_child[1]));
    to_child_fd_ = to_child[1];
    from_child_fd_ = from_child[0];
    static_cast<void>(fcntl(to_child_fd_, F_SETFD, FD_CLOEXEC));
    static_cast<void>(fcntl(from_child_fd_, F_SETFD, FD_CLOEXEC));
    child_pid_ = pid;
    connected_ = true;
    read_buffer_.clear();

    json init_params;
    init_params["protocolVersion"] = kProtocolVersion;
    init_params["capabilities"] = json::object();
    init_params["clientInfo"] = {{"name", "toolbridge-worker"}, {"version", "1.0.0"}};
    auto handshake = request("initialize", init_params);
    if (core::errors::is_error(handshake)) {
        auto err = core::errors::get_error(handshake);
        release_process();
        err.category = ErrorCategory::Connection;
        err.message = "Failed to connect to tool provider: " + err.message;
        return err;
    }

    json initialized;
    initialized["jsonrpc"] = "2.0";
    initialized["method"] = "notifications/initialized";
    auto sent = send_message(initialized);
    if (core::errors::is_error(sent)) {
        auto err = core::errors::get_error(sent);
        release_process();
        return err;
    }

    LOG_INFO("StdioToolProvider: connected (pid " + std::to_string(child_pid_) + ")");
    return core::errors::get_value(handshake);
}

core::errors::Result<json> StdioToolProvider::invoke(const std::string& name,
                                                     const json& args) {
    json arguments = args.is_object() ? args : json::object();
    if (config_.wrap_params && !arguments.empty()) {
        arguments = json{{"params", arguments}};
    }

    json params;
    params["name"] = name;
    params["arguments"] = arguments;
    LOG_DEBUG("StdioToolProvider: calling tool " + name);
    auto result = request("tools/call", params);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return extract_tool_value(name, core::errors::get_value(result));
}

core::errors::Result<json> StdioToolProvider::list_capabilities() {
    json tools = json::array();
    std::string cursor;
    for (int page = 0; page < kMaxListPages; ++page) {
        json params = json::object();
        if (!cursor.empty()) {
            params["cursor"] = cursor;
        }
        auto result = request("tools/list", params);
        if (core::errors::is_error(result)) {
            return core::errors::get_error(result);
        }
        const auto& body = core::errors::get_value(result);
        if (!body.is_object() || !body.contains("tools") || !body["tools"].is_array()) {
            return WorkerError{ErrorCategory::Execution,
                               "tools/list returned no tool array", "tool_bad_response"};
        }
        for (const auto& tool : body["tools"]) {
            tools.push_back(tool);
        }
        if (!body.contains("nextCursor") || !body["nextCursor"].is_string()) {
            break;
        }
        cursor = body["nextCursor"].get<std::string>();
        if (cursor.empty()) {
            break;
        }
    }
    return tools;
}

core::errors::Result<bool> StdioToolProvider::close() {
    if (child_pid_ <= 0 && to_child_fd_ < 0 && from_child_fd_ < 0) {
        connected_ = false;
        return true;
    }
    LOG_INFO("StdioToolProvider: closing connection");
    release_process();
    return true;
}

void StdioToolProvider::release_process() {
    connected_ = false;
    // EOF on stdin is the polite shutdown request for stdio servers.
    close_fd(to_child_fd_);

    if (child_pid_ > 0) {
        const auto deadline = std::chrono::steady_clock::now() + kCloseGrace;
        bool reaped = false;
        int status = 0;
        while (std::chrono::steady_clock::now() < deadline) {
            const pid_t waited = waitpid(child_pid_, &status, WNOHANG);
            if (waited == child_pid_ || waited < 0) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (!reaped) {
            LOG_WARN("StdioToolProvider: provider did not exit, killing pid " +
                     std::to_string(child_pid_));
            static_cast<void>(kill(child_pid_, SIGKILL));
            static_cast<void>(waitpid(child_pid_, &status, 0));
        }
        child_pid_ = -1;
    }

    close_fd(from_child_fd_);
    read_buffer_.clear();
}

core::errors::Result<bool> StdioToolProvider::send_message(const json& message) {
    if (!connected_ || to_child_fd_ < 0) {
        return connection_lost("Tool provider is not connected");
    }

    const std::string line = message.dump() + "\n";
    std::size_t written = 0;
    while (written < line.size()) {
        const ssize_t n = write(to_child_fd_, line.data() + written, line.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return connection_lost("Connection lost while writing to tool provider: " +
                               std::string(std::strerror(errno)));
    }
    return true;
}

core::errors::Result<std::string> StdioToolProvider::read_line(
    const std::chrono::steady_clock::time_point deadline) {
    while (true) {
        const auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            return line;
        }
        if (from_child_fd_ < 0) {
            return connection_lost("Tool provider is not connected");
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return WorkerError{ErrorCategory::Connection,
                               "Timed out waiting for tool provider response",
                               "rpc_timeout"};
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

        pollfd fds[1];
        fds[0].fd = from_child_fd_;
        fds[0].events = POLLIN;
        const int ready = poll(fds, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return connection_lost("poll() failed on tool provider pipe: " +
                                   std::string(std::strerror(errno)));
        }
        if (ready == 0) {
            continue;
        }

        char buffer[4096];
        const ssize_t n = read(from_child_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            read_buffer_.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return connection_lost(n == 0 ? "Connection lost: tool provider closed its output"
                                      : "Connection lost while reading from tool provider: " +
                                            std::string(std::strerror(errno)));
    }
}

void StdioToolProvider::answer_server_request(const json& message) {
    json reply;
    reply["jsonrpc"] = "2.0";
    reply["id"] = message["id"];
    if (message.value("method", "") == "ping") {
        reply["result"] = json::object();
    } else {
        reply["error"] = {{"code", -32601}, {"message", "Method not supported by client"}};
    }
    auto sent = send_message(reply);
    if (core::errors::is_error(sent)) {
        LOG_WARN("StdioToolProvider: failed to answer server request: " +
                 core::errors::get_error(sent).message);
    }
}

core::errors::Result<json> StdioToolProvider::request(const std::string& method,
                                                      const json& params) {
    const std::int64_t id = next_id_++;
    json message;
    message["jsonrpc"] = "2.0";
    message["id"] = id;
    message["method"] = method;
    message["params"] = params;

    auto sent = send_message(message);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(config_.rpc_timeout_ms);
    while (true) {
        auto line = read_line(deadline);
        if (core::errors::is_error(line)) {
            return core::errors::get_error(line);
        }
        const std::string text = trim(core::errors::get_value(line));
        if (text.empty()) {
            continue;
        }

        const json incoming = json::parse(text, nullptr, false);
        if (incoming.is_discarded() || !incoming.is_object()) {
            LOG_WARN("StdioToolProvider: ignoring non-JSON provider output");
            continue;
        }
        if (incoming.contains("method")) {
            if (incoming.contains("id")) {
                answer_server_request(incoming);
            } else {
                LOG_DEBUG("StdioToolProvider: notification " +
                          incoming.value("method", std::string()));
            }
            continue;
        }
        if (!incoming.contains("id") || incoming["id"] != id) {
            LOG_WARN("StdioToolProvider: dropping response for stale request id");
            continue;
        }

        if (incoming.contains("error")) {
            return WorkerError{ErrorCategory::Execution,
                               rpc_error_message(incoming["error"]), "rpc_error",
                               "", incoming["error"]};
        }
        if (!incoming.contains("result")) {
            return WorkerError{ErrorCategory::Execution,
                               "Response to " + method + " has no result", "rpc_error"};
        }
        return incoming["result"];
    }
}

void StdioToolProvider::settle(const std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        return;
    }
    const auto deadline = std::chrono::steady_clock::now() + interval;
    if (!connected_) {
        std::this_thread::sleep_for(interval);
        return;
    }

    // Anything still arriving belongs to the finished execution; consume it
    // here so it can never be matched against the next request.
    while (std::chrono::steady_clock::now() < deadline) {
        auto line = read_line(deadline);
        if (core::errors::is_error(line)) {
            const auto& err = core::errors::get_error(line);
            if (err.code != "rpc_timeout") {
                LOG_WARN("StdioToolProvider: " + err.message);
            }
            return;
        }
        const json incoming = json::parse(core::errors::get_value(line), nullptr, false);
        if (!incoming.is_discarded() && incoming.is_object() && incoming.contains("method") &&
            incoming.contains("id")) {
            answer_server_request(incoming);
            continue;
        }
        LOG_DEBUG("StdioToolProvider: drained late provider message");
    }
}

}  // namespace toolbridge::provider
