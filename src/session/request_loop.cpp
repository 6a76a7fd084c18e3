#include "session/request_loop.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <istream>
#include <ostream>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace toolbridge::session {

using core::errors::ErrorCategory;
using core::errors::WorkerError;
using nlohmann::json;
using protocol::ExecutionFailure;
using protocol::ExecutionRequest;
using protocol::ExecutionResult;

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

ExecutionFailure protocol_failure(const std::string& message) {
    return ExecutionFailure{message, core::errors::wire_code(ErrorCategory::Protocol)};
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

}  // namespace

core::errors::Result<std::optional<std::string>> FdByteSource::read_some() {
    std::string chunk(kReadChunk, '\0');
    while (true) {
        const ssize_t n = ::read(fd_, chunk.data(), chunk.size());
        if (n > 0) {
            chunk.resize(static_cast<std::size_t>(n));
            return std::optional<std::string>(std::move(chunk));
        }
        if (n == 0) {
            return std::optional<std::string>();
        }
        if (errno != EINTR) {
            return WorkerError{ErrorCategory::Internal,
                               std::string("Failed to read input: ") + std::strerror(errno),
                               "input_read_failed"};
        }
    }
}

core::errors::Result<std::optional<std::string>> StreamByteSource::read_some() {
    std::string chunk(kReadChunk, '\0');
    in_.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto count = in_.gcount();
    if (in_.bad()) {
        return WorkerError{ErrorCategory::Internal, "Failed to read input stream",
                           "input_read_failed"};
    }
    if (count <= 0) {
        return std::optional<std::string>();
    }
    chunk.resize(static_cast<std::size_t>(count));
    return std::optional<std::string>(std::move(chunk));
}

core::errors::Result<std::optional<std::string>> RequestReader::next_line() {
    while (true) {
        const auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            return std::optional<std::string>(std::move(line));
        }
        if (eof_) {
            if (buffer_.empty()) {
                return std::optional<std::string>();
            }
            std::string line = std::move(buffer_);
            buffer_.clear();
            return std::optional<std::string>(std::move(line));
        }

        auto chunk = source_.read_some();
        if (core::errors::is_error(chunk)) {
            return core::errors::get_error(chunk);
        }
        const auto& data = core::errors::get_value(chunk);
        if (!data.has_value()) {
            eof_ = true;
        } else {
            buffer_ += data.value();
        }
    }
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(first, last - first + 1);
}

ParsedLine parse_request_line(const std::string& line) {
    ParsedLine parsed;
    const json document = json::parse(line, nullptr, false);
    if (document.is_discarded()) {
        parsed.request.code = line;
    } else if (document.is_object()) {
        const auto id = document.find("requestId");
        if (id != document.end() && id->is_string()) {
            parsed.request.request_id = id->get<std::string>();
        }
        const auto code = document.find("code");
        if (code != document.end() && !code->is_null()) {
            if (!code->is_string()) {
                parsed.failure = protocol_failure("Field 'code' must be a string");
                return parsed;
            }
            parsed.request.code = code->get<std::string>();
        }
    }

    if (trim(parsed.request.code).empty()) {
        parsed.failure = ExecutionFailure{kNoCodeMessage, ""};
    }
    return parsed;
}

core::errors::Result<bool> ResponseWriter::write(const ExecutionResult& result,
                                                 const std::optional<std::string>& request_id) {
    out_ << protocol::to_json(result, request_id).dump(-1, ' ', false,
                                                       json::error_handler_t::replace)
         << '\n';
    out_.flush();
    if (!out_) {
        return WorkerError{ErrorCategory::Internal, "Failed to write response",
                           "output_write_failed"};
    }
    return true;
}

WorkerLoop::WorkerLoop(ConnectionManager& connection, const policy::CodePolicyGuard& guard,
                       runtime::CodeSandbox& sandbox, ResponseWriter& writer,
                       LoopOptions options)
    : connection_(connection),
      guard_(guard),
      sandbox_(sandbox),
      writer_(writer),
      options_(options) {}

int WorkerLoop::run(RequestReader& reader) {
    LOG_INFO("Ready for code execution");
    while (true) {
        auto next = reader.next_line();
        if (core::errors::is_error(next)) {
            const auto& err = core::errors::get_error(next);
            LOG_ERROR("Input error [" + err.code + "]: " + err.message);
            write_fatal(err.message);
            connection_.close();
            return 1;
        }
        const auto& raw = core::errors::get_value(next);
        if (!raw.has_value()) {
            LOG_INFO("Input closed after " + std::to_string(processed_) +
                     " requests, closing connection");
            connection_.close();
            return 0;
        }

        const std::string line = trim(raw.value());
        if (line.empty() && options_.skip_blank_lines) {
            continue;
        }

        std::optional<std::string> request_id;
        ExecutionResult result;
        try {
            result = handle_line(line, request_id);
        } catch (const std::exception& e) {
            result = unexpected_failure(e);
        }
        ++processed_;

        auto written = writer_.write(result, request_id);
        if (core::errors::is_error(written)) {
            LOG_ERROR("Output error: " + core::errors::get_error(written).message);
            connection_.close();
            return 1;
        }
    }
}

ExecutionResult WorkerLoop::handle_line(const std::string& line,
                                        std::optional<std::string>& request_id) {
    if (line.empty()) {
        return protocol_failure("Empty request line");
    }
    ParsedLine parsed = parse_request_line(line);
    request_id = parsed.request.request_id;
    if (parsed.failure.has_value()) {
        return parsed.failure.value();
    }
    return process(parsed.request);
}

ExecutionResult WorkerLoop::process(const ExecutionRequest& request) {
    const auto outcome = guard_.validate(request.code);
    if (!outcome.warnings.empty()) {
        LOG_WARN("Code validation warnings: " + join(outcome.warnings, "; "));
    }
    if (!outcome.valid) {
        LOG_WARN("Code validation failed: " + join(outcome.errors, "; "));
        return ExecutionFailure{"Code validation failed: " + join(outcome.errors, "; "),
                                core::errors::wire_code(ErrorCategory::Validation),
                                json{{"validationErrors", outcome.errors}}};
    }

    auto ready = connection_.ensure_ready();
    if (core::errors::is_error(ready)) {
        const auto& err = core::errors::get_error(ready);
        return ExecutionFailure{sanitizer_.sanitize(err.message),
                                core::errors::wire_code(err.category),
                                json{{"state", to_string(connection_.state())}}};
    }

    return sandbox_.execute(request.code);
}

ExecutionResult WorkerLoop::process_guarded(const ExecutionRequest& request) {
    try {
        return process(request);
    } catch (const std::exception& e) {
        return unexpected_failure(e);
    }
}

ExecutionFailure WorkerLoop::unexpected_failure(const std::exception& e) const {
    LOG_ERROR(std::string("Unhandled error while processing request: ") + e.what());
    return ExecutionFailure{sanitizer_.sanitize(std::string("Pooled executor error: ") + e.what()),
                            kLoopErrorCode};
}

void WorkerLoop::write_fatal(const std::string& message) {
    const ExecutionResult fatal =
        ExecutionFailure{sanitizer_.sanitize("Fatal input error: " + message), kLoopErrorCode};
    auto written = writer_.write(fatal, std::nullopt);
    if (core::errors::is_error(written)) {
        LOG_ERROR("Output error: " + core::errors::get_error(written).message);
    }
}

}  // namespace toolbridge::session
