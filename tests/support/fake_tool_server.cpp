// Minimal line-delimited JSON-RPC tool server used by the stdio provider
// tests. Tools:
//   echo      returns its arguments as JSON text
//   greet     returns plain text
//   fail      reports isError
//   rpc_fail  answers with a JSON-RPC error
//   chatty    sends a notification and a stale response before the answer
//   crash     exits without answering
//   hang      never answers
// With --fail-init the server exits as soon as it reads the handshake.
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

void send(const json& message) {
    std::cout << message.dump() << '\n' << std::flush;
}

json text_content(const std::string& text, bool is_error = false) {
    json result = {{"content", json::array({json{{"type", "text"}, {"text", text}}})}};
    if (is_error) {
        result["isError"] = true;
    }
    return result;
}

json tool_list(const std::string& cursor) {
    if (cursor.empty()) {
        return {{"tools",
                 json::array({json{{"name", "echo"}, {"description", "Echo arguments"}},
                              json{{"name", "greet"}, {"description", "Say hello"}}})},
                {"nextCursor", "page-2"}};
    }
    return {{"tools", json::array({json{{"name", "fail"}, {"description", "Always fails"}}})}};
}

}  // namespace

int main(int argc, char** argv) {
    const bool fail_init = argc > 1 && std::string(argv[1]) == "--fail-init";

    std::string line;
    while (std::getline(std::cin, line)) {
        const json message = json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object() || !message.contains("id")) {
            continue;
        }
        const json id = message["id"];
        const std::string method = message.value("method", "");
        const json params = message.value("params", json::object());

        if (method == "initialize") {
            if (fail_init) {
                return 3;
            }
            send({{"jsonrpc", "2.0"},
                  {"id", id},
                  {"result",
                   {{"protocolVersion", params.value("protocolVersion", "")},
                    {"serverInfo", {{"name", "fake-tool-server"}, {"version", "0.1"}}},
                    {"capabilities", {{"tools", json::object()}}}}}});
            continue;
        }
        if (method == "tools/list") {
            send({{"jsonrpc", "2.0"}, {"id", id}, {"result", tool_list(params.value("cursor", ""))}});
            continue;
        }
        if (method != "tools/call") {
            send({{"jsonrpc", "2.0"},
                  {"id", id},
                  {"error", {{"code", -32601}, {"message", "Method not found"}}}});
            continue;
        }

        const std::string name = params.value("name", "");
        const json arguments = params.value("arguments", json::object());
        if (name == "echo") {
            send({{"jsonrpc", "2.0"}, {"id", id}, {"result", text_content(arguments.dump())}});
        } else if (name == "greet") {
            send({{"jsonrpc", "2.0"}, {"id", id}, {"result", text_content("hello there")}});
        } else if (name == "fail") {
            send({{"jsonrpc", "2.0"}, {"id", id}, {"result", text_content("repository archived", true)}});
        } else if (name == "rpc_fail") {
            send({{"jsonrpc", "2.0"},
                  {"id", id},
                  {"error", {{"code", -32602}, {"message", "Invalid params"}}}});
        } else if (name == "chatty") {
            send({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}, {"params", {{"progress", 1}}}});
            send({{"jsonrpc", "2.0"}, {"id", -1}, {"result", text_content("stale")}});
            std::cout << "not json at all\n" << std::flush;
            send({{"jsonrpc", "2.0"}, {"id", id}, {"result", text_content("[1,2,3]")}});
        } else if (name == "crash") {
            return 1;
        } else if (name == "hang") {
            std::this_thread::sleep_for(std::chrono::seconds(30));
        } else {
            send({{"jsonrpc", "2.0"},
                  {"id", id},
                  {"result", text_content("Unknown tool: " + name, true)}});
        }
    }
    return 0;
}
