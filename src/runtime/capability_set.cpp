#include "runtime/capability_set.hpp"

#include "core/logging/logger.hpp"
#include "script/script_error.hpp"

namespace toolbridge::runtime {

using core::errors::ErrorCategory;
using nlohmann::json;
using script::Interpreter;
using script::ScriptError;
using script::Value;

namespace {

Value definitions_to_value(const std::vector<protocol::ToolDefinition>& tools) {
    json list = json::array();
    for (const auto& tool : tools) {
        list.push_back(protocol::to_json(tool));
    }
    return script::from_json(list);
}

std::string string_argument(Interpreter& interpreter, const std::vector<Value>& args,
                            const std::string& function, const std::string& what) {
    if (args.empty() || !args[0].is_string()) {
        interpreter.throw_error("TypeError", function + " expects " + what + " as a string");
    }
    return args[0].as_string();
}

}  // namespace

CapabilitySet::CapabilitySet(session::ConnectionManager& connection, tools::ToolCatalog catalog)
    : connection_(connection), catalog_(std::move(catalog)) {}

const std::vector<std::string>& CapabilitySet::names() {
    static const std::vector<std::string> kNames = {
        "callMCPTool", "listAvailableTools", "searchTools", "getToolInfo",
        "getToolsInCategory"};
    return kNames;
}

void CapabilitySet::install(Interpreter& interpreter) const {
    interpreter.define_global(
        "callMCPTool", Value::native("callMCPTool", [this](Interpreter& in, std::vector<Value>& args) {
            return call_tool(in, args);
        }));
    interpreter.define_global(
        "listAvailableTools",
        Value::native("listAvailableTools",
                      [this](Interpreter&, std::vector<Value>&) { return list_tools(); }));
    interpreter.define_global(
        "searchTools", Value::native("searchTools", [this](Interpreter& in, std::vector<Value>& args) {
            string_argument(in, args, "searchTools", "a keyword");
            return search_tools(args);
        }));
    interpreter.define_global(
        "getToolInfo", Value::native("getToolInfo", [this](Interpreter& in, std::vector<Value>& args) {
            string_argument(in, args, "getToolInfo", "a tool name");
            return tool_info(args);
        }));
    interpreter.define_global(
        "getToolsInCategory",
        Value::native("getToolsInCategory", [this](Interpreter& in, std::vector<Value>& args) {
            string_argument(in, args, "getToolsInCategory", "a category");
            return tools_in_category(args);
        }));
}

Value CapabilitySet::call_tool(Interpreter& interpreter, std::vector<Value>& args) const {
    const std::string name = string_argument(interpreter, args, "callMCPTool", "a tool name");
    json arguments = json::object();
    if (args.size() > 1 && !args[1].is_nullish()) {
        if (!args[1].is_object()) {
            interpreter.throw_error("TypeError", "callMCPTool arguments must be an object");
        }
        arguments = script::to_json(args[1]);
    }

    LOG_DEBUG("callMCPTool: " + name);
    interpreter.check_budget();
    const auto result = connection_.invoke(name, arguments);
    interpreter.check_budget();

    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        if (error.category == ErrorCategory::Connection) {
            throw ScriptError(interpreter.make_error(script::kConnectionErrorName, error.message),
                              ErrorCategory::Connection);
        }
        throw ScriptError(interpreter.make_error("Error", error.message));
    }
    return script::from_json(core::errors::get_value(result));
}

Value CapabilitySet::list_tools() const {
    return script::from_json(catalog_.summary());
}

Value CapabilitySet::search_tools(std::vector<Value>& args) const {
    return definitions_to_value(catalog_.search(args[0].as_string()));
}

Value CapabilitySet::tool_info(std::vector<Value>& args) const {
    const auto tool = catalog_.find(args[0].as_string());
    if (!tool.has_value()) {
        return Value();
    }
    return script::from_json(protocol::to_json(tool.value()));
}

Value CapabilitySet::tools_in_category(std::vector<Value>& args) const {
    return definitions_to_value(catalog_.in_category(args[0].as_string()));
}

}  // namespace toolbridge::runtime
