#pragma once

#include <memory>
#include <string>
#include <vector>
#include "script/interpreter.hpp"
#include "session/connection_manager.hpp"
#include "tools/tool_catalog.hpp"

namespace toolbridge::runtime {

// The named host functions a snippet can reach. Nothing else outside the
// interpreter is exposed.
class CapabilitySet {
public:
    CapabilitySet(session::ConnectionManager& connection, tools::ToolCatalog catalog);

    // Must outlive the interpreter it is installed into.
    void install(script::Interpreter& interpreter) const;

    static const std::vector<std::string>& names();

private:
    script::Value call_tool(script::Interpreter& interpreter,
                            std::vector<script::Value>& args) const;
    script::Value list_tools() const;
    script::Value search_tools(std::vector<script::Value>& args) const;
    script::Value tool_info(std::vector<script::Value>& args) const;
    script::Value tools_in_category(std::vector<script::Value>& args) const;

    session::ConnectionManager& connection_;
    tools::ToolCatalog catalog_;
};

}  // namespace toolbridge::runtime
