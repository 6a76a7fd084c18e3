#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace toolbridge::protocol {

    // Static description of one remote operation, as shown to snippets by
    // the discovery capabilities.
    struct ToolDefinition {
        std::string name;
        std::string category = "Other";
        std::string description;
        nlohmann::json parameters = nlohmann::json::object();
        std::string returns;
        std::string example;
    };

    inline nlohmann::json to_json(const ToolDefinition& tool) {
        nlohmann::json payload;
        payload["name"] = tool.name;
        payload["category"] = tool.category;
        payload["description"] = tool.description;
        payload["parameters"] = tool.parameters;
        payload["returns"] = tool.returns;
        payload["example"] = tool.example;
        return payload;
    }

} // namespace toolbridge::protocol
