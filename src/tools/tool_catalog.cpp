#include "tools/tool_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <set>
#include <utility>

namespace toolbridge::tools {

using core::errors::ErrorCategory;
using core::errors::WorkerError;
using nlohmann::json;
using protocol::ToolDefinition;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string string_field(const json& item, const char* key) {
    if (item.contains(key) && item[key].is_string()) {
        return item[key].get<std::string>();
    }
    return "";
}

}  // namespace

ToolCatalog::ToolCatalog(std::vector<ToolDefinition> tools) : tools_(std::move(tools)) {}

core::errors::Result<ToolCatalog> ToolCatalog::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return WorkerError{ErrorCategory::Input,
                           "Unable to open tool catalog: " + path.string(),
                           "catalog_file_unreadable"};
    }
    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return WorkerError{ErrorCategory::Input,
                           "Tool catalog is not valid JSON: " + path.string(),
                           "invalid_catalog"};
    }
    return from_json(document);
}

core::errors::Result<ToolCatalog> ToolCatalog::from_json(const json& document) {
    const json* items = &document;
    if (document.is_object() && document.contains("tools")) {
        items = &document["tools"];
    }
    if (!items->is_array()) {
        return WorkerError{ErrorCategory::Input,
                           "Tool catalog must be an array of tool definitions.",
                           "invalid_catalog"};
    }

    std::vector<ToolDefinition> tools;
    std::set<std::string> seen;
    for (const auto& item : *items) {
        const std::string name = item.is_object() ? string_field(item, "name") : "";
        if (name.empty()) {
            return WorkerError{ErrorCategory::Input,
                               "Every catalog entry needs a string 'name'.",
                               "invalid_catalog"};
        }
        if (!seen.insert(name).second) {
            return WorkerError{ErrorCategory::Input,
                               "Duplicate tool in catalog: " + name,
                               "invalid_catalog"};
        }

        ToolDefinition tool;
        tool.name = name;
        const std::string category = string_field(item, "category");
        if (!category.empty()) {
            tool.category = category;
        }
        tool.description = string_field(item, "description");
        if (item.contains("parameters") && item["parameters"].is_object()) {
            tool.parameters = item["parameters"];
        }
        tool.returns = string_field(item, "returns");
        tool.example = string_field(item, "example");
        tools.push_back(std::move(tool));
    }
    return ToolCatalog(std::move(tools));
}

ToolCatalog ToolCatalog::from_listing(const json& listing) {
    const json* items = &listing;
    if (listing.is_object() && listing.contains("tools")) {
        items = &listing["tools"];
    }

    std::vector<ToolDefinition> tools;
    if (!items->is_array()) {
        return ToolCatalog(std::move(tools));
    }
    for (const auto& item : *items) {
        if (!item.is_object()) {
            continue;
        }
        ToolDefinition tool;
        tool.name = string_field(item, "name");
        if (tool.name.empty()) {
            continue;
        }
        tool.description = string_field(item, "description");
        if (item.contains("inputSchema") && item["inputSchema"].is_object()) {
            const auto& schema = item["inputSchema"];
            if (schema.contains("properties") && schema["properties"].is_object()) {
                tool.parameters = schema["properties"];
            }
        }
        tools.push_back(std::move(tool));
    }
    return ToolCatalog(std::move(tools));
}

std::optional<ToolDefinition> ToolCatalog::find(const std::string& name) const {
    const auto it = std::find_if(tools_.begin(), tools_.end(),
                                 [&name](const ToolDefinition& tool) {
                                     return tool.name == name;
                                 });
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<ToolDefinition> ToolCatalog::search(const std::string& keyword) const {
    const std::string needle = lowercase(keyword);
    std::vector<ToolDefinition> matches;
    for (const auto& tool : tools_) {
        if (lowercase(tool.name).find(needle) != std::string::npos ||
            lowercase(tool.description).find(needle) != std::string::npos ||
            lowercase(tool.category).find(needle) != std::string::npos) {
            matches.push_back(tool);
        }
    }
    return matches;
}

std::vector<ToolDefinition> ToolCatalog::in_category(const std::string& category) const {
    std::vector<ToolDefinition> matches;
    std::copy_if(tools_.begin(), tools_.end(), std::back_inserter(matches),
                 [&category](const ToolDefinition& tool) {
                     return tool.category == category;
                 });
    return matches;
}

std::vector<std::string> ToolCatalog::categories() const {
    std::set<std::string> unique;
    for (const auto& tool : tools_) {
        unique.insert(tool.category);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

json ToolCatalog::summary() const {
    json by_category = json::object();
    for (const auto& tool : tools_) {
        by_category[tool.category].push_back(protocol::to_json(tool));
    }

    json payload;
    payload["totalTools"] = tools_.size();
    payload["categories"] = categories();
    payload["tools"] = by_category;
    payload["byCategory"] = by_category;
    payload["toolsByCategory"] = by_category;
    return payload;
}

}  // namespace toolbridge::tools
