#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/worker_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolbridge::tools {

// Read-only list of tool definitions backing the discovery capabilities.
class ToolCatalog {
public:
    ToolCatalog() = default;
    explicit ToolCatalog(std::vector<protocol::ToolDefinition> tools);

    // Accepts either a top-level array of definitions or {"tools": [...]}.
    static core::errors::Result<ToolCatalog> load(const std::filesystem::path& path);
    static core::errors::Result<ToolCatalog> from_json(const nlohmann::json& document);

    // Builds definitions from a provider "tools/list" listing
    // ({name, description, inputSchema}).
    static ToolCatalog from_listing(const nlohmann::json& listing);

    bool empty() const { return tools_.empty(); }
    std::size_t size() const { return tools_.size(); }
    const std::vector<protocol::ToolDefinition>& tools() const { return tools_; }

    std::optional<protocol::ToolDefinition> find(const std::string& name) const;
    std::vector<protocol::ToolDefinition> search(const std::string& keyword) const;
    std::vector<protocol::ToolDefinition> in_category(const std::string& category) const;
    std::vector<std::string> categories() const;

    // {totalTools, categories, tools, byCategory, toolsByCategory}
    nlohmann::json summary() const;

private:
    std::vector<protocol::ToolDefinition> tools_;
};

}  // namespace toolbridge::tools
