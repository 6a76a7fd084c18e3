#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolbridge::core::config {

    // How the worker reaches the tool server it proxies to.
    struct ProviderConfig {
        std::string command = "python";
        std::vector<std::string> args = {"github_mcp.py"};
        std::uint32_t rpc_timeout_ms = 60000;
        // FastMCP tools take a single "params" argument.
        bool wrap_params = true;
    };

    // Validated worker settings, built from CLI flags and environment.
    struct WorkerConfig {
        ProviderConfig provider;
        std::optional<std::filesystem::path> policy_file;
        std::optional<std::filesystem::path> catalog_file;
        std::uint32_t settle_ms = 100;
        std::uint32_t execution_timeout_ms = 60000; // 0 disables the deadline
        logging::LogLevel log_level = logging::LogLevel::INFO;
        bool skip_blank_lines = false;
        bool single_shot = false;
        bool show_help = false;
    };

} // namespace toolbridge::core::config
