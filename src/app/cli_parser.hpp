#pragma once
#include <functional>
#include <optional>
#include <string>
#include "core/config/worker_config.hpp"
#include "core/errors/worker_errors.hpp"

namespace toolbridge::app::cli {
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    // Reads the process environment.
    std::optional<std::string> process_env(const std::string& name);

    // Flags win over environment variables, which win over defaults.
    toolbridge::core::errors::Result<toolbridge::core::config::WorkerConfig> parse_and_validate(
        int argc, char* argv[], const EnvLookup& env = process_env);

    std::string usage();
}
