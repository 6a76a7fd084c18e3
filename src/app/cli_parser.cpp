#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <vector>

namespace toolbridge::app::cli {

    using namespace toolbridge::core::errors;
    using toolbridge::core::config::WorkerConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> provider_cmd;
        std::vector<std::string> provider_args;
        std::optional<std::string> settle_ms;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> rpc_timeout_ms;
        std::optional<std::string> policy_file;
        std::optional<std::string> catalog_file;
        std::optional<std::string> log_level;
        bool skip_blank_lines = false;
        bool no_wrap_params = false;
        bool once = false;
        bool help = false;
    };

    namespace {

        std::vector<std::string> split_words(const std::string& text) {
            std::istringstream in(text);
            std::vector<std::string> words;
            std::string word;
            while (in >> word) {
                words.push_back(word);
            }
            return words;
        }

        // Exception-free integer parsing with an inclusive upper bound
        Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                            const std::uint32_t max_value) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return WorkerError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer",
                                   "Provide a non-negative integer."};
            }
            if (value > max_value) {
                return WorkerError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                   "Must be at most " + std::to_string(max_value) + "."};
            }
            return value;
        }

        Result<std::filesystem::path> existing_file(const std::string& flag, const std::string& text) {
            std::filesystem::path p(text);
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return WorkerError{ErrorCategory::Input, flag + " does not name a readable file: " + text,
                                   "invalid_path"};
            }
            return p;
        }

    } // namespace

    std::optional<std::string> process_env(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::string usage() {
        return "Usage: toolbridge_worker [options]\n"
               "  --provider-cmd <cmd>      Tool server command (default: python)\n"
               "  --provider-arg <arg>      Tool server argument, repeatable (default: github_mcp.py)\n"
               "  --settle-ms <n>           Pause after each execution (default: 100)\n"
               "  --timeout-ms <n>          Execution deadline, 0 disables (default: 60000)\n"
               "  --rpc-timeout-ms <n>      Tool server response timeout (default: 60000)\n"
               "  --policy-file <path>      JSON code policy replacing the built-in rules\n"
               "  --catalog-file <path>     JSON tool catalog for the discovery functions\n"
               "  --log-level <level>       debug, info, warn or error (default: info)\n"
               "  --skip-blank-lines        Ignore empty input lines instead of answering them\n"
               "  --no-wrap-params          Pass tool arguments without a \"params\" wrapper\n"
               "  --once                    Run all of stdin as one snippet, then exit\n"
               "  --help                    Show this message\n";
    }

    Result<WorkerConfig> parse_and_validate(int argc, char* argv[], const EnvLookup& env) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto take_value = [&args](std::size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            bool ok = true;
            if (flag == "--provider-cmd") {
                ok = take_value(i, raw.provider_cmd);
            } else if (flag == "--provider-arg") {
                std::optional<std::string> value;
                ok = take_value(i, value);
                if (ok) raw.provider_args.push_back(value.value());
            } else if (flag == "--settle-ms") {
                ok = take_value(i, raw.settle_ms);
            } else if (flag == "--timeout-ms") {
                ok = take_value(i, raw.timeout_ms);
            } else if (flag == "--rpc-timeout-ms") {
                ok = take_value(i, raw.rpc_timeout_ms);
            } else if (flag == "--policy-file") {
                ok = take_value(i, raw.policy_file);
            } else if (flag == "--catalog-file") {
                ok = take_value(i, raw.catalog_file);
            } else if (flag == "--log-level") {
                ok = take_value(i, raw.log_level);
            } else if (flag == "--skip-blank-lines") {
                raw.skip_blank_lines = true;
            } else if (flag == "--no-wrap-params") {
                raw.no_wrap_params = true;
            } else if (flag == "--once") {
                raw.once = true;
            } else if (flag == "--help" || flag == "-h") {
                raw.help = true;
            } else {
                return WorkerError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument",
                                   "Run with --help to list the supported flags."};
            }
            if (!ok) {
                return WorkerError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        WorkerConfig config;
        config.show_help = raw.help;
        config.skip_blank_lines = raw.skip_blank_lines;
        config.single_shot = raw.once;
        config.provider.wrap_params = !raw.no_wrap_params;

        if (!raw.provider_cmd) raw.provider_cmd = env("MCP_PYTHON_COMMAND");
        if (raw.provider_cmd) {
            if (raw.provider_cmd->empty()) {
                return WorkerError{ErrorCategory::Input, "Provider command must not be empty", "invalid_command"};
            }
            config.provider.command = raw.provider_cmd.value();
        }

        if (!raw.provider_args.empty()) {
            config.provider.args = raw.provider_args;
        } else if (const auto env_args = env("MCP_PYTHON_ARGS")) {
            config.provider.args = split_words(env_args.value());
        }

        if (raw.settle_ms) {
            auto parsed = parse_bounded("--settle-ms", raw.settle_ms.value(), 10000);
            if (is_error(parsed)) return get_error(parsed);
            config.settle_ms = get_value(parsed);
        }
        if (raw.timeout_ms) {
            auto parsed = parse_bounded("--timeout-ms", raw.timeout_ms.value(), 3600000);
            if (is_error(parsed)) return get_error(parsed);
            config.execution_timeout_ms = get_value(parsed);
        }
        if (raw.rpc_timeout_ms) {
            auto parsed = parse_bounded("--rpc-timeout-ms", raw.rpc_timeout_ms.value(), 3600000);
            if (is_error(parsed)) return get_error(parsed);
            if (get_value(parsed) == 0) {
                return WorkerError{ErrorCategory::Input, "--rpc-timeout-ms out of bounds", "bounds_error",
                                   "Must be at least 1."};
            }
            config.provider.rpc_timeout_ms = get_value(parsed);
        }

        if (!raw.log_level) raw.log_level = env("TOOLBRIDGE_LOG_LEVEL");
        if (raw.log_level) {
            const auto level = core::logging::parse_level(raw.log_level.value());
            if (!level) {
                return WorkerError{ErrorCategory::Input, "Unknown log level: " + raw.log_level.value(),
                                   "invalid_log_level", "Use debug, info, warn or error."};
            }
            config.log_level = level.value();
        }

        // Path validation
        if (!raw.policy_file) raw.policy_file = env("TOOLBRIDGE_POLICY");
        if (raw.policy_file) {
            auto path = existing_file("--policy-file", raw.policy_file.value());
            if (is_error(path)) return get_error(path);
            config.policy_file = get_value(path);
        }
        if (!raw.catalog_file) raw.catalog_file = env("TOOLBRIDGE_CATALOG");
        if (raw.catalog_file) {
            auto path = existing_file("--catalog-file", raw.catalog_file.value());
            if (is_error(path)) return get_error(path);
            config.catalog_file = get_value(path);
        }

        return config;
    }

} // namespace toolbridge::app::cli
