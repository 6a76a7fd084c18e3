#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include "app/cli_parser.hpp"
#include "core/config/worker_id.hpp"
#include "core/errors/worker_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/code_policy_guard.hpp"
#include "provider/stdio_tool_provider.hpp"
#include "runtime/code_sandbox.hpp"
#include "session/connection_manager.hpp"
#include "session/request_loop.hpp"
#include "tools/tool_catalog.hpp"

namespace {

using toolbridge::core::errors::get_error;
using toolbridge::core::errors::get_value;
using toolbridge::core::errors::is_error;

void report(const std::string& what, const toolbridge::core::errors::WorkerError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

int run_once(toolbridge::session::WorkerLoop& loop, toolbridge::session::ResponseWriter& writer) {
    const std::string code((std::istreambuf_iterator<char>(std::cin)),
                           std::istreambuf_iterator<char>());
    toolbridge::protocol::ExecutionRequest request;
    request.code = code;

    toolbridge::protocol::ExecutionResult result;
    if (toolbridge::session::trim(code).empty()) {
        result = toolbridge::protocol::ExecutionFailure{toolbridge::session::kNoCodeMessage, ""};
    } else {
        result = loop.process_guarded(request);
    }

    auto written = writer.write(result, std::nullopt);
    if (is_error(written)) {
        report("Failed to write response", get_error(written));
        return 1;
    }
    return toolbridge::protocol::is_failure(result) ? 1 : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Generate a Worker ID and register it with the Global Logger
    const std::string worker_id = toolbridge::core::config::generate_worker_id();
    toolbridge::core::logging::Logger::get().set_worker_id(worker_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = toolbridge::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        report("Input error", get_error(parsed));
        std::cerr << toolbridge::app::cli::usage();
        return 2;
    }
    const auto& config = get_value(parsed);
    if (config.show_help) {
        std::cerr << toolbridge::app::cli::usage();
        return 0;
    }
    toolbridge::core::logging::Logger::get().set_min_level(config.log_level);
    LOG_INFO("Pooled worker starting");

    // 3. Code policy
    toolbridge::policy::CodePolicyGuard guard;
    if (config.policy_file) {
        auto policy = toolbridge::policy::load_code_policy(config.policy_file.value());
        if (is_error(policy)) {
            report("Failed to load code policy", get_error(policy));
            return 2;
        }
        auto created = toolbridge::policy::CodePolicyGuard::create(get_value(policy));
        if (is_error(created)) {
            report("Invalid code policy", get_error(created));
            return 2;
        }
        guard = get_value(created);
        LOG_INFO("Loaded code policy with " + std::to_string(guard.policy().rules.size()) +
                 " rules from " + config.policy_file->string());
    }

    // 4. Tool catalog; without a file it follows the provider's listing
    std::optional<toolbridge::tools::ToolCatalog> catalog;
    if (config.catalog_file) {
        auto loaded = toolbridge::tools::ToolCatalog::load(config.catalog_file.value());
        if (is_error(loaded)) {
            report("Failed to load tool catalog", get_error(loaded));
            return 2;
        }
        catalog = get_value(loaded);
        LOG_INFO("Loaded " + std::to_string(catalog->size()) + " tool definitions");
    }

    // 5. Persistent connection; a failed first connect is retried per request
    auto provider = std::make_shared<toolbridge::provider::StdioToolProvider>(config.provider);
    toolbridge::session::ConnectionManager connection(provider);
    auto ready = connection.ensure_ready();
    if (is_error(ready)) {
        report("Initial connection failed, will retry on the next request", get_error(ready));
    }

    toolbridge::runtime::SandboxOptions options;
    options.settle = std::chrono::milliseconds(config.settle_ms);
    options.timeout = std::chrono::milliseconds(config.execution_timeout_ms);
    toolbridge::runtime::CodeSandbox sandbox(connection, options, catalog);

    toolbridge::session::ResponseWriter writer(std::cout);
    toolbridge::session::LoopOptions loop_options;
    loop_options.skip_blank_lines = config.skip_blank_lines;
    toolbridge::session::WorkerLoop loop(connection, guard, sandbox, writer, loop_options);

    if (config.single_shot) {
        const int code = run_once(loop, writer);
        connection.close();
        return code;
    }

    toolbridge::session::FdByteSource input(STDIN_FILENO);
    toolbridge::session::RequestReader reader(input);
    return loop.run(reader);
}
