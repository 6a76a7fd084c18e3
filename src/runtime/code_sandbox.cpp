#include "runtime/code_sandbox.hpp"

#include <exception>
#include "core/logging/logger.hpp"
#include "runtime/capability_set.hpp"
#include "script/script_error.hpp"

namespace toolbridge::runtime {

using core::errors::ErrorCategory;
using protocol::ExecutionFailure;
using protocol::ExecutionResult;
using protocol::ExecutionSuccess;

CodeSandbox::CodeSandbox(session::ConnectionManager& connection, SandboxOptions options,
                         std::optional<tools::ToolCatalog> catalog)
    : connection_(connection), options_(options), catalog_(std::move(catalog)) {}

ExecutionResult CodeSandbox::execute(const std::string& code) {
    const auto lease = connection_.acquire_lease();
    const auto started = std::chrono::steady_clock::now();

    ExecutionResult result = run(code);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    LOG_DEBUG("Execution finished in " + std::to_string(elapsed.count()) + " ms (" +
              (protocol::is_failure(result) ? "failed" : "ok") + ")");

    // Settle on both paths so late provider output never lands in the
    // next request.
    connection_.settle(options_.settle);
    return result;
}

ExecutionResult CodeSandbox::run(const std::string& code) {
    // Declared before the interpreter, whose natives refer back to it.
    const CapabilitySet capabilities(connection_, current_catalog());

    script::Interpreter interpreter;
    interpreter.set_max_call_depth(options_.max_call_depth);
    if (options_.timeout.count() > 0) {
        interpreter.set_timeout(options_.timeout);
    }
    capabilities.install(interpreter);

    try {
        const script::Value value = interpreter.run(code);
        return ExecutionSuccess{script::to_json(value)};
    } catch (const script::ScriptError& e) {
        if (e.category() == ErrorCategory::Connection) {
            connection_.mark_degraded(e.what());
        }
        return failure(e.category(), e.what(), e.stack());
    } catch (const std::exception& e) {
        return failure(ErrorCategory::Execution, e.what(), "");
    }
}

ExecutionFailure CodeSandbox::failure(const ErrorCategory category, const std::string& message,
                                      const std::string& stack) const {
    ExecutionFailure out;
    out.message = sanitizer_.sanitize(message);
    out.code = core::errors::wire_code(category == ErrorCategory::Connection ||
                                               category == ErrorCategory::Timeout
                                           ? category
                                           : ErrorCategory::Execution);
    if (!stack.empty()) {
        out.details = nlohmann::json{{"stack", sanitizer_.sanitize(stack)}};
    }
    LOG_WARN("Execution failed [" + out.code + "]: " + out.message);
    return out;
}

tools::ToolCatalog CodeSandbox::current_catalog() const {
    if (catalog_.has_value()) {
        return catalog_.value();
    }
    return tools::ToolCatalog::from_listing(connection_.last_listing());
}

}  // namespace toolbridge::runtime
