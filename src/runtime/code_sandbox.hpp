#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include "core/errors/worker_errors.hpp"
#include "policy/error_sanitizer.hpp"
#include "protocol/execution_result.hpp"
#include "script/interpreter.hpp"
#include "session/connection_manager.hpp"
#include "tools/tool_catalog.hpp"

namespace toolbridge::runtime {

struct SandboxOptions {
    std::chrono::milliseconds settle{100};
    // Zero runs without a deadline.
    std::chrono::milliseconds timeout{60000};
    std::size_t max_call_depth = script::Interpreter::kDefaultMaxCallDepth;
};

// Runs one validated snippet against a ready connection. Each call gets a
// fresh interpreter; only the connection persists between executions.
class CodeSandbox {
public:
    // Without a fixed catalog the discovery capabilities describe the
    // provider's most recent tool listing.
    CodeSandbox(session::ConnectionManager& connection, SandboxOptions options,
                std::optional<tools::ToolCatalog> catalog = std::nullopt);

    protocol::ExecutionResult execute(const std::string& code);

    const SandboxOptions& options() const { return options_; }

private:
    protocol::ExecutionResult run(const std::string& code);
    protocol::ExecutionFailure failure(core::errors::ErrorCategory category,
                                       const std::string& message,
                                       const std::string& stack) const;
    tools::ToolCatalog current_catalog() const;

    session::ConnectionManager& connection_;
    SandboxOptions options_;
    std::optional<tools::ToolCatalog> catalog_;
    policy::ErrorSanitizer sanitizer_;
};

}  // namespace toolbridge::runtime
