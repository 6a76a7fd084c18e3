#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace toolbridge::core::errors {

    // 1. Typed error categories, one per failure kind on the wire
    enum class ErrorCategory {
        Validation, // Snippet rejected by the code policy
        Connection, // Tool provider unreachable, dead pipe, RPC timeout
        Execution,  // Snippet threw, or a tool reported a failure
        Protocol,   // Malformed or empty request line
        Timeout,    // Execution deadline exceeded
        Input,      // Bad CLI flag or config file
        Internal    // C++ logic bug or I/O failure inside the worker
    };

    // The standardized error payload
    struct WorkerError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";             // Helpful tips for the operator
            nlohmann::json details = nullptr; // Structured extras (stack, rule ids)
        };

    // 2. Propagation strategy: a Result holds either T or a WorkerError.
    template <typename T>
    using Result = std::variant<T, WorkerError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<WorkerError>(result);
    }

    template <typename T>
    const WorkerError& get_error(const Result<T>& result) {
        return std::get<WorkerError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Wire code written in the "code" field of a failure response.
    inline std::string wire_code(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Validation: return "VALIDATION_ERROR";
            case ErrorCategory::Connection: return "CONNECTION_ERROR";
            case ErrorCategory::Execution:  return "EXECUTION_ERROR";
            case ErrorCategory::Protocol:   return "PROTOCOL_ERROR";
            case ErrorCategory::Timeout:    return "TIMEOUT_ERROR";
            case ErrorCategory::Input:      return "INPUT_ERROR";
            case ErrorCategory::Internal:   return "INTERNAL_ERROR";
            default: return "INTERNAL_ERROR";
        }
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::Connection: return "connection";
            case ErrorCategory::Execution:  return "execution";
            case ErrorCategory::Protocol:   return "protocol";
            case ErrorCategory::Timeout:    return "timeout";
            case ErrorCategory::Input:      return "input";
            case ErrorCategory::Internal:   return "internal";
            default: return "unknown";
        }
    }

} // namespace toolbridge::core::errors
