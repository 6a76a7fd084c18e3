#pragma once

#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace toolbridge::protocol {

struct ExecutionSuccess {
    nlohmann::json data;
};

struct ExecutionFailure {
    std::string message;
    std::string code;           // VALIDATION_ERROR, EXECUTION_ERROR, ...
    nlohmann::json details = nullptr;
};

// Exactly one of these is produced per request.
using ExecutionResult = std::variant<ExecutionSuccess, ExecutionFailure>;

inline bool is_failure(const ExecutionResult& result) {
    return std::holds_alternative<ExecutionFailure>(result);
}

// Wire shape: {"error":bool, "data"?, "message"?, "code"?, "details"?, "requestId"?}
inline nlohmann::json to_json(const ExecutionResult& result,
                              const std::optional<std::string>& request_id) {
    nlohmann::json payload;
    if (const auto* success = std::get_if<ExecutionSuccess>(&result)) {
        payload["error"] = false;
        payload["data"] = success->data;
    } else {
        const auto& failure = std::get<ExecutionFailure>(result);
        payload["error"] = true;
        payload["message"] = failure.message;
        if (!failure.code.empty()) {
            payload["code"] = failure.code;
        }
        if (!failure.details.is_null()) {
            payload["details"] = failure.details;
        }
    }
    if (request_id.has_value()) {
        payload["requestId"] = request_id.value();
    }
    return payload;
}

}  // namespace toolbridge::protocol
