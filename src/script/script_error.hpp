#pragma once

#include <stdexcept>
#include <string>
#include "core/errors/worker_errors.hpp"
#include "script/value.hpp"

namespace toolbridge::script {

// Error objects raised for lost tool connections carry this name so the
// category survives a catch-and-rethrow inside the snippet.
inline constexpr const char* kConnectionErrorName = "ConnectionError";

inline Value make_error_object(const std::string& name, const std::string& message) {
    Value error = Value::object();
    auto& props = error.as_object().properties;
    props["name"] = name;
    props["message"] = message;
    props["stack"] = name + ": " + message;
    return error;
}

// A value thrown by a snippet (or by the engine on its behalf) that was not
// caught before reaching the host. Message and stack are captured at throw
// time; the thrown value itself is emptied once its interpreter is destroyed.
class ScriptError : public std::runtime_error {
public:
    explicit ScriptError(Value thrown)
        : ScriptError(thrown, category_for(thrown)) {}

    ScriptError(Value thrown, core::errors::ErrorCategory category)
        : std::runtime_error(message_of(thrown)),
          stack_(stack_of(thrown)),
          thrown_(std::move(thrown)),
          category_(category) {}

    const Value& thrown() const { return thrown_; }
    core::errors::ErrorCategory category() const { return category_; }

    // Stack recorded on the error object, empty for thrown primitives.
    const std::string& stack() const { return stack_; }

    // Timeouts unwind through try/catch; everything else is catchable.
    bool catchable() const { return category_ != core::errors::ErrorCategory::Timeout; }

private:
    static std::string message_of(const Value& thrown) {
        if (thrown.is_object()) {
            const auto& props = thrown.as_object().properties;
            const auto it = props.find("message");
            if (it != props.end()) {
                return it->second.to_display_string();
            }
        }
        return thrown.to_display_string();
    }

    static std::string stack_of(const Value& thrown) {
        if (thrown.is_object()) {
            const auto& props = thrown.as_object().properties;
            const auto it = props.find("stack");
            if (it != props.end() && it->second.is_string()) {
                return it->second.as_string();
            }
        }
        return "";
    }

    static core::errors::ErrorCategory category_for(const Value& thrown) {
        if (thrown.is_object()) {
            const auto& props = thrown.as_object().properties;
            const auto it = props.find("name");
            if (it != props.end() && it->second.is_string() &&
                it->second.as_string() == kConnectionErrorName) {
                return core::errors::ErrorCategory::Connection;
            }
        }
        return core::errors::ErrorCategory::Execution;
    }

    std::string stack_;
    Value thrown_;
    core::errors::ErrorCategory category_;
};

}  // namespace toolbridge::script
