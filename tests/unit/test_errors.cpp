#include <gtest/gtest.h>
#include "core/errors/worker_errors.hpp"

using namespace toolbridge::core::errors;

// A dummy function to simulate a tool call failing
Result<std::string> simulate_tool_call(bool should_fail) {
    if (should_fail) {
        return WorkerError{ErrorCategory::Connection, "Connection lost"};
    }
    return std::string("tool output");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_tool_call(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "tool output");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_tool_call(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Connection);
    EXPECT_EQ(error.message, "Connection lost");
    EXPECT_EQ(error.code, "unknown_error");
    EXPECT_TRUE(error.details.is_null());
}

TEST(ErrorModelTest, MapsCategoriesToWireCodes) {
    EXPECT_EQ(wire_code(ErrorCategory::Validation), "VALIDATION_ERROR");
    EXPECT_EQ(wire_code(ErrorCategory::Connection), "CONNECTION_ERROR");
    EXPECT_EQ(wire_code(ErrorCategory::Execution), "EXECUTION_ERROR");
    EXPECT_EQ(wire_code(ErrorCategory::Protocol), "PROTOCOL_ERROR");
    EXPECT_EQ(wire_code(ErrorCategory::Timeout), "TIMEOUT_ERROR");
    EXPECT_EQ(to_string(ErrorCategory::Timeout), "timeout");
}
