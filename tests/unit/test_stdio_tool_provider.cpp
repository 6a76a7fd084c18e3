#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/worker_config.hpp"
#include "core/errors/worker_errors.hpp"
#include "provider/stdio_tool_provider.hpp"

#ifndef TOOLBRIDGE_FAKE_TOOL_SERVER
#error "TOOLBRIDGE_FAKE_TOOL_SERVER must point at the fake tool server binary"
#endif

namespace {

using nlohmann::json;
using toolbridge::core::config::ProviderConfig;
using toolbridge::core::errors::ErrorCategory;
using toolbridge::core::errors::get_error;
using toolbridge::core::errors::get_value;
using toolbridge::core::errors::is_error;
using toolbridge::provider::StdioToolProvider;

ProviderConfig fake_server(bool wrap_params = false) {
    ProviderConfig config;
    config.command = TOOLBRIDGE_FAKE_TOOL_SERVER;
    config.args = {};
    config.rpc_timeout_ms = 2000;
    config.wrap_params = wrap_params;
    return config;
}

TEST(StdioToolProviderTest, HandshakeReportsServerInfo) {
    StdioToolProvider provider(fake_server());
    auto connected = provider.connect();
    ASSERT_FALSE(is_error(connected));
    EXPECT_EQ(get_value(connected)["serverInfo"]["name"], "fake-tool-server");
    EXPECT_TRUE(provider.is_connected());
    EXPECT_GT(provider.child_pid(), 0);
}

TEST(StdioToolProviderTest, ListingFollowsCursorPages) {
    StdioToolProvider provider(fake_server());
    ASSERT_FALSE(is_error(provider.connect()));
    auto listed = provider.list_capabilities();
    ASSERT_FALSE(is_error(listed));
    const json& tools = get_value(listed);
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[2]["name"], "fail");
}

TEST(StdioToolProviderTest, JsonTextContentIsParsed) {
    StdioToolProvider provider(fake_server());
    ASSERT_FALSE(is_error(provider.connect()));
    auto result = provider.invoke("echo", {{"owner", "octocat"}, {"count", 2}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), json({{"owner", "octocat"}, {"count", 2}}));
}

TEST(StdioToolProviderTest, WrapsArgumentsInParamsWhenConfigured) {
    StdioToolProvider provider(fake_server(true));
    ASSERT_FALSE(is_error(provider.connect()));
    auto result = provider.invoke("echo", {{"owner", "octocat"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), json({{"params", {{"owner", "octocat"}}}}));

    auto empty = provider.invoke("echo", json::object());
    ASSERT_FALSE(is_error(empty));
    EXPECT_EQ(get_value(empty), json::object());
}

TEST(StdioToolProviderTest, PlainTextContentStaysString) {
    StdioToolProvider provider(fake_server());
    ASSERT_FALSE(is_error(provider.connect()));
    auto result = provider.invoke("greet", json::object());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), json("hello there"));
}

TEST(StdioToolProviderTest, ToolErrorsAreExecutionErrors) {
    StdioToolProvider provider(fake_server());
    ASSERT_FALSE(is_error(provider.connect()));

    auto flagged = provider.invoke("fail", json::object());
    ASSERT_TRUE(is_error(flagged));
    EXPECT_EQ(get_error(flagged).category, ErrorCategory::Execution);
    EXPECT_EQ(get_error(flagged).message, "repository archived");

    auto rpc = provider.invoke("rpc_fail", json::object());
    ASSERT_TRUE(is_error(rpc));
    EXPECT_EQ(get_error(rpc).category, ErrorCategory::Execution);
    EXPECT_EQ(get_error(rpc).message, "Invalid params");
    EXPECT_TRUE(provider.is_connected());
}

TEST(StdioToolProviderTest, SkipsNotificationsStaleIdsAndNoise) {
    StdioToolProvider provider(fake_server());
    ASSERT_FALSE(is_error(provider.connect()));
    auto result = provider.invoke("chatty", json::object());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), json::array({1, 2, 3}));
}

TEST(StdioToolProviderTest, CrashedServerIsConnectionError) {
    StdioToolProvider provider(fake_server());
    ASSERT_FALSE(is_error(provider.connect()));
    auto result = provider.invoke("crash", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Connection);
    EXPECT_FALSE(provider.is_connected());

    ASSERT_FALSE(is_error(provider.connect()));
    auto after = provider.invoke("greet", json::object());
    ASSERT_FALSE(is_error(after));
}

TEST(StdioToolProviderTest, UnansweredRequestTimesOut) {
    ProviderConfig config = fake_server();
    config.rpc_timeout_ms = 100;
    StdioToolProvider provider(config);
    ASSERT_FALSE(is_error(provider.connect()));
    auto result = provider.invoke("hang", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "rpc_timeout");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Connection);
}

TEST(StdioToolProviderTest, FailedHandshakeIsConnectionError) {
    ProviderConfig config = fake_server();
    config.args = {"--fail-init"};
    StdioToolProvider provider(config);
    auto connected = provider.connect();
    ASSERT_TRUE(is_error(connected));
    EXPECT_EQ(get_error(connected).category, ErrorCategory::Connection);
    EXPECT_FALSE(provider.is_connected());
}

TEST(StdioToolProviderTest, MissingExecutableFailsToConnect) {
    ProviderConfig config = fake_server();
    config.command = "/nonexistent/toolbridge-provider";
    StdioToolProvider provider(config);
    auto connected = provider.connect();
    ASSERT_TRUE(is_error(connected));
    EXPECT_EQ(get_error(connected).category, ErrorCategory::Connection);
}

TEST(StdioToolProviderTest, CloseIsIdempotentAndDisconnects) {
    StdioToolProvider provider(fake_server());
    ASSERT_FALSE(is_error(provider.connect()));
    ASSERT_FALSE(is_error(provider.close()));
    ASSERT_FALSE(is_error(provider.close()));
    EXPECT_FALSE(provider.is_connected());

    auto result = provider.invoke("greet", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Connection);
}

TEST(StdioToolProviderTest, SettleWaitsQuietlyOnIdleConnection) {
    StdioToolProvider provider(fake_server());
    ASSERT_FALSE(is_error(provider.connect()));
    const auto started = std::chrono::steady_clock::now();
    provider.settle(std::chrono::milliseconds(30));
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(30));
    EXPECT_TRUE(provider.is_connected());
}

}  // namespace
