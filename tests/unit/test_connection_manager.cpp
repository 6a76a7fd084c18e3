#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/worker_errors.hpp"
#include "session/connection_manager.hpp"
#include "support/stub_tool_provider.hpp"

namespace {

using nlohmann::json;
using toolbridge::core::errors::ErrorCategory;
using toolbridge::core::errors::get_error;
using toolbridge::core::errors::get_value;
using toolbridge::core::errors::is_error;
using toolbridge::session::ConnectionManager;
using toolbridge::session::ConnectionState;
using toolbridge::testing::StubToolProvider;

TEST(ConnectionManagerTest, StartsUninitializedAndConnectsOnDemand) {
    auto stub = std::make_shared<StubToolProvider>();
    ConnectionManager manager(stub);
    EXPECT_EQ(manager.state(), ConnectionState::Uninitialized);

    auto ready = manager.ensure_ready();
    ASSERT_FALSE(is_error(ready));
    EXPECT_EQ(get_value(ready), ConnectionState::Ready);
    EXPECT_EQ(stub->connect_calls, 1u);
    EXPECT_EQ(manager.last_listing().size(), 2u);
}

TEST(ConnectionManagerTest, EnsureReadyIsIdempotentWhenHealthy) {
    auto stub = std::make_shared<StubToolProvider>();
    ConnectionManager manager(stub);
    ASSERT_FALSE(is_error(manager.ensure_ready()));
    ASSERT_FALSE(is_error(manager.ensure_ready()));
    ASSERT_FALSE(is_error(manager.ensure_ready()));

    EXPECT_EQ(stub->connect_calls, 1u);
    EXPECT_EQ(manager.reconnect_count(), 0u);
}

TEST(ConnectionManagerTest, FailedConnectLeavesDegradedWithConnectionError) {
    auto stub = std::make_shared<StubToolProvider>();
    stub->connect_failures = 1;
    ConnectionManager manager(stub);

    auto ready = manager.ensure_ready();
    ASSERT_TRUE(is_error(ready));
    EXPECT_EQ(get_error(ready).category, ErrorCategory::Connection);
    EXPECT_EQ(manager.state(), ConnectionState::Degraded);

    auto retried = manager.ensure_ready();
    ASSERT_FALSE(is_error(retried));
    EXPECT_EQ(manager.state(), ConnectionState::Ready);
    EXPECT_EQ(manager.reconnect_count(), 1u);
}

TEST(ConnectionManagerTest, RecoversAfterConsecutiveFailures) {
    auto stub = std::make_shared<StubToolProvider>();
    stub->connect_failures = 3;
    ConnectionManager manager(stub);

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(is_error(manager.ensure_ready()));
        EXPECT_EQ(manager.state(), ConnectionState::Degraded);
    }
    ASSERT_FALSE(is_error(manager.ensure_ready()));
    EXPECT_EQ(manager.state(), ConnectionState::Ready);
    EXPECT_EQ(stub->connect_calls, 4u);
}

TEST(ConnectionManagerTest, UnhealthyConnectionIsReplacedOnNextEnsureReady) {
    auto stub = std::make_shared<StubToolProvider>();
    ConnectionManager manager(stub);
    ASSERT_FALSE(is_error(manager.ensure_ready()));

    stub->connected = false;
    EXPECT_FALSE(manager.health_check());
    EXPECT_EQ(manager.state(), ConnectionState::Degraded);

    ASSERT_FALSE(is_error(manager.ensure_ready()));
    EXPECT_EQ(manager.state(), ConnectionState::Ready);
    EXPECT_EQ(manager.reconnect_count(), 1u);
    EXPECT_EQ(stub->connect_calls, 2u);
}

TEST(ConnectionManagerTest, ConnectionErrorFromInvokeMarksDegraded) {
    auto stub = std::make_shared<StubToolProvider>();
    ConnectionManager manager(stub);
    ASSERT_FALSE(is_error(manager.ensure_ready()));

    stub->connected = false;
    auto result = manager.invoke("github_get_user", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Connection);
    EXPECT_EQ(manager.state(), ConnectionState::Degraded);
}

TEST(ConnectionManagerTest, ToolErrorKeepsConnectionReady) {
    auto stub = std::make_shared<StubToolProvider>();
    ConnectionManager manager(stub);
    ASSERT_FALSE(is_error(manager.ensure_ready()));

    auto result = manager.invoke("missing_tool", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Execution);
    EXPECT_EQ(manager.state(), ConnectionState::Ready);
}

TEST(ConnectionManagerTest, InvokeMatchesDirectProviderCall) {
    auto stub = std::make_shared<StubToolProvider>();
    stub->handlers["echo"] = [](const json& args) -> toolbridge::core::errors::Result<json> {
        return json{{"echo", args}};
    };
    ConnectionManager manager(stub);
    ASSERT_FALSE(is_error(manager.ensure_ready()));

    const json args = {{"value", 42}};
    auto through_manager = manager.invoke("echo", args);
    auto direct = stub->invoke("echo", args);
    ASSERT_FALSE(is_error(through_manager));
    ASSERT_FALSE(is_error(direct));
    EXPECT_EQ(get_value(through_manager), get_value(direct));
}

TEST(ConnectionManagerTest, CloseIsIdempotentAndReopenable) {
    auto stub = std::make_shared<StubToolProvider>();
    ConnectionManager manager(stub);
    ASSERT_FALSE(is_error(manager.ensure_ready()));

    manager.close();
    manager.close();
    EXPECT_EQ(manager.state(), ConnectionState::Closed);
    EXPECT_EQ(stub->close_calls, 1u);

    ASSERT_FALSE(is_error(manager.ensure_ready()));
    EXPECT_EQ(manager.state(), ConnectionState::Ready);
}

TEST(ConnectionManagerTest, CloseBeforeConnectLeavesProviderUntouched) {
    auto stub = std::make_shared<StubToolProvider>();
    ConnectionManager manager(stub);

    manager.close();
    EXPECT_EQ(manager.state(), ConnectionState::Closed);
    EXPECT_EQ(stub->total_calls(), 0u);

    ASSERT_FALSE(is_error(manager.ensure_ready()));
    EXPECT_EQ(manager.state(), ConnectionState::Ready);
}

TEST(ConnectionManagerTest, SettleForwardsIntervalAndNoticesDroppedConnection) {
    auto stub = std::make_shared<StubToolProvider>();
    ConnectionManager manager(stub);
    ASSERT_FALSE(is_error(manager.ensure_ready()));

    manager.settle(std::chrono::milliseconds(25));
    EXPECT_EQ(stub->last_settle, std::chrono::milliseconds(25));
    EXPECT_EQ(manager.state(), ConnectionState::Ready);

    stub->connected = false;
    manager.settle(std::chrono::milliseconds(0));
    EXPECT_EQ(manager.state(), ConnectionState::Degraded);
}

TEST(ConnectionManagerTest, ReconnectWaitsForActiveLease) {
    auto stub = std::make_shared<StubToolProvider>();
    ConnectionManager manager(stub);
    ASSERT_FALSE(is_error(manager.ensure_ready()));

    std::atomic_bool reconnected{false};
    std::thread worker;
    {
        auto lease = manager.acquire_lease();
        EXPECT_EQ(manager.active_leases(), 1u);
        worker = std::thread([&manager, &reconnected]() {
            static_cast<void>(manager.reconnect());
            reconnected = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_FALSE(reconnected.load());
        EXPECT_EQ(stub->close_calls, 0u);
    }
    worker.join();
    EXPECT_TRUE(reconnected.load());
    EXPECT_EQ(manager.active_leases(), 0u);
    EXPECT_EQ(manager.state(), ConnectionState::Ready);
    EXPECT_EQ(manager.reconnect_count(), 1u);
}

TEST(ConnectionManagerTest, StateNamesAreStable) {
    EXPECT_EQ(toolbridge::session::to_string(ConnectionState::Uninitialized), "uninitialized");
    EXPECT_EQ(toolbridge::session::to_string(ConnectionState::Degraded), "degraded");
    EXPECT_EQ(toolbridge::session::to_string(ConnectionState::Closed), "closed");
}

}  // namespace
