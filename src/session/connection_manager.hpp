#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/worker_errors.hpp"
#include "provider/tool_provider.hpp"

namespace toolbridge::session {

enum class ConnectionState {
    Uninitialized,
    Initializing,
    Ready,
    Degraded,
    Closed
};

std::string to_string(ConnectionState state);

class ConnectionManager;

// Held for the duration of one execution. While any lease is alive the
// connection is not torn down.
class ExecutionLease {
public:
    ExecutionLease(ExecutionLease&& other) noexcept;
    ExecutionLease& operator=(ExecutionLease&&) = delete;
    ExecutionLease(const ExecutionLease&) = delete;
    ExecutionLease& operator=(const ExecutionLease&) = delete;
    ~ExecutionLease();

private:
    friend class ConnectionManager;
    explicit ExecutionLease(ConnectionManager* owner);

    ConnectionManager* owner_;
};

// Sole owner of the persistent tool-provider connection.
//
// Uninitialized -(connect ok)-> Ready
// Ready -(health fail | connection error)-> Degraded
// Degraded -(reconnect)-> Initializing -> Ready | Degraded
// any -(close)-> Closed
class ConnectionManager {
public:
    explicit ConnectionManager(std::shared_ptr<provider::ToolProvider> provider);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Returns Ready, or the connection error that left the manager Degraded.
    core::errors::Result<ConnectionState> ensure_ready();
    bool health_check();
    core::errors::Result<ConnectionState> reconnect();
    void close();

    // Tool traffic goes through here so connection failures update state.
    core::errors::Result<nlohmann::json> invoke(const std::string& name,
                                                const nlohmann::json& args);
    core::errors::Result<nlohmann::json> list_capabilities();
    void settle(std::chrono::milliseconds interval);

    // Records a connection failure observed elsewhere; reconnect happens on
    // the next ensure_ready().
    void mark_degraded(const std::string& reason);

    ExecutionLease acquire_lease();

    ConnectionState state() const;
    std::size_t reconnect_count() const;
    std::size_t active_leases() const;
    // Tool listing captured by the last successful connect or health check.
    nlohmann::json last_listing() const;

private:
    friend class ExecutionLease;

    core::errors::Result<ConnectionState> initialize_locked();
    core::errors::Result<ConnectionState> reconnect_locked();
    void teardown_locked();
    void transition(ConnectionState next, const std::string& reason);
    void release_lease();

    std::shared_ptr<provider::ToolProvider> provider_;

    // Serializes initialization and teardown; a second caller blocks here
    // instead of starting a parallel handshake.
    std::mutex init_mutex_;

    mutable std::mutex state_mutex_;
    std::condition_variable leases_released_;
    ConnectionState state_ = ConnectionState::Uninitialized;
    std::size_t reconnects_ = 0;
    std::size_t leases_ = 0;
    nlohmann::json last_listing_ = nlohmann::json::array();
};

}  // namespace toolbridge::session
