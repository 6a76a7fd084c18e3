#include "session/connection_manager.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolbridge::session {

using core::errors::ErrorCategory;
using nlohmann::json;

std::string to_string(const ConnectionState state) {
    switch (state) {
        case ConnectionState::Uninitialized:
            return "uninitialized";
        case ConnectionState::Initializing:
            return "initializing";
        case ConnectionState::Ready:
            return "ready";
        case ConnectionState::Degraded:
            return "degraded";
        case ConnectionState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

ExecutionLease::ExecutionLease(ConnectionManager* owner) : owner_(owner) {}

ExecutionLease::ExecutionLease(ExecutionLease&& other) noexcept : owner_(other.owner_) {
    other.owner_ = nullptr;
}

ExecutionLease::~ExecutionLease() {
    if (owner_ != nullptr) {
        owner_->release_lease();
    }
}

ConnectionManager::ConnectionManager(std::shared_ptr<provider::ToolProvider> provider)
    : provider_(std::move(provider)) {}

ConnectionManager::~ConnectionManager() {
    close();
}

void ConnectionManager::transition(const ConnectionState next, const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == next) {
        return;
    }
    const std::string prev = to_string(state_);
    state_ = next;
    LOG_INFO("ConnectionManager: " + prev + " -> " + to_string(next) +
             (reason.empty() ? "" : " (" + reason + ")"));
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::size_t ConnectionManager::reconnect_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return reconnects_;
}

std::size_t ConnectionManager::active_leases() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return leases_;
}

json ConnectionManager::last_listing() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_listing_;
}

core::errors::Result<ConnectionState> ConnectionManager::ensure_ready() {
    std::lock_guard<std::mutex> init_lock(init_mutex_);

    const ConnectionState current = state();
    if (current == ConnectionState::Ready) {
        if (health_check()) {
            return ConnectionState::Ready;
        }
        LOG_WARN("ConnectionManager: connection unhealthy, reconnecting");
    }
    if (current == ConnectionState::Uninitialized) {
        return initialize_locked();
    }

    return reconnect_locked();
}

core::errors::Result<ConnectionState> ConnectionManager::reconnect() {
    std::lock_guard<std::mutex> init_lock(init_mutex_);
    return reconnect_locked();
}

core::errors::Result<ConnectionState> ConnectionManager::reconnect_locked() {
    teardown_locked();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++reconnects_;
    }
    transition(ConnectionState::Uninitialized, "reconnect");
    return initialize_locked();
}

bool ConnectionManager::health_check() {
    if (!provider_->is_connected()) {
        mark_degraded("provider reports disconnected");
        return false;
    }

    auto listing = provider_->list_capabilities();
    if (core::errors::is_error(listing)) {
        const auto& err = core::errors::get_error(listing);
        LOG_WARN("ConnectionManager: health check failed: " + err.message);
        mark_degraded("health check failed");
        return false;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_listing_ = core::errors::get_value(listing);
    return true;
}

core::errors::Result<ConnectionState> ConnectionManager::initialize_locked() {
    transition(ConnectionState::Initializing, "");

    auto connected = provider_->connect();
    if (core::errors::is_error(connected)) {
        auto err = core::errors::get_error(connected);
        LOG_ERROR("ConnectionManager: failed to connect: " + err.message);
        transition(ConnectionState::Degraded, "connect failed");
        err.category = ErrorCategory::Connection;
        if (err.hint.empty()) {
            err.hint = "The next request will retry the connection.";
        }
        return err;
    }

    auto listing = provider_->list_capabilities();
    if (core::errors::is_error(listing)) {
        auto err = core::errors::get_error(listing);
        LOG_ERROR("ConnectionManager: tool listing failed after connect: " + err.message);
        transition(ConnectionState::Degraded, "listing failed");
        err.category = ErrorCategory::Connection;
        return err;
    }

    const std::size_t tool_count = core::errors::get_value(listing).size();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_listing_ = core::errors::get_value(listing);
    }
    transition(ConnectionState::Ready, std::to_string(tool_count) + " tools available");
    return ConnectionState::Ready;
}

void ConnectionManager::teardown_locked() {
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (leases_ > 0) {
            LOG_DEBUG("ConnectionManager: waiting for in-flight executions");
        }
        leases_released_.wait(lock, [this]() { return leases_ == 0; });
    }

    auto closed = provider_->close();
    if (core::errors::is_error(closed)) {
        LOG_WARN("ConnectionManager: ignoring close error: " +
                 core::errors::get_error(closed).message);
    }
}

void ConnectionManager::close() {
    std::lock_guard<std::mutex> init_lock(init_mutex_);
    const ConnectionState current = state();
    if (current == ConnectionState::Closed) {
        return;
    }
    // Never connected: nothing to tear down on the provider side.
    if (current != ConnectionState::Uninitialized) {
        teardown_locked();
    }
    transition(ConnectionState::Closed, "shutdown");
}

void ConnectionManager::mark_degraded(const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != ConnectionState::Ready) {
        return;
    }
    state_ = ConnectionState::Degraded;
    LOG_WARN("ConnectionManager: ready -> degraded (" + reason + ")");
}

core::errors::Result<json> ConnectionManager::invoke(const std::string& name,
                                                     const json& args) {
    auto result = provider_->invoke(name, args);
    if (core::errors::is_error(result) &&
        core::errors::get_error(result).category == ErrorCategory::Connection) {
        mark_degraded("invoke " + name + ": " + core::errors::get_error(result).message);
    }
    return result;
}

core::errors::Result<json> ConnectionManager::list_capabilities() {
    auto result = provider_->list_capabilities();
    if (core::errors::is_error(result)) {
        if (core::errors::get_error(result).category == ErrorCategory::Connection) {
            mark_degraded("list: " + core::errors::get_error(result).message);
        }
        return result;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_listing_ = core::errors::get_value(result);
    return result;
}

void ConnectionManager::settle(const std::chrono::milliseconds interval) {
    provider_->settle(interval);
    if (state() == ConnectionState::Ready && !provider_->is_connected()) {
        mark_degraded("connection dropped while settling");
    }
}

ExecutionLease ConnectionManager::acquire_lease() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++leases_;
    return ExecutionLease(this);
}

void ConnectionManager::release_lease() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (leases_ > 0) {
            --leases_;
        }
    }
    leases_released_.notify_all();
}

}  // namespace toolbridge::session
