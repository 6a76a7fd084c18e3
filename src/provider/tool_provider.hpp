#pragma once

#include <chrono>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "core/errors/worker_errors.hpp"

namespace toolbridge::provider {

// Client side of the external tool-providing service.
//
// Failures are typed through WorkerError::category: Connection means the
// transport is unusable and the caller should reconnect; Execution means the
// service answered but the operation failed.
class ToolProvider {
public:
    virtual ~ToolProvider() = default;

    // Opens the connection and performs the handshake. Returns the server's
    // handshake payload (may be an empty object).
    virtual core::errors::Result<nlohmann::json> connect() = 0;

    virtual core::errors::Result<nlohmann::json> invoke(const std::string& name,
                                                        const nlohmann::json& args) = 0;

    // Array of {name, description, inputSchema} objects.
    virtual core::errors::Result<nlohmann::json> list_capabilities() = 0;

    virtual core::errors::Result<bool> close() = 0;

    virtual bool is_connected() const = 0;

    // Called after each execution so late asynchronous output can land
    // before the next request starts.
    virtual void settle(std::chrono::milliseconds interval) {
        if (interval.count() > 0) {
            std::this_thread::sleep_for(interval);
        }
    }
};

}  // namespace toolbridge::provider
