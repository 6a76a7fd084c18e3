#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include "core/config/worker_config.hpp"
#include "provider/tool_provider.hpp"

namespace toolbridge::provider {

// Spawns the tool server as a child process and talks JSON-RPC 2.0 to it,
// one message per line, over the child's stdin/stdout. The child's stderr is
// inherited so its diagnostics land next to ours.
class StdioToolProvider : public ToolProvider {
public:
    explicit StdioToolProvider(core::config::ProviderConfig config);
    ~StdioToolProvider() override;

    StdioToolProvider(const StdioToolProvider&) = delete;
    StdioToolProvider& operator=(const StdioToolProvider&) = delete;

    core::errors::Result<nlohmann::json> connect() override;
    core::errors::Result<nlohmann::json> invoke(const std::string& name,
                                                const nlohmann::json& args) override;
    core::errors::Result<nlohmann::json> list_capabilities() override;
    core::errors::Result<bool> close() override;
    bool is_connected() const override;
    void settle(std::chrono::milliseconds interval) override;

    pid_t child_pid() const { return child_pid_; }

private:
    core::errors::Result<nlohmann::json> request(const std::string& method,
                                                 const nlohmann::json& params);
    core::errors::Result<bool> send_message(const nlohmann::json& message);
    core::errors::Result<std::string> read_line(
        std::chrono::steady_clock::time_point deadline);
    void answer_server_request(const nlohmann::json& message);
    core::errors::WorkerError connection_lost(const std::string& message);
    void release_process();

    core::config::ProviderConfig config_;
    pid_t child_pid_ = -1;
    int to_child_fd_ = -1;
    int from_child_fd_ = -1;
    bool connected_ = false;
    std::int64_t next_id_ = 1;
    std::string read_buffer_;
};

}  // namespace toolbridge::provider
