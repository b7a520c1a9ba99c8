#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/crew_errors.hpp"
#include "core/sync/cancel_token.hpp"

namespace crew::tools {

enum class BridgeState {
    Unstarted,
    Connected,
    Closed
};

std::string to_string(BridgeState state);

struct BridgeConfig {
    std::string agent_name;
    std::filesystem::path workspace;
    // argv of the tool process; command[0] is looked up on PATH.
    std::vector<std::string> command;
    std::string agent_env_var = "CREW_AGENT_NAME";
    std::uint32_t shutdown_grace_ms = 5000;
    // 0 waits for a response indefinitely.
    std::uint32_t response_timeout_ms = 0;
};

struct ToolResponse {
    bool ok = false;
    nlohmann::json data;
    std::string raw;
};

// Owns one external tool process and talks to it with one JSON object per
// line: {"tool": ..., "kwargs": {...}} out, one line back. Responses are
// matched to requests by order only, so requests are strictly serialized.
//
// The process lives between a successful start() and close(); the
// destructor closes, so a stack-scoped bridge is released on every path.
class ToolBridge {
public:
    explicit ToolBridge(BridgeConfig config);
    ~ToolBridge();

    ToolBridge(const ToolBridge&) = delete;
    ToolBridge& operator=(const ToolBridge&) = delete;

    core::errors::Status start();

    core::errors::Result<ToolResponse> request(
        const std::string& tool, const nlohmann::json& arguments,
        const core::sync::CancelToken& cancel_token = nullptr);

    core::errors::Result<ToolResponse> run_command(
        const std::string& command, const core::sync::CancelToken& cancel_token = nullptr);
    core::errors::Result<ToolResponse> read_file(
        const std::string& path, const core::sync::CancelToken& cancel_token = nullptr);
    core::errors::Result<ToolResponse> apply_patch(
        const std::string& path, const std::string& patch,
        const core::sync::CancelToken& cancel_token = nullptr);

    // SIGTERM, bounded wait, then SIGKILL. Safe to call more than once.
    void close();

    BridgeState state() const;
    pid_t pid() const;
    // Raw waitpid status of the reaped process, once closed.
    std::optional<int> exit_status() const;

    const BridgeConfig& config() const { return config_; }

private:
    core::errors::Status write_line(const std::string& line);
    core::errors::Result<std::string> read_line(const core::sync::CancelToken& cancel_token);
    void close_locked(bool force);

    BridgeConfig config_;
    // Held for the whole write/read exchange of a request.
    mutable std::mutex mutex_;
    std::atomic<BridgeState> state_{BridgeState::Unstarted};
    std::atomic<pid_t> pid_{-1};
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    bool stdout_open_ = false;
    std::string read_buffer_;
    std::optional<int> exit_status_;
};

}  // namespace crew::tools
