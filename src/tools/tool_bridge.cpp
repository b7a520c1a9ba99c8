#include "tools/tool_bridge.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

extern char** environ;

namespace crew::tools {

using core::errors::CrewError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr int kPollIntervalMs = 50;
constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

// Writes to a pipe whose reader died must surface as EPIPE, not kill us.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

std::vector<std::string> build_environment(const std::string& var,
                                           const std::string& value) {
    std::vector<std::string> env;
    const std::string prefix = var + "=";
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        if (std::strncmp(*entry, prefix.c_str(), prefix.size()) == 0) {
            continue;
        }
        env.emplace_back(*entry);
    }
    env.push_back(prefix + value);
    return env;
}

std::vector<char*> to_argv(std::vector<std::string>& values) {
    std::vector<char*> argv;
    argv.reserve(values.size() + 1);
    for (auto& value : values) {
        argv.push_back(value.data());
    }
    argv.push_back(nullptr);
    return argv;
}

bool try_reap(const pid_t pid, int& status) {
    const pid_t waited = waitpid(pid, &status, WNOHANG);
    return waited == pid || (waited < 0 && errno == ECHILD);
}

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

std::string to_string(const BridgeState state) {
    switch (state) {
        case BridgeState::Unstarted:
            return "unstarted";
        case BridgeState::Connected:
            return "connected";
        case BridgeState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

ToolBridge::ToolBridge(BridgeConfig config) : config_(std::move(config)) {}

ToolBridge::~ToolBridge() {
    close();
}

core::errors::Status ToolBridge::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != BridgeState::Unstarted) {
        return CrewError{ErrorCategory::Lifecycle,
                         "Tool bridge for " + config_.agent_name + " was already started.",
                         "bridge_already_started"};
    }
    if (config_.command.empty()) {
        return CrewError{ErrorCategory::Input, "Tool command cannot be empty.",
                         "empty_tool_command"};
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.workspace, ec);
    if (ec) {
        return CrewError{ErrorCategory::Process,
                         "Unable to create workspace: " + config_.workspace.string(),
                         "workspace_create_failed"};
    }

    ignore_sigpipe();

    // Everything the child needs is prepared before fork.
    std::vector<std::string> args = config_.command;
    std::vector<char*> argv = to_argv(args);
    std::vector<std::string> env_values =
        build_environment(config_.agent_env_var, config_.agent_name);
    std::vector<char*> envp = to_argv(env_values);
    const std::string workspace = config_.workspace.string();

    // O_CLOEXEC keeps these pipes out of tool processes spawned by other
    // workers; dup2 clears the flag on the child's stdio copies.
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0], &stdout_pipe[1],
                        &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        return CrewError{ErrorCategory::Process, "Failed to create tool process pipes.",
                         "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0], &stdout_pipe[1],
                        &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        return CrewError{ErrorCategory::Process, "Failed to fork tool process.",
                         "spawn_failed"};
    }

    if (pid == 0) {
        int err = 0;
        if (chdir(workspace.c_str()) != 0) {
            err = errno;
        } else if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 ||
                   dup2(stdout_pipe[1], STDOUT_FILENO) < 0) {
            err = errno;
        } else {
            execvpe(argv[0], argv.data(), envp.data());
            err = errno;
        }
        static_cast<void>(write(exec_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(exec_pipe[1]);

    // The exec pipe reads EOF once execvpe succeeds.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n > 0) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        return CrewError{ErrorCategory::Process,
                         "Failed to start tool process '" + config_.command.front() +
                             "': " + std::strerror(child_errno),
                         "spawn_failed", "Check CREW_TOOL_BINARY."};
    }

    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stdout_open_ = true;
    pid_ = pid;
    state_ = BridgeState::Connected;
    CREW_LOG_INFO("ToolBridge: " + config_.agent_name + " connected (pid=" +
                  std::to_string(pid) + ", workspace=" + workspace + ")");
    return core::errors::ok();
}

core::errors::Status ToolBridge::write_line(const std::string& line) {
    std::size_t written = 0;
    while (written < line.size()) {
        const ssize_t n = write(stdin_fd_, line.data() + written, line.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return CrewError{ErrorCategory::Process,
                         "Failed to write to tool process: " +
                             std::string(std::strerror(errno)),
                         "bridge_write_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<std::string> ToolBridge::read_line(
    const core::sync::CancelToken& cancel_token) {
    const auto started = std::chrono::steady_clock::now();
    while (true) {
        const auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            return line;
        }
        if (!stdout_open_) {
            std::string rest;
            rest.swap(read_buffer_);
            return rest;
        }

        if (core::sync::is_cancelled(cancel_token)) {
            return CrewError{ErrorCategory::Process,
                             "Tool request cancelled while awaiting a response.",
                             "request_cancelled"};
        }
        if (config_.response_timeout_ms > 0) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - started)
                                     .count();
            if (elapsed > static_cast<std::int64_t>(config_.response_timeout_ms)) {
                return CrewError{ErrorCategory::Process,
                                 "Tool process did not respond within " +
                                     std::to_string(config_.response_timeout_ms) + " ms.",
                                 "response_timeout"};
            }
        }

        pollfd fds[1];
        fds[0].fd = stdout_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        const int ready = poll(fds, 1, kPollIntervalMs);
        if (ready < 0 && errno != EINTR) {
            return CrewError{ErrorCategory::Process, "poll() failed on tool output.",
                             "bridge_read_failed"};
        }
        if (ready <= 0) {
            continue;
        }

        char buffer[4096];
        const ssize_t n = read(stdout_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            read_buffer_.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            stdout_open_ = false;
        } else if (errno != EINTR && errno != EAGAIN) {
            return CrewError{ErrorCategory::Process,
                             "Failed to read tool output: " +
                                 std::string(std::strerror(errno)),
                             "bridge_read_failed"};
        }
    }
}

core::errors::Result<ToolResponse> ToolBridge::request(
    const std::string& tool, const json& arguments,
    const core::sync::CancelToken& cancel_token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != BridgeState::Connected) {
        return CrewError{ErrorCategory::Lifecycle,
                         "Tool bridge for " + config_.agent_name + " is not connected (" +
                             to_string(state_.load()) + ").",
                         "bridge_not_connected"};
    }

    const json payload = {{"tool", tool}, {"kwargs", arguments}};
    CREW_LOG_DEBUG("ToolBridge: " + config_.agent_name + " -> " + tool);

    auto written = write_line(payload.dump() + "\n");
    if (core::errors::is_error(written)) {
        close_locked(true);
        return core::errors::get_error(written);
    }

    auto line = read_line(cancel_token);
    if (core::errors::is_error(line)) {
        // A late reply would be read as the answer to the next request.
        close_locked(true);
        return core::errors::get_error(line);
    }

    ToolResponse response;
    response.raw = core::errors::get_value(line);
    if (is_blank(response.raw)) {
        return CrewError{ErrorCategory::Protocol, "Tool process returned empty response",
                         "empty_response"};
    }

    response.data = json::parse(response.raw, nullptr, false);
    if (response.data.is_discarded()) {
        return CrewError{ErrorCategory::Protocol,
                         "Invalid JSON from tool process: " + response.raw,
                         "invalid_response_json"};
    }
    if (!response.data.is_object()) {
        return CrewError{ErrorCategory::Protocol,
                         "Tool response is not a JSON object: " + response.raw,
                         "invalid_response_shape"};
    }

    auto ok = response.data.find("ok");
    response.ok = ok != response.data.end() && ok->is_boolean() && ok->get<bool>();
    return response;
}

core::errors::Result<ToolResponse> ToolBridge::run_command(
    const std::string& command, const core::sync::CancelToken& cancel_token) {
    return request("run_command", {{"command", command}}, cancel_token);
}

core::errors::Result<ToolResponse> ToolBridge::read_file(
    const std::string& path, const core::sync::CancelToken& cancel_token) {
    return request("read_file", {{"path", path}}, cancel_token);
}

core::errors::Result<ToolResponse> ToolBridge::apply_patch(
    const std::string& path, const std::string& patch,
    const core::sync::CancelToken& cancel_token) {
    return request("apply_patch", {{"path", path}, {"patch", patch}}, cancel_token);
}

void ToolBridge::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked(false);
}

void ToolBridge::close_locked(const bool force) {
    if (state_ != BridgeState::Connected) {
        state_ = BridgeState::Closed;
        return;
    }

    // EOF on stdin is the polite request to stop.
    close_fd(stdin_fd_);

    const pid_t pid = pid_;
    int status = 0;
    bool exited = false;
    if (!force) {
        static_cast<void>(kill(pid, SIGTERM));
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(config_.shutdown_grace_ms);
        while (!(exited = try_reap(pid, status)) &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kReapPollInterval);
        }
    }

    if (!exited) {
        CREW_LOG_WARN("ToolBridge: " + config_.agent_name + " (pid=" + std::to_string(pid) +
                      ") killed");
        static_cast<void>(kill(pid, SIGKILL));
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    close_fd(stdout_fd_);
    stdout_open_ = false;
    read_buffer_.clear();
    exit_status_ = status;
    state_ = BridgeState::Closed;
    CREW_LOG_INFO("ToolBridge: " + config_.agent_name + " closed");
}

BridgeState ToolBridge::state() const {
    return state_;
}

pid_t ToolBridge::pid() const {
    return pid_;
}

std::optional<int> ToolBridge::exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_status_;
}

}  // namespace crew::tools
