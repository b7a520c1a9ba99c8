#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "agents/agent_base.hpp"
#include "core/config/settings.hpp"
#include "protocol/plan_contract.hpp"
#include "tools/tool_bridge.hpp"
#include "tools/tool_registry.hpp"

namespace crew::agents {

// Where a specialist's tool process runs and under which name.
struct ToolSession {
    std::string agent_name;
    std::filesystem::path workspace;
};

ToolSession make_tool_session(const core::config::Settings& settings,
                              const protocol::RoleSpec& spec);

// Executes the workflow steps routed to one role. Steps are drained by a
// single background thread, strictly one at a time and in arrival order.
// A failing step becomes an alert; the drain loop keeps going.
class Specialist : public AgentBase {
public:
    Specialist(protocol::RoleSpec spec, bus::MessageBus& bus,
               planning::PlanningClient& planning, const core::config::Settings& settings,
               const tools::ToolRegistry& tools);
    ~Specialist() override;

    core::errors::Status start();

    void receive_step(protocol::WorkflowStep step);

    // Cancels the current step, discards queued steps and joins the drain
    // thread.
    void stop();

    // True once the queue is empty and no step is running.
    bool wait_until_idle(std::chrono::milliseconds timeout) const;

    std::size_t pending_steps() const;
    bool busy() const;

    const protocol::RoleSpec& spec() const { return spec_; }
    std::optional<ToolSession> tool_session() const;
    std::string instructions() const;

private:
    void run_loop();
    void run_step(const protocol::WorkflowStep& step);
    core::errors::Status execute_step(const protocol::WorkflowStep& step);
    tools::BridgeConfig bridge_config(const ToolSession& session) const;

    const protocol::RoleSpec spec_;
    const core::config::Settings& settings_;
    const tools::ToolRegistry& tools_;
    core::sync::CancelToken cancel_token_;

    mutable std::mutex lifecycle_mutex_;
    bool started_ = false;
    std::optional<ToolSession> session_;
    std::thread runner_;

    mutable std::mutex queue_mutex_;
    mutable std::condition_variable queue_cv_;
    std::deque<protocol::WorkflowStep> queue_;
    bool in_step_ = false;
    bool stopping_ = false;
};

}  // namespace crew::agents
