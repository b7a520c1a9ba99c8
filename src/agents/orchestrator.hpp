#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "agents/agent_base.hpp"
#include "agents/specialist.hpp"
#include "core/config/settings.hpp"
#include "protocol/plan_contract.hpp"
#include "tools/tool_registry.hpp"

namespace crew::agents {

// Turns a goal into a plan, provisions one specialist per role, routes the
// workflow steps and keeps a live view of the status and alert channels.
class Orchestrator : public AgentBase {
public:
    Orchestrator(bus::MessageBus& bus, planning::PlanningClient& planning,
                 const core::config::Settings& settings, const tools::ToolRegistry& tools);
    ~Orchestrator() override;

    core::errors::Status start();

    core::errors::Result<protocol::Plan> handle_user_goal(
        const std::string& goal, const core::sync::CancelToken& cancel_token = nullptr);

    core::errors::Result<protocol::Plan> orchestrate_goal(
        const std::string& goal, const core::sync::CancelToken& cancel_token = nullptr);

    // Creates and starts a specialist for every role not seen before.
    core::errors::Status spin_up_specialists();

    core::errors::Status assign_workflow();

    void ensure_supervision();

    // Stops the supervisory listeners after they apply what is already queued.
    // Specialists keep running.
    void shutdown();

    // Stops every specialist as well.
    void stop_specialists();

    std::optional<protocol::Plan> plan() const;
    std::map<std::string, nlohmann::json> latest_status() const;
    std::vector<nlohmann::json> alerts() const;
    std::vector<protocol::WorkflowStep> deferred_steps() const;

    Specialist* specialist(const std::string& handle) const;
    std::vector<std::string> specialist_handles() const;

    // Waits for every specialist to drain its queue.
    bool wait_until_idle(std::chrono::milliseconds timeout) const;

private:
    void listen(std::unique_ptr<bus::Subscription> subscription,
                core::sync::CancelToken cancel_token);

    const core::config::Settings& settings_;
    const tools::ToolRegistry& tools_;

    mutable std::mutex state_mutex_;
    std::optional<protocol::Plan> plan_;
    std::map<std::string, std::unique_ptr<Specialist>> specialists_;
    std::vector<protocol::WorkflowStep> deferred_;
    std::map<std::string, nlohmann::json> status_board_;
    std::vector<nlohmann::json> alert_log_;

    std::mutex supervision_mutex_;
    bool supervising_ = false;
    core::sync::CancelToken supervision_token_;
    std::vector<std::thread> listeners_;
};

}  // namespace crew::agents
