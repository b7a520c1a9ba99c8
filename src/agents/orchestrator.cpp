#include "agents/orchestrator.hpp"

#include <algorithm>
#include <future>
#include <utility>
#include "core/logging/logger.hpp"
#include "planning/plan_parser.hpp"

namespace crew::agents {

using core::config::UnmatchedStepPolicy;
using core::errors::CrewError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kOrchestratorName = "orchestrator";
constexpr const char* kOrchestratorRole = "System Orchestrator";

std::string goal_prompt(const std::string& goal) {
    return "You are designing a multi-agent tool workflow. Return a compact JSON object "
           "with keys mission_brief, roles, workflow, communication. Each role needs "
           "handle, display_name, mission, instructions, check_in_seconds and "
           "capabilities; each workflow step needs name, description, role and "
           "depends_on. User goal: " +
           goal;
}

}  // namespace

Orchestrator::Orchestrator(bus::MessageBus& bus, planning::PlanningClient& planning,
                           const core::config::Settings& settings,
                           const tools::ToolRegistry& tools)
    : AgentBase(kOrchestratorName, kOrchestratorRole, bus, planning),
      settings_(settings),
      tools_(tools) {}

Orchestrator::~Orchestrator() {
    shutdown();
    stop_specialists();
}

core::errors::Status Orchestrator::start() {
    return boot(settings_.orchestrator_system_prompt);
}

core::errors::Result<protocol::Plan> Orchestrator::handle_user_goal(
    const std::string& goal, const core::sync::CancelToken& cancel_token) {
    if (goal.empty()) {
        return CrewError{ErrorCategory::Input, "Goal must not be empty.", "empty_goal"};
    }
    auto booted = start();
    if (core::errors::is_error(booted)) {
        return core::errors::get_error(booted);
    }

    CREW_LOG_INFO("Orchestrator: requesting plan");
    auto transcript = send_model_message(goal_prompt(goal), json{{"type", "goal"}},
                                         cancel_token);
    if (core::errors::is_error(transcript)) {
        return core::errors::get_error(transcript);
    }

    auto payload = planning::extract_last_json_object(core::errors::get_value(transcript));
    if (core::errors::is_error(payload)) {
        return core::errors::get_error(payload);
    }
    auto plan = planning::plan_from_json(core::errors::get_value(payload),
                                         settings_.default_check_in_seconds);
    if (core::errors::is_error(plan)) {
        return core::errors::get_error(plan);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        plan_ = core::errors::get_value(plan);
    }
    const protocol::Plan& accepted = core::errors::get_value(plan);
    CREW_LOG_INFO("Orchestrator: plan accepted with " + std::to_string(accepted.roles.size()) +
                  " roles and " + std::to_string(accepted.workflow.size()) + " steps");
    notify(bus::Channel::Plan, json{{"plan", core::errors::get_value(payload)}});
    return plan;
}

core::errors::Result<protocol::Plan> Orchestrator::orchestrate_goal(
    const std::string& goal, const core::sync::CancelToken& cancel_token) {
    auto plan = handle_user_goal(goal, cancel_token);
    if (core::errors::is_error(plan)) {
        return plan;
    }
    auto spun_up = spin_up_specialists();
    if (core::errors::is_error(spun_up)) {
        return core::errors::get_error(spun_up);
    }
    auto assigned = assign_workflow();
    if (core::errors::is_error(assigned)) {
        return core::errors::get_error(assigned);
    }
    ensure_supervision();
    return plan;
}

core::errors::Status Orchestrator::spin_up_specialists() {
    std::vector<Specialist*> fresh;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!plan_) {
            return CrewError{ErrorCategory::Lifecycle,
                             "No plan yet; handle a goal before spinning up specialists.",
                             "plan_missing"};
        }
        for (const auto& role : plan_->roles) {
            if (specialists_.find(role.handle) != specialists_.end()) {
                continue;
            }
            auto specialist =
                std::make_unique<Specialist>(role, bus_, planning_, settings_, tools_);
            fresh.push_back(specialist.get());
            specialists_.emplace(role.handle, std::move(specialist));
        }
    }

    std::vector<std::future<core::errors::Status>> boots;
    boots.reserve(fresh.size());
    for (Specialist* specialist : fresh) {
        boots.push_back(
            std::async(std::launch::async, [specialist] { return specialist->start(); }));
    }

    std::optional<CrewError> first_error;
    std::vector<std::string> failed;
    for (std::size_t i = 0; i < boots.size(); ++i) {
        auto started = boots[i].get();
        if (!core::errors::is_error(started)) {
            continue;
        }
        const CrewError& error = core::errors::get_error(started);
        CREW_LOG_ERROR("Orchestrator: specialist " + fresh[i]->name() +
                       " failed to start: " + error.message);
        failed.push_back(fresh[i]->name());
        if (!first_error) {
            first_error = error;
        }
    }

    if (first_error) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& handle : failed) {
            specialists_.erase(handle);
        }
        return *first_error;
    }
    CREW_LOG_INFO("Orchestrator: " + std::to_string(fresh.size()) + " specialists started");
    return core::errors::ok();
}

core::errors::Status Orchestrator::assign_workflow() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!plan_) {
        return CrewError{ErrorCategory::Lifecycle, "No plan to assign.", "plan_missing"};
    }

    const UnmatchedStepPolicy policy = settings_.unmatched_step_policy;
    if (policy == UnmatchedStepPolicy::Reject) {
        for (const auto& step : plan_->workflow) {
            if (specialists_.find(step.role) == specialists_.end()) {
                return CrewError{ErrorCategory::Input,
                                 "Step " + step.name + " names unknown role " + step.role,
                                 "unmatched_step_role"};
            }
        }
    }

    std::vector<protocol::WorkflowStep> still_deferred;
    for (auto& step : deferred_) {
        auto it = specialists_.find(step.role);
        if (it == specialists_.end()) {
            still_deferred.push_back(std::move(step));
            continue;
        }
        CREW_LOG_INFO("Orchestrator: releasing deferred step " + step.name + " to " +
                      step.role);
        it->second->receive_step(std::move(step));
    }
    deferred_ = std::move(still_deferred);

    for (const auto& step : plan_->workflow) {
        auto it = specialists_.find(step.role);
        if (it != specialists_.end()) {
            it->second->receive_step(step);
            continue;
        }
        if (policy == UnmatchedStepPolicy::Defer) {
            const bool already_deferred =
                std::any_of(deferred_.begin(), deferred_.end(),
                            [&step](const protocol::WorkflowStep& held) {
                                return held.name == step.name;
                            });
            if (already_deferred) {
                continue;
            }
            CREW_LOG_INFO("Orchestrator: deferring step " + step.name + " until role " +
                          step.role + " exists");
            deferred_.push_back(step);
        } else {
            CREW_LOG_DEBUG("Orchestrator: dropping step " + step.name + " for unknown role " +
                           step.role);
        }
    }
    return core::errors::ok();
}

void Orchestrator::ensure_supervision() {
    std::lock_guard<std::mutex> lock(supervision_mutex_);
    if (supervising_) {
        return;
    }
    supervision_token_ = core::sync::make_cancel_token();
    listeners_.emplace_back(&Orchestrator::listen, this, bus_.subscribe(bus::Channel::Status),
                            supervision_token_);
    listeners_.emplace_back(&Orchestrator::listen, this, bus_.subscribe(bus::Channel::Alert),
                            supervision_token_);
    supervising_ = true;
    CREW_LOG_DEBUG("Orchestrator: supervising status and alert channels");
}

void Orchestrator::listen(std::unique_ptr<bus::Subscription> subscription,
                          core::sync::CancelToken cancel_token) {
    while (auto message = subscription->next(cancel_token)) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (message->channel == bus::Channel::Status) {
            status_board_[message->sender] = message->payload;
        } else {
            alert_log_.push_back(message->payload);
        }
    }
}

void Orchestrator::shutdown() {
    std::lock_guard<std::mutex> lock(supervision_mutex_);
    if (!supervising_) {
        return;
    }
    core::sync::cancel(supervision_token_);
    for (auto& listener : listeners_) {
        listener.join();
    }
    listeners_.clear();
    supervising_ = false;
    CREW_LOG_DEBUG("Orchestrator: supervision stopped");
}

void Orchestrator::stop_specialists() {
    std::vector<Specialist*> running;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& entry : specialists_) {
            running.push_back(entry.second.get());
        }
    }
    for (Specialist* specialist : running) {
        specialist->stop();
    }
}

std::optional<protocol::Plan> Orchestrator::plan() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return plan_;
}

std::map<std::string, json> Orchestrator::latest_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_board_;
}

std::vector<json> Orchestrator::alerts() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return alert_log_;
}

std::vector<protocol::WorkflowStep> Orchestrator::deferred_steps() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return deferred_;
}

Specialist* Orchestrator::specialist(const std::string& handle) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = specialists_.find(handle);
    return it == specialists_.end() ? nullptr : it->second.get();
}

std::vector<std::string> Orchestrator::specialist_handles() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<std::string> handles;
    handles.reserve(specialists_.size());
    for (const auto& entry : specialists_) {
        handles.push_back(entry.first);
    }
    return handles;
}

bool Orchestrator::wait_until_idle(const std::chrono::milliseconds timeout) const {
    std::vector<Specialist*> running;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& entry : specialists_) {
            running.push_back(entry.second.get());
        }
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (const Specialist* specialist : running) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (!specialist->wait_until_idle(std::max(remaining, std::chrono::milliseconds(0)))) {
            return false;
        }
    }
    return true;
}

}  // namespace crew::agents
