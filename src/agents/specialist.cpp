#include "agents/specialist.hpp"

#include <exception>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "planning/plan_parser.hpp"

namespace crew::agents {

using core::errors::CrewError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += items[i];
    }
    return out;
}

}  // namespace

ToolSession make_tool_session(const core::config::Settings& settings,
                              const protocol::RoleSpec& spec) {
    return ToolSession{spec.handle, settings.workspace_root / spec.handle};
}

Specialist::Specialist(protocol::RoleSpec spec, bus::MessageBus& bus,
                       planning::PlanningClient& planning,
                       const core::config::Settings& settings,
                       const tools::ToolRegistry& tools)
    : AgentBase(spec.handle, spec.display_name, bus, planning),
      spec_(std::move(spec)),
      settings_(settings),
      tools_(tools),
      cancel_token_(core::sync::make_cancel_token()) {}

Specialist::~Specialist() {
    stop();
}

std::string Specialist::instructions() const {
    const ToolSession session = make_tool_session(settings_, spec_);
    const std::string capabilities =
        spec_.capabilities.empty() ? "planning, execution" : join(spec_.capabilities, ", ");

    std::ostringstream out;
    out << "Role: " << spec_.display_name << "\n"
        << "Mission: " << spec_.mission << "\n";
    if (!spec_.instructions.empty()) {
        out << "Instructions: " << spec_.instructions << "\n";
    }
    out << "Tool workspace: " << session.workspace.string() << " (agent: "
        << session.agent_name << ").\n"
        << "Check in every " << spec_.check_in_seconds << " seconds.\n"
        << "Capabilities: " << capabilities << "\n"
        << "When you produce actions, respond with JSON using the schema "
        << R"({"actions": [{"tool": str, "arguments": dict}]}.)";
    return out.str();
}

core::errors::Status Specialist::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) {
        return CrewError{ErrorCategory::Lifecycle, "Specialist already started: " + name(),
                         "specialist_already_started"};
    }

    auto booted = boot(instructions());
    if (core::errors::is_error(booted)) {
        return booted;
    }

    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex_);
        if (stopping_) {
            return CrewError{ErrorCategory::Lifecycle, "Specialist was stopped: " + name(),
                             "specialist_stopped"};
        }
    }

    session_ = make_tool_session(settings_, spec_);
    notify(bus::Channel::Status, json{{"event", "specialist_boot"}, {"handle", name()}});
    runner_ = std::thread(&Specialist::run_loop, this);
    started_ = true;
    CREW_LOG_INFO("Specialist " + name() + " started");
    return core::errors::ok();
}

void Specialist::receive_step(protocol::WorkflowStep step) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            CREW_LOG_WARN("Specialist " + name() + " is stopped; dropping step " + step.name);
            return;
        }
        CREW_LOG_DEBUG("Specialist " + name() + " queued step " + step.name);
        queue_.push_back(std::move(step));
    }
    queue_cv_.notify_all();
}

void Specialist::stop() {
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
        discarded = queue_.size();
        queue_.clear();
    }
    core::sync::cancel(cancel_token_);
    queue_cv_.notify_all();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (runner_.joinable()) {
        runner_.join();
        CREW_LOG_INFO("Specialist " + name() + " stopped (" + std::to_string(discarded) +
                      " queued steps discarded)");
    }
}

bool Specialist::wait_until_idle(const std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return queue_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !in_step_; });
}

std::size_t Specialist::pending_steps() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

bool Specialist::busy() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return in_step_;
}

std::optional<ToolSession> Specialist::tool_session() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return session_;
}

void Specialist::run_loop() {
    const auto check_in = std::chrono::seconds(spec_.check_in_seconds);
    while (true) {
        protocol::WorkflowStep step;
        bool heartbeat = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            auto ready = [this] { return stopping_ || !queue_.empty(); };
            if (check_in.count() > 0) {
                heartbeat = !queue_cv_.wait_for(lock, check_in, ready);
            } else {
                queue_cv_.wait(lock, ready);
            }
            if (stopping_) {
                break;
            }
            if (!heartbeat) {
                step = std::move(queue_.front());
                queue_.pop_front();
                in_step_ = true;
            }
        }

        if (heartbeat) {
            notify(bus::Channel::Heartbeat,
                   json{{"event", "heartbeat"}, {"handle", name()}, {"pending", 0}});
            continue;
        }

        run_step(step);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            in_step_ = false;
        }
        queue_cv_.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        in_step_ = false;
    }
    queue_cv_.notify_all();
}

void Specialist::run_step(const protocol::WorkflowStep& step) {
    core::errors::Status status;
    try {
        status = execute_step(step);
    } catch (const std::exception& ex) {
        status = CrewError{ErrorCategory::Internal, ex.what(), "unexpected_exception"};
    }
    if (!core::errors::is_error(status)) {
        return;
    }

    const CrewError& error = core::errors::get_error(status);
    if (core::sync::is_cancelled(cancel_token_)) {
        CREW_LOG_WARN("Specialist " + name() + " abandoned step " + step.name + ": " +
                      error.message);
        return;
    }
    CREW_LOG_ERROR("Specialist " + name() + " failed step " + step.name + " [" +
                   error.code + "]: " + error.message);
    notify(bus::Channel::Alert, json{{"event", "specialist_error"},
                                     {"handle", name()},
                                     {"step", step.name},
                                     {"error", error.message},
                                     {"code", error.code}});
}

tools::BridgeConfig Specialist::bridge_config(const ToolSession& session) const {
    tools::BridgeConfig config;
    config.agent_name = session.agent_name;
    config.workspace = session.workspace;
    config.command.push_back(settings_.tool_binary);
    config.command.insert(config.command.end(), settings_.tool_arguments.begin(),
                          settings_.tool_arguments.end());
    config.agent_env_var = settings_.tool_agent_env_var;
    config.shutdown_grace_ms = settings_.tool_shutdown_grace_ms;
    config.response_timeout_ms = settings_.tool_response_timeout_ms;
    return config;
}

core::errors::Status Specialist::execute_step(const protocol::WorkflowStep& step) {
    notify(bus::Channel::Status, json{{"event", "step_start"},
                                      {"handle", name()},
                                      {"step", step.name},
                                      {"description", step.description}});

    const std::string dependencies =
        step.depends_on.empty() ? "none" : join(step.depends_on, ", ");
    const std::string prompt = "Task: " + step.description + "\nDependencies: " +
                               dependencies +
                               "\nRespond with JSON specifying tool actions to take.";

    auto transcript = send_model_message(prompt, json{{"step", step.name}}, cancel_token_);
    if (core::errors::is_error(transcript)) {
        return core::errors::get_error(transcript);
    }
    const std::vector<protocol::Action> actions =
        planning::actions_from_transcript(core::errors::get_value(transcript));
    CREW_LOG_DEBUG("Specialist " + name() + " step " + step.name + " requested " +
                   std::to_string(actions.size()) + " actions");

    const ToolSession session = make_tool_session(settings_, spec_);
    tools::ToolBridge bridge(bridge_config(session));
    auto started = bridge.start();
    if (core::errors::is_error(started)) {
        return started;
    }

    const tools::ToolContext context{bridge, cancel_token_};
    for (const auto& action : actions) {
        if (core::sync::is_cancelled(cancel_token_)) {
            return CrewError{ErrorCategory::Lifecycle, "Step cancelled: " + step.name,
                             "step_cancelled"};
        }
        auto response = tools_.dispatch(context, action);
        if (core::errors::is_error(response)) {
            return core::errors::get_error(response);
        }
        const tools::ToolResponse& result = core::errors::get_value(response);
        notify(bus::Channel::Artifact, json{{"event", "tool_action"},
                                            {"handle", name()},
                                            {"step", step.name},
                                            {"tool", action.tool},
                                            {"ok", result.ok},
                                            {"result", result.data},
                                            {"raw", result.raw}});
    }
    bridge.close();

    notify(bus::Channel::Status,
           json{{"event", "step_complete"}, {"handle", name()}, {"step", step.name}});
    return core::errors::ok();
}

}  // namespace crew::agents
