#include "agents/agent_base.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace crew::agents {

using core::errors::CrewError;
using core::errors::ErrorCategory;

AgentBase::AgentBase(std::string name, std::string role, bus::MessageBus& bus,
                     planning::PlanningClient& planning)
    : bus_(bus), planning_(planning), name_(std::move(name)), role_(std::move(role)) {}

std::optional<protocol::AgentDescriptor> AgentBase::descriptor() const {
    std::lock_guard<std::mutex> lock(boot_mutex_);
    return descriptor_;
}

core::errors::Status AgentBase::boot(const std::string& instructions,
                                     const nlohmann::json& tools) {
    std::lock_guard<std::mutex> lock(boot_mutex_);
    if (descriptor_) {
        return core::errors::ok();
    }

    auto created = planning_.create_agent(name_, instructions, tools);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    descriptor_ = core::errors::get_value(created);
    CREW_LOG_DEBUG("Agent " + name_ + " booted (assistant=" + descriptor_->assistant_id +
                   ", thread=" + descriptor_->thread_id + ")");
    return core::errors::ok();
}

void AgentBase::notify(const bus::Channel channel, nlohmann::json payload) {
    bus_.publish(bus::Message{channel, name_, std::move(payload)});
}

core::errors::Result<protocol::Transcript> AgentBase::send_model_message(
    const std::string& content, const nlohmann::json& metadata,
    const core::sync::CancelToken& cancel_token) {
    std::optional<protocol::AgentDescriptor> current = descriptor();
    if (!current) {
        return CrewError{ErrorCategory::Lifecycle, "Agent " + name_ + " is not booted",
                         "agent_not_booted"};
    }
    return planning_.send_message(*current, content, metadata, cancel_token);
}

}  // namespace crew::agents
