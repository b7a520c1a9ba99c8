#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "bus/message_bus.hpp"
#include "core/errors/crew_errors.hpp"
#include "core/sync/cancel_token.hpp"
#include "planning/planning_client.hpp"
#include "protocol/transcript_contract.hpp"

namespace crew::agents {

// Shared plumbing for the orchestrator and specialists: one planning-service
// persona per agent, created on first boot, plus bus publishing.
class AgentBase {
public:
    AgentBase(std::string name, std::string role, bus::MessageBus& bus,
              planning::PlanningClient& planning);
    virtual ~AgentBase() = default;

    AgentBase(const AgentBase&) = delete;
    AgentBase& operator=(const AgentBase&) = delete;

    const std::string& name() const { return name_; }
    const std::string& role() const { return role_; }
    std::optional<protocol::AgentDescriptor> descriptor() const;

protected:
    // Only the first successful call registers the persona.
    core::errors::Status boot(const std::string& instructions,
                              const nlohmann::json& tools = nlohmann::json::array());

    void notify(bus::Channel channel, nlohmann::json payload);

    core::errors::Result<protocol::Transcript> send_model_message(
        const std::string& content, const nlohmann::json& metadata,
        const core::sync::CancelToken& cancel_token);

    bus::MessageBus& bus_;
    planning::PlanningClient& planning_;

private:
    std::string name_;
    std::string role_;
    mutable std::mutex boot_mutex_;
    std::optional<protocol::AgentDescriptor> descriptor_;
};

}  // namespace crew::agents
