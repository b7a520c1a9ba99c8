#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/crew_errors.hpp"
#include "core/sync/cancel_token.hpp"
#include "protocol/transcript_contract.hpp"

namespace crew::planning {

// The model service agents talk to. Implementations must be safe to share
// between the orchestrator and every specialist.
class PlanningClient {
public:
    virtual ~PlanningClient() = default;

    // Registers an agent persona and opens a conversation thread for it.
    virtual core::errors::Result<protocol::AgentDescriptor> create_agent(
        const std::string& name, const std::string& instructions,
        const nlohmann::json& tools) = 0;

    // Posts `content` to the agent's thread, waits for the run to reach a
    // terminal state and returns the thread's messages.
    virtual core::errors::Result<protocol::Transcript> send_message(
        const protocol::AgentDescriptor& descriptor, const std::string& content,
        const nlohmann::json& metadata,
        const core::sync::CancelToken& cancel_token) = 0;
};

// First line of the instructions, at most 64 characters.
std::string descriptor_role(const std::string& instructions);

}  // namespace crew::planning
