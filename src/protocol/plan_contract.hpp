#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bus/message_bus.hpp"

namespace crew::protocol {

    // One role yields exactly one specialist; `handle` is the join key for
    // bus sender identity, step routing and the tool session.
    struct RoleSpec {
        std::string handle;
        std::string display_name;
        std::string mission;
        std::string instructions;
        std::uint32_t check_in_seconds = 300;
        std::vector<std::string> capabilities;
    };

    struct WorkflowStep {
        std::string name;
        std::string description;
        std::string role;
        // Forwarded to the model as text only; not enforced.
        std::vector<std::string> depends_on;
    };

    struct CommunicationRule {
        std::uint32_t interval_seconds = 300;
        std::vector<bus::Channel> channels = {bus::Channel::Status};
    };

    struct Plan {
        std::string mission_brief;
        std::vector<RoleSpec> roles;
        std::vector<WorkflowStep> workflow;
        CommunicationRule communication;
    };

    // A single tool invocation requested by the model.
    struct Action {
        std::string tool;
        nlohmann::json arguments = nlohmann::json::object();
    };

} // namespace crew::protocol
