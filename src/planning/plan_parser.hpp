#pragma once

#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/crew_errors.hpp"
#include "protocol/plan_contract.hpp"
#include "protocol/transcript_contract.hpp"

namespace crew::planning {

// Scans messages newest first and returns the first text block that parses
// as a JSON object. Fails with "plan_payload_not_found" when none does.
core::errors::Result<nlohmann::json> extract_last_json_object(
    const protocol::Transcript& transcript);

core::errors::Result<protocol::Plan> plan_from_json(
    const nlohmann::json& payload, std::uint32_t default_check_in_seconds = 300);

nlohmann::json plan_to_json(const protocol::Plan& plan);

// Same reverse scan, but the winning object must carry an "actions" array.
// An empty list means the model asked for nothing.
std::vector<protocol::Action> actions_from_transcript(
    const protocol::Transcript& transcript);

}  // namespace crew::planning
