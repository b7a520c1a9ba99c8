#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/crew_errors.hpp"
#include "core/logging/logger.hpp"

namespace crew::core::config {

// What the orchestrator does with a workflow step whose role has no worker.
enum class UnmatchedStepPolicy {
    Drop,    // never dispatched, no event
    Reject,  // assign_workflow fails before dispatching anything
    Defer    // held until a later plan introduces the role
};

std::string to_string(UnmatchedStepPolicy policy);
errors::Result<UnmatchedStepPolicy> parse_unmatched_step_policy(const std::string& text);

struct Settings {
    std::string planning_base_url = "http://localhost:4000/v1";
    std::string planning_api_key = "dummy-key";
    std::string planning_model = "gpt-4.1-mini";
    std::string planning_custom_provider = "openai";
    std::uint32_t planning_timeout_seconds = 120;
    std::uint32_t planning_poll_interval_ms = 500;

    std::string orchestrator_system_prompt =
        "You are the orchestrator of a tool-driven development team. Gather "
        "requirements, design workflows, spawn specialists, and deliver "
        "results with clear reports.";
    std::uint32_t default_check_in_seconds = 300;

    std::string tool_binary = "codex";
    std::vector<std::string> tool_arguments = {"cli", "mcp"};
    std::string tool_agent_env_var = "CREW_AGENT_NAME";
    std::uint32_t tool_shutdown_grace_ms = 5000;
    std::uint32_t tool_response_timeout_ms = 0;

    std::filesystem::path workspace_root = "./workspaces";
    UnmatchedStepPolicy unmatched_step_policy = UnmatchedStepPolicy::Drop;


    logging::LogLevel log_level = logging::LogLevel::INFO;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads the process environment.
EnvLookup process_env();

// Builds Settings from CREW_* variables. Unset variables keep their default;
// malformed values are rejected with code "invalid_setting".
errors::Result<Settings> load_settings(const EnvLookup& lookup);

}  // namespace crew::core::config
