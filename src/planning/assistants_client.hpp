#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "planning/planning_client.hpp"

namespace crew::planning {

// PlanningClient over an Assistants-style REST service (LiteLLM proxy or
// compatible). Every call opens its own curl easy handle, so one instance is
// safe to share between threads once curl_global_init has run.
class AssistantsClient : public PlanningClient {
public:
    explicit AssistantsClient(const core::config::Settings& settings);

    core::errors::Result<protocol::AgentDescriptor> create_agent(
        const std::string& name, const std::string& instructions,
        const nlohmann::json& tools) override;

    core::errors::Result<protocol::Transcript> send_message(
        const protocol::AgentDescriptor& descriptor, const std::string& content,
        const nlohmann::json& metadata,
        const core::sync::CancelToken& cancel_token) override;

private:
    core::errors::Result<nlohmann::json> call(const std::string& method, const std::string& path,
                                              const nlohmann::json* body) const;

    std::string base_url_;
    std::string api_key_;
    std::string model_;
    std::string custom_provider_;
    std::chrono::seconds timeout_;
    std::chrono::milliseconds poll_interval_;
};

// Builds a transcript from a "list messages" response body. Content blocks
// may carry their text as a string or as {"value": ...}.
core::errors::Result<protocol::Transcript> transcript_from_messages(
    const std::string& run_status, const nlohmann::json& body);

// True for completed, failed, cancelled and expired.
bool is_terminal_run_status(const std::string& status);

}  // namespace crew::planning
