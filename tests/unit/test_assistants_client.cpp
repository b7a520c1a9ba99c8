#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "planning/assistants_client.hpp"
#include "planning/plan_parser.hpp"

namespace {

using crew::core::errors::ErrorCategory;
using crew::core::errors::get_error;
using crew::core::errors::get_value;
using crew::core::errors::is_error;
using crew::planning::AssistantsClient;
using crew::planning::is_terminal_run_status;
using crew::planning::transcript_from_messages;
using nlohmann::json;

TEST(AssistantsClientTest, TerminalRunStatuses) {
    EXPECT_TRUE(is_terminal_run_status("completed"));
    EXPECT_TRUE(is_terminal_run_status("failed"));
    EXPECT_TRUE(is_terminal_run_status("cancelled"));
    EXPECT_TRUE(is_terminal_run_status("expired"));
    EXPECT_FALSE(is_terminal_run_status("queued"));
    EXPECT_FALSE(is_terminal_run_status("in_progress"));
    EXPECT_FALSE(is_terminal_run_status("requires_action"));
}

TEST(AssistantsClientTest, TranscriptFromAssistantsMessageList) {
    const json body = json::parse(R"({
        "object": "list",
        "data": [
            {"id": "msg_1", "role": "user",
             "content": [{"type": "text", "text": {"value": "Plan this", "annotations": []}}]},
            {"id": "msg_2", "role": "assistant",
             "content": [{"type": "text", "text": {"value": "{\"mission_brief\": \"m\"}"}},
                         {"type": "image_file", "image_file": {"file_id": "f"}}]}
        ]
    })");

    auto result = transcript_from_messages("completed", body);
    ASSERT_FALSE(is_error(result));
    const auto& transcript = get_value(result);
    EXPECT_EQ(transcript.run_status, "completed");
    ASSERT_EQ(transcript.messages.size(), 2u);
    EXPECT_EQ(transcript.messages[0].role, "user");
    EXPECT_EQ(transcript.messages[0].content[0].text, "Plan this");
    ASSERT_EQ(transcript.messages[1].content.size(), 2u);
    EXPECT_EQ(transcript.messages[1].content[1].type, "image_file");
    EXPECT_TRUE(transcript.messages[1].content[1].text.empty());

    auto payload = crew::planning::extract_last_json_object(transcript);
    ASSERT_FALSE(is_error(payload));
    EXPECT_EQ(get_value(payload)["mission_brief"], "m");
}

TEST(AssistantsClientTest, AcceptsPlainStringText) {
    const json body = {{"data", {{{"role", "assistant"},
                                  {"content", {{{"type", "output_text"}, {"text", "hi"}}}}}}}};
    auto result = transcript_from_messages("completed", body);
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).messages.size(), 1u);
    EXPECT_EQ(get_value(result).messages[0].content[0].text, "hi");
}

TEST(AssistantsClientTest, RejectsBodyWithoutData) {
    auto result = transcript_from_messages("completed", json{{"object", "list"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Protocol);
    EXPECT_EQ(get_error(result).code, "invalid_planning_response");
}

TEST(AssistantsClientTest, UnreachableServiceIsProviderError) {
    crew::core::config::Settings settings;
    settings.planning_base_url = "http://127.0.0.1:1/v1";
    settings.planning_timeout_seconds = 5;
    AssistantsClient client(settings);

    auto result = client.create_agent("orchestrator", "Plan things", json::array());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Provider);
    EXPECT_EQ(get_error(result).code, "http_request_failed");
}

}  // namespace
