#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "agents/specialist.hpp"
#include "support/scripted_planning_client.hpp"
#include "support/temp_workspace.hpp"

namespace {

using crew::agents::Specialist;
using crew::bus::Channel;
using crew::bus::Message;
using crew::bus::MessageBus;
using crew::bus::Subscription;
using crew::core::errors::get_error;
using crew::core::errors::is_error;
using crew::protocol::RoleSpec;
using crew::protocol::WorkflowStep;
using crew::testing::ScriptedPlanningClient;
using crew::testing::TempWorkspace;
using nlohmann::json;

constexpr auto kIdleTimeout = std::chrono::seconds(10);

std::vector<Message> drain(Subscription& subscription) {
    std::vector<Message> messages;
    while (auto message = subscription.try_next()) {
        messages.push_back(*message);
    }
    return messages;
}

std::vector<std::string> events(const std::vector<Message>& messages) {
    std::vector<std::string> out;
    for (const auto& message : messages) {
        std::string entry = message.payload.value("event", "");
        if (message.payload.contains("step")) {
            entry += ":" + message.payload["step"].get<std::string>();
        }
        out.push_back(entry);
    }
    return out;
}

RoleSpec developer_role() {
    RoleSpec role;
    role.handle = "dev";
    role.display_name = "Developer";
    role.mission = "Write the code";
    role.instructions = "Prefer small patches";
    return role;
}

WorkflowStep step(const std::string& name, std::vector<std::string> depends_on = {}) {
    return WorkflowStep{name, "Do " + name, "dev", std::move(depends_on)};
}

class SpecialistTest : public ::testing::Test {
protected:
    SpecialistTest()
        : workspace_("specialist"),
          registry_(crew::tools::ToolRegistry::with_default_tools()) {
        settings_.workspace_root = workspace_.root() / "workspaces";
        settings_.tool_binary = "/bin/sh";
        settings_.tool_arguments = {
            workspace_.write_script("tool.sh", crew::testing::kEchoToolScript).string()};
        settings_.tool_shutdown_grace_ms = 500;
    }

    std::unique_ptr<Specialist> make_specialist(RoleSpec role = developer_role()) {
        return std::make_unique<Specialist>(std::move(role), bus_, planning_, settings_, registry_);
    }

    TempWorkspace workspace_;
    crew::core::config::Settings settings_;
    crew::tools::ToolRegistry registry_;
    MessageBus bus_;
    ScriptedPlanningClient planning_;
};

TEST_F(SpecialistTest, StartBootsOnceAndAnnounces) {
    auto status = bus_.subscribe(Channel::Status);
    auto specialist = make_specialist();

    ASSERT_FALSE(is_error(specialist->start()));
    auto again = specialist->start();
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "specialist_already_started");
    EXPECT_EQ(planning_.create_calls().at("dev"), 1);

    auto boot = status->next_for(std::chrono::seconds(1));
    ASSERT_TRUE(boot.has_value());
    EXPECT_EQ(boot->sender, "dev");
    EXPECT_EQ(boot->payload["event"], "specialist_boot");
    EXPECT_EQ(boot->payload["handle"], "dev");

    const auto session = specialist->tool_session();
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->agent_name, "dev");
    EXPECT_EQ(session->workspace, settings_.workspace_root / "dev");

    const std::string instructions = planning_.instructions().at("dev");
    EXPECT_EQ(instructions.rfind("Role: Developer\n", 0), 0u);
    EXPECT_NE(instructions.find("Mission: Write the code"), std::string::npos);
    EXPECT_NE(instructions.find("Capabilities: planning, execution"), std::string::npos);
    EXPECT_NE(instructions.find("Check in every 300 seconds."), std::string::npos);
    EXPECT_NE(instructions.find(R"("actions")"), std::string::npos);
    ASSERT_TRUE(specialist->descriptor().has_value());
    EXPECT_EQ(specialist->descriptor()->role, "Role: Developer");
}

TEST_F(SpecialistTest, ExecutesActionsAndPublishesArtifacts) {
    planning_.queue_reply(
        "dev", R"({"actions": [{"tool": "run_command", "arguments": {"command": "ls"}},
                               {"tool": "read_file", "arguments": {"path": "README.md"}}]})");
    auto status = bus_.subscribe(Channel::Status);
    auto artifacts = bus_.subscribe(Channel::Artifact);
    auto alerts = bus_.subscribe(Channel::Alert);

    auto specialist = make_specialist();
    ASSERT_FALSE(is_error(specialist->start()));
    specialist->receive_step(step("build"));
    ASSERT_TRUE(specialist->wait_until_idle(kIdleTimeout));

    EXPECT_EQ(events(drain(*status)),
              (std::vector<std::string>{"specialist_boot", "step_start:build", "step_complete:build"}));
    EXPECT_TRUE(drain(*alerts).empty());

    const auto produced = drain(*artifacts);
    ASSERT_EQ(produced.size(), 2u);
    EXPECT_EQ(produced[0].payload["event"], "tool_action");
    EXPECT_EQ(produced[0].payload["handle"], "dev");
    EXPECT_EQ(produced[0].payload["step"], "build");
    EXPECT_EQ(produced[0].payload["tool"], "run_command");
    EXPECT_EQ(produced[0].payload["result"]["echo"]["kwargs"]["command"], "ls");
    EXPECT_FALSE(produced[0].payload["raw"].get<std::string>().empty());
    EXPECT_EQ(produced[1].payload["tool"], "read_file");

    const auto sent = planning_.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].content,
              "Task: Do build\nDependencies: none\nRespond with JSON specifying tool actions to take.");
    EXPECT_EQ(sent[0].metadata["step"], "build");
}

TEST_F(SpecialistTest, EveryReturnedCommandReachesTheTool) {
    planning_.queue_reply(
        "dev", R"({"actions": [{"tool": "run_command", "arguments": {"command": "rm -rf build"}},
                               {"tool": "run_command", "arguments": {}}]})");
    auto artifacts = bus_.subscribe(Channel::Artifact);
    auto alerts = bus_.subscribe(Channel::Alert);

    auto specialist = make_specialist();
    ASSERT_FALSE(is_error(specialist->start()));
    specialist->receive_step(step("clean"));
    ASSERT_TRUE(specialist->wait_until_idle(kIdleTimeout));

    EXPECT_TRUE(drain(*alerts).empty());
    const auto produced = drain(*artifacts);
    ASSERT_EQ(produced.size(), 2u);
    EXPECT_EQ(produced[0].payload["result"]["echo"]["kwargs"]["command"], "rm -rf build");
    EXPECT_EQ(produced[1].payload["result"]["echo"]["kwargs"]["command"], "");
}

TEST_F(SpecialistTest, DependenciesAreForwardedToTheModel) {
    auto specialist = make_specialist();
    ASSERT_FALSE(is_error(specialist->start()));
    specialist->receive_step(step("ship", {"build", "test"}));
    ASSERT_TRUE(specialist->wait_until_idle(kIdleTimeout));

    const auto sent = planning_.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_NE(sent[0].content.find("Dependencies: build, test\n"), std::string::npos);
}

TEST_F(SpecialistTest, UnknownToolRaisesOneAlertAndLaterStepsRun) {
    planning_.queue_reply("dev", R"({"actions": [{"tool": "delete_universe"},
                                                 {"tool": "run_command", "arguments": {"command": "ls"}}]})");
    planning_.queue_reply("dev", R"({"actions": [{"tool": "run_command", "arguments": {"command": "pwd"}}]})");
    auto status = bus_.subscribe(Channel::Status);
    auto artifacts = bus_.subscribe(Channel::Artifact);
    auto alerts = bus_.subscribe(Channel::Alert);

    auto specialist = make_specialist();
    ASSERT_FALSE(is_error(specialist->start()));
    specialist->receive_step(step("first"));
    specialist->receive_step(step("second"));
    ASSERT_TRUE(specialist->wait_until_idle(kIdleTimeout));

    const auto raised = drain(*alerts);
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].payload["event"], "specialist_error");
    EXPECT_EQ(raised[0].payload["step"], "first");
    EXPECT_EQ(raised[0].payload["code"], "unknown_tool");
    EXPECT_NE(raised[0].payload["error"].get<std::string>().find("delete_universe"),
              std::string::npos);

    // The failing step stops at the unknown tool; only the second step produced output.
    const auto produced = drain(*artifacts);
    ASSERT_EQ(produced.size(), 1u);
    EXPECT_EQ(produced[0].payload["step"], "second");
    EXPECT_EQ(produced[0].payload["result"]["echo"]["kwargs"]["command"], "pwd");

    EXPECT_EQ(events(drain(*status)),
              (std::vector<std::string>{"specialist_boot", "step_start:first", "step_start:second",
                                        "step_complete:second"}));
}

TEST_F(SpecialistTest, StepsNeverOverlap) {
    auto status = bus_.subscribe(Channel::Status);
    auto specialist = make_specialist();
    ASSERT_FALSE(is_error(specialist->start()));
    for (const char* name : {"a", "b", "c"}) {
        specialist->receive_step(step(name));
    }
    ASSERT_TRUE(specialist->wait_until_idle(kIdleTimeout));

    EXPECT_EQ(events(drain(*status)),
              (std::vector<std::string>{"specialist_boot", "step_start:a", "step_complete:a",
                                        "step_start:b", "step_complete:b", "step_start:c",
                                        "step_complete:c"}));
}

TEST_F(SpecialistTest, StepsQueuedBeforeStartRunAfterStart) {
    auto specialist = make_specialist();
    specialist->receive_step(step("early"));
    EXPECT_EQ(specialist->pending_steps(), 1u);

    ASSERT_FALSE(is_error(specialist->start()));
    ASSERT_TRUE(specialist->wait_until_idle(kIdleTimeout));
    EXPECT_EQ(specialist->pending_steps(), 0u);
    EXPECT_EQ(planning_.sent().size(), 1u);
}

TEST_F(SpecialistTest, SpawnFailureBecomesAlert) {
    settings_.tool_binary = "/definitely/not/a/tool-binary";
    planning_.queue_reply("dev", R"({"actions": [{"tool": "run_command", "arguments": {"command": "ls"}}]})");
    auto alerts = bus_.subscribe(Channel::Alert);

    auto specialist = make_specialist();
    ASSERT_FALSE(is_error(specialist->start()));
    specialist->receive_step(step("build"));
    ASSERT_TRUE(specialist->wait_until_idle(kIdleTimeout));

    const auto raised = drain(*alerts);
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].payload["code"], "spawn_failed");
}

TEST_F(SpecialistTest, BootFailureIsReturned) {
    planning_.fail_create_for("dev");
    auto specialist = make_specialist();
    auto started = specialist->start();
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).code, "http_status");
    EXPECT_FALSE(specialist->descriptor().has_value());
}

TEST_F(SpecialistTest, StopCancelsCurrentStepAndDiscardsQueue) {
    planning_.block_until_cancelled("dev");
    auto alerts = bus_.subscribe(Channel::Alert);

    auto specialist = make_specialist();
    ASSERT_FALSE(is_error(specialist->start()));
    specialist->receive_step(step("one"));
    specialist->receive_step(step("two"));
    specialist->receive_step(step("three"));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!specialist->busy() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(specialist->busy());

    specialist->stop();
    EXPECT_FALSE(specialist->busy());
    EXPECT_EQ(specialist->pending_steps(), 0u);
    EXPECT_TRUE(drain(*alerts).empty());
    EXPECT_EQ(planning_.sent().size(), 1u);

    // Steps arriving after stop are dropped.
    specialist->receive_step(step("four"));
    EXPECT_EQ(specialist->pending_steps(), 0u);
}

TEST_F(SpecialistTest, HeartbeatWhileIdle) {
    RoleSpec role = developer_role();
    role.check_in_seconds = 1;
    auto heartbeats = bus_.subscribe(Channel::Heartbeat);

    auto specialist = make_specialist(role);
    ASSERT_FALSE(is_error(specialist->start()));

    auto beat = heartbeats->next_for(std::chrono::seconds(5));
    ASSERT_TRUE(beat.has_value());
    EXPECT_EQ(beat->sender, "dev");
    EXPECT_EQ(beat->payload["event"], "heartbeat");
    EXPECT_EQ(beat->payload["handle"], "dev");
    EXPECT_EQ(beat->payload["pending"], 0);
}

}  // namespace
