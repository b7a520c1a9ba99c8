#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "planning/planning_client.hpp"
#include "planning/plan_parser.hpp"

namespace crew::testing {

// In-memory PlanningClient. Replies are queued per agent name and returned
// as the newest assistant message of the transcript.
class ScriptedPlanningClient : public crew::planning::PlanningClient {
public:
    struct SentMessage {
        std::string agent;
        std::string content;
        nlohmann::json metadata;
    };

    void queue_reply(const std::string& agent, std::string text) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_[agent].push_back(std::move(text));
    }

    void set_default_reply(std::string text) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_reply_ = std::move(text);
    }

    void fail_create_for(const std::string& agent) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_creates_.insert(agent);
    }

    // send_message for `agent` waits until its token is cancelled.
    void block_until_cancelled(const std::string& agent) {
        std::lock_guard<std::mutex> lock(mutex_);
        blocking_.insert(agent);
    }

    std::vector<SentMessage> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::map<std::string, int> create_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return create_calls_;
    }

    std::map<std::string, std::string> instructions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return instructions_;
    }

    crew::core::errors::Result<crew::protocol::AgentDescriptor> create_agent(
        const std::string& name, const std::string& instructions,
        const nlohmann::json&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++create_calls_[name];
        if (failing_creates_.count(name) > 0) {
            return crew::core::errors::CrewError{crew::core::errors::ErrorCategory::Provider,
                                                 "scripted failure for " + name,
                                                 "http_status"};
        }
        instructions_[name] = instructions;
        const std::string suffix = std::to_string(++next_id_);
        return crew::protocol::AgentDescriptor{"asst-" + suffix, "thread-" + suffix, name,
                                               crew::planning::descriptor_role(instructions)};
    }

    crew::core::errors::Result<crew::protocol::Transcript> send_message(
        const crew::protocol::AgentDescriptor& descriptor, const std::string& content,
        const nlohmann::json& metadata,
        const crew::core::sync::CancelToken& cancel_token) override {
        bool blocking = false;
        std::string reply;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(SentMessage{descriptor.name, content, metadata});
            blocking = blocking_.count(descriptor.name) > 0;
            auto& queued = replies_[descriptor.name];
            if (!queued.empty()) {
                reply = queued.front();
                queued.pop_front();
            } else {
                reply = default_reply_;
            }
        }

        if (blocking) {
            while (!crew::core::sync::is_cancelled(cancel_token)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            return crew::core::errors::CrewError{crew::core::errors::ErrorCategory::Provider,
                                                 "cancelled", "planning_cancelled"};
        }

        crew::protocol::Transcript transcript;
        transcript.run_status = "completed";
        crew::protocol::TranscriptMessage prompt;
        prompt.role = "user";
        prompt.content.push_back(crew::protocol::ContentItem{"text", content});
        crew::protocol::TranscriptMessage answer;
        answer.role = "assistant";
        answer.content.push_back(crew::protocol::ContentItem{"output_text", reply});
        transcript.messages.push_back(prompt);
        transcript.messages.push_back(answer);
        return transcript;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<std::string>> replies_;
    std::string default_reply_ = R"({"actions": []})";
    std::set<std::string> failing_creates_;
    std::set<std::string> blocking_;
    std::vector<SentMessage> sent_;
    std::map<std::string, int> create_calls_;
    std::map<std::string, std::string> instructions_;
    int next_id_ = 0;
};

}  // namespace crew::testing
