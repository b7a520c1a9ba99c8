#include "planning/assistants_client.hpp"

#include <curl/curl.h>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace crew::planning {

using core::errors::CrewError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h = nullptr;
    curl_slist* headers = nullptr;

    CurlHandle() : h(curl_easy_init()) {}
    ~CurlHandle() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (h) {
            curl_easy_cleanup(h);
        }
    }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

CrewError bad_body(const std::string& what) {
    return CrewError{ErrorCategory::Protocol, "Planning service returned " + what,
                     "invalid_planning_response"};
}

core::errors::Result<std::string> string_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        return bad_body(std::string("a body without '") + key + "'");
    }
    return it->get<std::string>();
}

std::string run_status_of(const json& run) {
    auto it = run.find("status");
    return it != run.end() && it->is_string() ? it->get<std::string>() : std::string();
}

}  // namespace

bool is_terminal_run_status(const std::string& status) {
    return status == "completed" || status == "failed" || status == "cancelled" ||
           status == "expired";
}

core::errors::Result<protocol::Transcript> transcript_from_messages(
    const std::string& run_status, const json& body) {
    if (!body.is_object() || !body.contains("data") || !body["data"].is_array()) {
        return bad_body("a message list without a 'data' array");
    }

    protocol::Transcript transcript;
    transcript.run_status = run_status;
    for (const auto& entry : body["data"]) {
        if (!entry.is_object()) {
            continue;
        }
        protocol::TranscriptMessage message;
        if (entry.contains("role") && entry["role"].is_string()) {
            message.role = entry["role"].get<std::string>();
        }
        const auto content = entry.find("content");
        if (content != entry.end() && content->is_array()) {
            for (const auto& block : *content) {
                if (!block.is_object()) {
                    continue;
                }
                protocol::ContentItem item;
                if (block.contains("type") && block["type"].is_string()) {
                    item.type = block["type"].get<std::string>();
                }
                const auto text = block.find("text");
                if (text != block.end()) {
                    if (text->is_string()) {
                        item.text = text->get<std::string>();
                    } else if (text->is_object() && text->contains("value") &&
                               (*text)["value"].is_string()) {
                        item.text = (*text)["value"].get<std::string>();
                    }
                }
                message.content.push_back(std::move(item));
            }
        }
        transcript.messages.push_back(std::move(message));
    }
    return transcript;
}

AssistantsClient::AssistantsClient(const core::config::Settings& settings)
    : base_url_(settings.planning_base_url),
      api_key_(settings.planning_api_key),
      model_(settings.planning_model),
      custom_provider_(settings.planning_custom_provider),
      timeout_(settings.planning_timeout_seconds),
      poll_interval_(settings.planning_poll_interval_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

core::errors::Result<json> AssistantsClient::call(const std::string& method,
                                                  const std::string& path,
                                                  const json* body) const {
    CurlHandle c;
    if (!c.h) {
        return CrewError{ErrorCategory::Provider, "curl_easy_init failed",
                         "http_request_failed"};
    }

    const std::string url = base_url_ + path;
    const std::string auth = "Authorization: Bearer " + api_key_;
    c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
    c.headers = curl_slist_append(c.headers, "OpenAI-Beta: assistants=v2");
    c.headers = curl_slist_append(c.headers, auth.c_str());

    std::string request_body;
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(std::chrono::milliseconds(timeout_).count()));
    if (method == "POST") {
        request_body = body ? body->dump() : std::string("{}");
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, request_body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
    }

    const CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        return CrewError{ErrorCategory::Provider,
                         method + " " + path + " failed: " + curl_easy_strerror(code),
                         "http_request_failed", "Check CREW_PLANNING_BASE_URL."};
    }
    long status = 0;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return CrewError{ErrorCategory::Provider,
                         method + " " + path + " returned HTTP " + std::to_string(status) +
                             ": " + buf.substr(0, 512),
                         "http_status"};
    }

    json parsed = json::parse(buf, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return bad_body("non-object JSON for " + method + " " + path);
    }
    return parsed;
}

core::errors::Result<protocol::AgentDescriptor> AssistantsClient::create_agent(
    const std::string& name, const std::string& instructions, const json& tools) {
    json payload = {{"model", model_},
                    {"name", name},
                    {"instructions", instructions},
                    {"tools", tools.is_array() ? tools : json::array()}};
    if (!custom_provider_.empty()) {
        payload["custom_llm_provider"] = custom_provider_;
    }

    auto assistant = call("POST", "/assistants", &payload);
    if (core::errors::is_error(assistant)) {
        return core::errors::get_error(assistant);
    }
    auto assistant_id = string_field(core::errors::get_value(assistant), "id");
    if (core::errors::is_error(assistant_id)) {
        return core::errors::get_error(assistant_id);
    }

    auto thread = call("POST", "/threads", nullptr);
    if (core::errors::is_error(thread)) {
        return core::errors::get_error(thread);
    }
    auto thread_id = string_field(core::errors::get_value(thread), "id");
    if (core::errors::is_error(thread_id)) {
        return core::errors::get_error(thread_id);
    }

    CREW_LOG_DEBUG("AssistantsClient: created assistant " +
                   core::errors::get_value(assistant_id) + " for " + name);
    return protocol::AgentDescriptor{core::errors::get_value(assistant_id),
                                     core::errors::get_value(thread_id), name,
                                     descriptor_role(instructions)};
}

core::errors::Result<protocol::Transcript> AssistantsClient::send_message(
    const protocol::AgentDescriptor& descriptor, const std::string& content,
    const json& metadata, const core::sync::CancelToken& cancel_token) {
    const std::string thread_path = "/threads/" + descriptor.thread_id;

    json message = {{"role", "user"}, {"content", content}};
    if (metadata.is_object() && !metadata.empty()) {
        // The service only accepts string metadata values.
        json flat = json::object();
        for (auto it = metadata.begin(); it != metadata.end(); ++it) {
            flat[it.key()] = it->is_string() ? it->get<std::string>() : it->dump();
        }
        message["metadata"] = flat;
    }
    auto posted = call("POST", thread_path + "/messages", &message);
    if (core::errors::is_error(posted)) {
        return core::errors::get_error(posted);
    }

    const json run_request = {{"assistant_id", descriptor.assistant_id}};
    auto run = call("POST", thread_path + "/runs", &run_request);
    if (core::errors::is_error(run)) {
        return core::errors::get_error(run);
    }
    auto run_id = string_field(core::errors::get_value(run), "id");
    if (core::errors::is_error(run_id)) {
        return core::errors::get_error(run_id);
    }

    const std::string run_path = thread_path + "/runs/" + core::errors::get_value(run_id);
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    std::string run_status = run_status_of(core::errors::get_value(run));
    while (!is_terminal_run_status(run_status)) {
        if (core::sync::is_cancelled(cancel_token)) {
            return CrewError{ErrorCategory::Provider, "Planning run cancelled: " + run_path,
                             "planning_cancelled"};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return CrewError{ErrorCategory::Provider,
                             "Planning run did not finish within " +
                                 std::to_string(timeout_.count()) + "s",
                             "run_timeout"};
        }
        std::this_thread::sleep_for(poll_interval_);

        auto polled = call("GET", run_path, nullptr);
        if (core::errors::is_error(polled)) {
            return core::errors::get_error(polled);
        }
        run_status = run_status_of(core::errors::get_value(polled));
    }
    if (run_status != "completed") {
        CREW_LOG_WARN("AssistantsClient: run " + core::errors::get_value(run_id) +
                      " ended with status " + run_status);
    }

    auto listed = call("GET", thread_path + "/messages?order=asc&limit=100", nullptr);
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    return transcript_from_messages(run_status, core::errors::get_value(listed));
}

}  // namespace crew::planning
