#include "planning/plan_parser.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_set>
#include "planning/planning_client.hpp"

namespace crew::planning {

using core::errors::CrewError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Action;
using protocol::Plan;
using protocol::RoleSpec;
using protocol::Transcript;
using protocol::WorkflowStep;

namespace {

bool is_text_item(const protocol::ContentItem& item) {
    return item.type == "output_text" || item.type == "text";
}

// Visits text blocks newest message first; stops when `visit` returns true.
template <typename Visitor>
void scan_newest_first(const Transcript& transcript, Visitor&& visit) {
    for (auto it = transcript.messages.rbegin(); it != transcript.messages.rend(); ++it) {
        for (const auto& item : it->content) {
            if (!is_text_item(item)) {
                continue;
            }
            if (visit(item.text)) {
                return;
            }
        }
    }
}

CrewError invalid_plan(const std::string& message) {
    return CrewError{ErrorCategory::Protocol, message, "invalid_plan_payload"};
}

core::errors::Result<std::string> string_field(const json& object, const char* key,
                                               const std::string& fallback,
                                               const std::string& context) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        return invalid_plan(context + "." + key + " must be a string");
    }
    return it->get<std::string>();
}

core::errors::Result<std::uint32_t> seconds_field(const json& object, const char* key,
                                                  const std::uint32_t fallback,
                                                  const std::string& context) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    constexpr std::uint64_t kMaxSeconds = std::numeric_limits<std::uint32_t>::max();
    if (it->is_number_unsigned() && it->get<std::uint64_t>() <= kMaxSeconds) {
        return static_cast<std::uint32_t>(it->get<std::uint64_t>());
    }
    if (it->is_number_integer() && !it->is_number_unsigned() &&
        it->get<std::int64_t>() >= 0 &&
        static_cast<std::uint64_t>(it->get<std::int64_t>()) <= kMaxSeconds) {
        return static_cast<std::uint32_t>(it->get<std::int64_t>());
    }
    if (it->is_number_float() && it->get<double>() >= 0.0 &&
        it->get<double>() < static_cast<double>(kMaxSeconds) + 1.0) {
        return static_cast<std::uint32_t>(std::trunc(it->get<double>()));
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        std::uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (!text.empty() && ec == std::errc() && ptr == text.data() + text.size()) {
            return value;
        }
    }
    return invalid_plan(context + "." + key + " must be a non-negative integer");
}

core::errors::Result<std::vector<std::string>> string_list_field(
    const json& object, const char* key, const std::string& context) {
    std::vector<std::string> values;
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return values;
    }
    if (!it->is_array()) {
        return invalid_plan(context + "." + key + " must be a list");
    }
    for (const auto& entry : *it) {
        if (!entry.is_string()) {
            return invalid_plan(context + "." + key + " must only contain strings");
        }
        values.push_back(entry.get<std::string>());
    }
    return values;
}

core::errors::Result<RoleSpec> role_from_json(const json& data, const std::size_t index,
                                              const std::uint32_t default_check_in) {
    const std::string context = "roles[" + std::to_string(index) + "]";
    if (!data.is_object()) {
        return invalid_plan(context + " must be an object");
    }

    RoleSpec role;
    auto handle = string_field(data, "handle", "", context);
    if (core::errors::is_error(handle)) {
        return core::errors::get_error(handle);
    }
    role.handle = core::errors::get_value(handle);
    if (role.handle.empty()) {
        return invalid_plan(context + ".handle is required");
    }
    // The handle names the worker's directory under the workspace root.
    if (role.handle == "." || role.handle == ".." ||
        role.handle.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        return invalid_plan(context + ".handle must be a single path component: " +
                            role.handle);
    }

    auto display_name = string_field(data, "display_name", role.handle, context);
    auto mission = string_field(data, "mission", "", context);
    auto instructions = string_field(data, "instructions", "", context);
    auto check_in = seconds_field(data, "check_in_seconds", default_check_in, context);
    auto capabilities = string_list_field(data, "capabilities", context);
    if (core::errors::is_error(display_name)) return core::errors::get_error(display_name);
    if (core::errors::is_error(mission)) return core::errors::get_error(mission);
    if (core::errors::is_error(instructions)) return core::errors::get_error(instructions);
    if (core::errors::is_error(check_in)) return core::errors::get_error(check_in);
    if (core::errors::is_error(capabilities)) return core::errors::get_error(capabilities);

    role.display_name = core::errors::get_value(display_name);
    role.mission = core::errors::get_value(mission);
    role.instructions = core::errors::get_value(instructions);
    role.check_in_seconds = core::errors::get_value(check_in);
    role.capabilities = core::errors::get_value(capabilities);
    return role;
}

core::errors::Result<WorkflowStep> step_from_json(const json& data, const std::size_t index) {
    const std::string context = "workflow[" + std::to_string(index) + "]";
    if (!data.is_object()) {
        return invalid_plan(context + " must be an object");
    }

    auto name = string_field(data, "name", "", context);
    auto description = string_field(data, "description", "", context);
    auto role = string_field(data, "role", "", context);
    auto depends_on = string_list_field(data, "depends_on", context);
    if (core::errors::is_error(name)) return core::errors::get_error(name);
    if (core::errors::is_error(description)) return core::errors::get_error(description);
    if (core::errors::is_error(role)) return core::errors::get_error(role);
    if (core::errors::is_error(depends_on)) return core::errors::get_error(depends_on);

    WorkflowStep step;
    step.name = core::errors::get_value(name);
    step.description = core::errors::get_value(description);
    step.role = core::errors::get_value(role);
    step.depends_on = core::errors::get_value(depends_on);
    if (step.name.empty()) {
        return invalid_plan(context + ".name is required");
    }
    return step;
}

}  // namespace

std::string descriptor_role(const std::string& instructions) {
    const auto newline = instructions.find('\n');
    std::string first_line =
        newline == std::string::npos ? instructions : instructions.substr(0, newline);
    if (first_line.size() > 64) {
        first_line.resize(64);
    }
    return first_line;
}

core::errors::Result<json> extract_last_json_object(const Transcript& transcript) {
    std::optional<json> found;
    scan_newest_first(transcript, [&found](const std::string& text) {
        json parsed = json::parse(text, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return false;
        }
        found = std::move(parsed);
        return true;
    });

    if (!found) {
        return CrewError{ErrorCategory::Protocol,
                         "No JSON payload found in orchestrator response",
                         "plan_payload_not_found"};
    }
    return *found;
}

core::errors::Result<Plan> plan_from_json(const json& payload,
                                          const std::uint32_t default_check_in_seconds) {
    if (!payload.is_object()) {
        return invalid_plan("plan payload must be an object");
    }

    Plan plan;
    auto brief = string_field(payload, "mission_brief", "", "plan");
    if (core::errors::is_error(brief)) {
        return core::errors::get_error(brief);
    }
    plan.mission_brief = core::errors::get_value(brief);

    if (auto roles = payload.find("roles"); roles != payload.end() && !roles->is_null()) {
        if (!roles->is_array()) {
            return invalid_plan("plan.roles must be a list");
        }
        std::unordered_set<std::string> handles;
        for (std::size_t i = 0; i < roles->size(); ++i) {
            auto role = role_from_json((*roles)[i], i, default_check_in_seconds);
            if (core::errors::is_error(role)) {
                return core::errors::get_error(role);
            }
            const auto& spec = core::errors::get_value(role);
            if (!handles.insert(spec.handle).second) {
                return CrewError{ErrorCategory::Protocol,
                                 "Duplicate role handle in plan: " + spec.handle,
                                 "duplicate_role_handle"};
            }
            plan.roles.push_back(spec);
        }
    }

    if (auto workflow = payload.find("workflow");
        workflow != payload.end() && !workflow->is_null()) {
        if (!workflow->is_array()) {
            return invalid_plan("plan.workflow must be a list");
        }
        for (std::size_t i = 0; i < workflow->size(); ++i) {
            auto step = step_from_json((*workflow)[i], i);
            if (core::errors::is_error(step)) {
                return core::errors::get_error(step);
            }
            plan.workflow.push_back(core::errors::get_value(step));
        }
    }

    json communication = json::object();
    if (auto comm = payload.find("communication"); comm != payload.end() && !comm->is_null()) {
        if (!comm->is_object()) {
            return invalid_plan("plan.communication must be an object");
        }
        communication = *comm;
    }

    auto interval = seconds_field(communication, "interval_seconds", 300, "communication");
    if (core::errors::is_error(interval)) {
        return core::errors::get_error(interval);
    }
    plan.communication.interval_seconds = core::errors::get_value(interval);

    plan.communication.channels.clear();
    if (auto channels = communication.find("channels");
        channels != communication.end() && channels->is_array()) {
        for (const auto& entry : *channels) {
            if (!entry.is_string()) {
                continue;
            }
            auto channel = bus::parse_channel(entry.get<std::string>());
            if (core::errors::is_error(channel)) {
                continue;
            }
            plan.communication.channels.push_back(core::errors::get_value(channel));
        }
    }
    if (plan.communication.channels.empty()) {
        plan.communication.channels.push_back(bus::Channel::Status);
    }

    return plan;
}

json plan_to_json(const Plan& plan) {
    json roles = json::array();
    for (const auto& role : plan.roles) {
        roles.push_back({{"handle", role.handle},
                         {"display_name", role.display_name},
                         {"mission", role.mission},
                         {"instructions", role.instructions},
                         {"check_in_seconds", role.check_in_seconds},
                         {"capabilities", role.capabilities}});
    }

    json workflow = json::array();
    for (const auto& step : plan.workflow) {
        workflow.push_back({{"name", step.name},
                            {"description", step.description},
                            {"role", step.role},
                            {"depends_on", step.depends_on}});
    }

    json channels = json::array();
    for (const auto channel : plan.communication.channels) {
        channels.push_back(bus::to_string(channel));
    }

    return json{{"mission_brief", plan.mission_brief},
                {"roles", roles},
                {"workflow", workflow},
                {"communication",
                 {{"interval_seconds", plan.communication.interval_seconds},
                  {"channels", channels}}}};
}

std::vector<Action> actions_from_transcript(const Transcript& transcript) {
    std::vector<Action> actions;
    scan_newest_first(transcript, [&actions](const std::string& text) {
        json parsed = json::parse(text, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return false;
        }
        auto list = parsed.find("actions");
        if (list == parsed.end() || !list->is_array()) {
            return false;
        }
        for (const auto& entry : *list) {
            Action action;
            if (entry.is_object()) {
                auto tool = entry.find("tool");
                if (tool != entry.end() && tool->is_string()) {
                    action.tool = tool->get<std::string>();
                }
                auto arguments = entry.find("arguments");
                if (arguments != entry.end() && !arguments->is_null()) {
                    action.arguments = *arguments;
                }
            }
            actions.push_back(std::move(action));
        }
        return true;
    });
    return actions;
}

}  // namespace crew::planning
