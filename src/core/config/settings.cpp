#include "core/config/settings.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <system_error>

namespace crew::core::config {

using errors::CrewError;
using errors::ErrorCategory;

namespace {

errors::Result<std::uint32_t> parse_uint(const std::string& name,
                                         const std::string& text) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return CrewError{ErrorCategory::Input,
                         "Invalid number for " + name + ": '" + text + "'",
                         "invalid_setting", "Provide a non-negative integer."};
    }
    return value;
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

}  // namespace

std::string to_string(const UnmatchedStepPolicy policy) {
    switch (policy) {
        case UnmatchedStepPolicy::Drop:
            return "drop";
        case UnmatchedStepPolicy::Reject:
            return "reject";
        case UnmatchedStepPolicy::Defer:
            return "defer";
        default:
            return "unknown";
    }
}

errors::Result<UnmatchedStepPolicy> parse_unmatched_step_policy(
    const std::string& text) {
    if (text == "drop") {
        return UnmatchedStepPolicy::Drop;
    }
    if (text == "reject") {
        return UnmatchedStepPolicy::Reject;
    }
    if (text == "defer") {
        return UnmatchedStepPolicy::Defer;
    }
    return CrewError{ErrorCategory::Input,
                     "Unknown unmatched step policy: '" + text + "'",
                     "invalid_setting", "Use one of: drop, reject, defer."};
}

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

errors::Result<Settings> load_settings(const EnvLookup& lookup) {
    Settings settings;

    auto read_string = [&lookup](const std::string& name, std::string& field) {
        if (auto value = lookup(name)) {
            field = *value;
        }
    };

    std::optional<CrewError> failure;
    auto read_uint = [&lookup, &failure](const std::string& name,
                                         std::uint32_t& field) {
        if (failure) {
            return;
        }
        auto value = lookup(name);
        if (!value) {
            return;
        }
        auto parsed = parse_uint(name, *value);
        if (errors::is_error(parsed)) {
            failure = errors::get_error(parsed);
            return;
        }
        field = errors::get_value(parsed);
    };

    read_string("CREW_PLANNING_BASE_URL", settings.planning_base_url);
    read_string("CREW_PLANNING_API_KEY", settings.planning_api_key);
    read_string("CREW_PLANNING_MODEL", settings.planning_model);
    read_string("CREW_PLANNING_CUSTOM_PROVIDER", settings.planning_custom_provider);
    read_string("CREW_ORCHESTRATOR_SYSTEM_PROMPT", settings.orchestrator_system_prompt);
    read_string("CREW_TOOL_BINARY", settings.tool_binary);

    read_uint("CREW_PLANNING_TIMEOUT_SECONDS", settings.planning_timeout_seconds);
    read_uint("CREW_PLANNING_POLL_INTERVAL_MS", settings.planning_poll_interval_ms);
    read_uint("CREW_DEFAULT_CHECK_IN_SECONDS", settings.default_check_in_seconds);
    read_uint("CREW_TOOL_SHUTDOWN_GRACE_MS", settings.tool_shutdown_grace_ms);
    read_uint("CREW_TOOL_RESPONSE_TIMEOUT_MS", settings.tool_response_timeout_ms);
    if (failure) {
        return *failure;
    }

    if (settings.planning_base_url.empty()) {
        return CrewError{ErrorCategory::Input,
                         "CREW_PLANNING_BASE_URL cannot be empty.",
                         "invalid_setting"};
    }
    while (!settings.planning_base_url.empty() &&
           settings.planning_base_url.back() == '/') {
        settings.planning_base_url.pop_back();
    }
    if (settings.tool_binary.empty()) {
        return CrewError{ErrorCategory::Input, "CREW_TOOL_BINARY cannot be empty.",
                         "invalid_setting"};
    }
    if (settings.planning_poll_interval_ms == 0) {
        return CrewError{ErrorCategory::Input,
                         "CREW_PLANNING_POLL_INTERVAL_MS must be greater than zero.",
                         "invalid_setting"};
    }

    if (auto args = lookup("CREW_TOOL_ARGUMENTS")) {
        settings.tool_arguments = split_words(*args);
    }
    if (auto root = lookup("CREW_WORKSPACE_ROOT")) {
        if (root->empty()) {
            return CrewError{ErrorCategory::Input,
                             "CREW_WORKSPACE_ROOT cannot be empty.",
                             "invalid_setting"};
        }
        settings.workspace_root = *root;
    }
    if (auto policy = lookup("CREW_UNMATCHED_STEP_POLICY")) {
        auto parsed = parse_unmatched_step_policy(*policy);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        settings.unmatched_step_policy = errors::get_value(parsed);
    }
    if (auto level = lookup("CREW_LOG_LEVEL")) {
        if (!logging::Logger::parse_level(*level, settings.log_level)) {
            return CrewError{ErrorCategory::Input,
                             "Unknown log level: '" + *level + "'",
                             "invalid_setting",
                             "Use one of: debug, info, warn, error."};
        }
    }

    return settings;
}

}  // namespace crew::core::config
