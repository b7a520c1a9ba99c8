#include <chrono>
#include <iostream>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "agents/orchestrator.hpp"
#include "app/cli_parser.hpp"
#include "bus/message_bus.hpp"
#include "core/config/id_gen.hpp"
#include "core/config/settings.hpp"
#include "core/errors/crew_errors.hpp"
#include "core/logging/logger.hpp"
#include "planning/assistants_client.hpp"
#include "planning/plan_parser.hpp"
#include "tools/tool_registry.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInput = 2;
constexpr int kExitPlanning = 3;
constexpr int kExitOrchestration = 4;

struct CurlGlobal {
    CURLcode code;
    CurlGlobal() : code(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() {
        if (code == CURLE_OK) {
            curl_global_cleanup();
        }
    }
};

void report(const std::string& what, const crew::core::errors::CrewError& err) {
    CREW_LOG_ERROR(what + " [" + crew::core::errors::to_string(err.category) + "/" + err.code +
                   "]: " + err.message);
    if (!err.hint.empty()) {
        CREW_LOG_INFO("Hint: " + err.hint);
    }
}

int exit_code_for(const crew::core::errors::CrewError& err) {
    using crew::core::errors::ErrorCategory;
    switch (err.category) {
        case ErrorCategory::Input:
            return kExitInput;
        case ErrorCategory::Protocol:
        case ErrorCategory::Provider:
            return kExitPlanning;
        default:
            return kExitOrchestration;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = crew::core::errors;
    auto& logger = crew::core::logging::Logger::get();

    // 1. Tag every log line with this invocation's goal id
    const std::string goal_id = crew::core::config::generate_id("goal-");
    logger.set_context(goal_id);

    // 2. Parse CLI input
    auto parsed = crew::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        report("Input error", errors::get_error(parsed));
        return kExitInput;
    }
    const auto& options = errors::get_value(parsed);

    // 3. Load settings from the environment, then apply CLI overrides
    auto loaded = crew::core::config::load_settings(crew::core::config::process_env());
    if (errors::is_error(loaded)) {
        report("Configuration error", errors::get_error(loaded));
        return kExitInput;
    }
    crew::core::config::Settings settings = errors::get_value(loaded);
    if (options.workspace_root) {
        settings.workspace_root = *options.workspace_root;
    }
    logger.set_level(options.verbose ? crew::core::logging::LogLevel::DEBUG : settings.log_level);

    CurlGlobal curl;
    if (curl.code != CURLE_OK) {
        CREW_LOG_ERROR(std::string("curl_global_init failed: ") + curl_easy_strerror(curl.code));
        return kExitPlanning;
    }

    // 4. Wire the components
    crew::bus::MessageBus bus;
    crew::planning::AssistantsClient planning(settings);
    const crew::tools::ToolRegistry tools = crew::tools::ToolRegistry::with_default_tools();
    crew::agents::Orchestrator orchestrator(bus, planning, settings, tools);

    if (options.command == crew::app::cli::Command::Plan) {
        CREW_LOG_INFO("Planning goal: " + options.goal);
        auto plan = orchestrator.handle_user_goal(options.goal);
        if (errors::is_error(plan)) {
            report("Planning failed", errors::get_error(plan));
            return exit_code_for(errors::get_error(plan));
        }
        std::cout << crew::planning::plan_to_json(errors::get_value(plan)).dump(2) << std::endl;
        return kExitOk;
    }

    // 5. Full run: plan, dispatch, wait for the specialists to drain
    CREW_LOG_INFO("Orchestrating goal: " + options.goal);
    auto plan = orchestrator.orchestrate_goal(options.goal);
    if (errors::is_error(plan)) {
        report("Orchestration failed", errors::get_error(plan));
        return exit_code_for(errors::get_error(plan));
    }

    if (!orchestrator.wait_until_idle(std::chrono::seconds(options.wait_seconds))) {
        CREW_LOG_WARN("Specialists still busy after " + std::to_string(options.wait_seconds) +
                      "s; reporting current state");
    }
    orchestrator.shutdown();

    nlohmann::json status = nlohmann::json::object();
    for (const auto& entry : orchestrator.latest_status()) {
        status[entry.first] = entry.second;
    }
    const nlohmann::json report_json = {
        {"plan", crew::planning::plan_to_json(errors::get_value(plan))},
        {"status", status},
        {"alerts", orchestrator.alerts()}};
    std::cout << report_json.dump(2) << std::endl;

    orchestrator.stop_specialists();
    CREW_LOG_INFO("Run finished with " + std::to_string(orchestrator.alerts().size()) +
                  " alerts");
    return kExitOk;
}
