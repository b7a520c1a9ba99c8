#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/crew_errors.hpp"

namespace crew::app::cli {

    enum class Command {
        Plan,  // print the plan only
        Run    // plan, dispatch, wait, report
    };

    struct CliOptions {
        Command command = Command::Plan;
        std::string goal;
        std::optional<std::filesystem::path> workspace_root;
        std::uint32_t wait_seconds = 600;
        bool verbose = false;
    };

    crew::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

} // namespace crew::app::cli
