#include "cli_parser.hpp"
#include <charconv>
#include <system_error>
#include <vector>

namespace crew::app::cli {

    using namespace crew::core::errors;

    namespace {
        constexpr const char* kUsage =
            "Usage: crew_cli <plan|run> --goal \"...\" [--workspace-root DIR] "
            "[--wait-seconds N] [--verbose]";

        // Raw strings as typed, before validation
        struct RawCliOptions {
            std::optional<std::string> goal;
            std::optional<std::string> workspace_root;
            std::optional<std::string> wait_seconds;
            bool verbose = false;
        };
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return CrewError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliOptions options;
        const std::string command = argv[1];
        if (command == "plan") {
            options.command = Command::Plan;
        } else if (command == "run") {
            options.command = Command::Run;
        } else {
            return CrewError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 1. Parser phase
        RawCliOptions raw;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--goal") {
                if (i + 1 < args.size()) raw.goal = args[++i];
                else return CrewError{ErrorCategory::Input, "Missing value for --goal", "missing_value"};
            } else if (args[i] == "--workspace-root") {
                if (i + 1 < args.size()) raw.workspace_root = args[++i];
                else return CrewError{ErrorCategory::Input, "Missing value for --workspace-root", "missing_value"};
            } else if (args[i] == "--wait-seconds") {
                if (i + 1 < args.size()) raw.wait_seconds = args[++i];
                else return CrewError{ErrorCategory::Input, "Missing value for --wait-seconds", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return CrewError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 2. Validator phase
        options.verbose = raw.verbose;

        if (!raw.goal.has_value()) {
            return CrewError{ErrorCategory::Input, "Must provide --goal", "missing_required_flag", kUsage};
        }
        if (raw.goal->find_first_not_of(" \t\r\n") == std::string::npos) {
            return CrewError{ErrorCategory::Input, "--goal must not be blank", "empty_goal"};
        }
        options.goal = raw.goal.value();

        if (raw.workspace_root) {
            if (raw.workspace_root->empty()) {
                return CrewError{ErrorCategory::Input, "--workspace-root must not be empty", "invalid_path"};
            }
            options.workspace_root = std::filesystem::path(raw.workspace_root.value());
        }

        if (raw.wait_seconds) {
            if (options.command != Command::Run) {
                return CrewError{ErrorCategory::Input, "--wait-seconds only applies to 'run'", "conflicting_flags"};
            }
            uint32_t seconds = 0;
            const char* begin = raw.wait_seconds->data();
            const char* end = raw.wait_seconds->data() + raw.wait_seconds->size();
            auto [ptr, ec] = std::from_chars(begin, end, seconds);
            if (ec != std::errc() || ptr != end) {
                return CrewError{ErrorCategory::Input, "Invalid number for --wait-seconds", "invalid_integer", "Provide a positive integer."};
            }
            if (seconds == 0 || seconds > 86400) {
                return CrewError{ErrorCategory::Input, "--wait-seconds out of bounds", "bounds_error", "Must be between 1 and 86400."};
            }
            options.wait_seconds = seconds;
        }

        return options;
    }

} // namespace crew::app::cli
