#include "tools/tool_registry.hpp"

#include <utility>

namespace crew::tools {

using core::errors::CrewError;
using core::errors::ErrorCategory;
using nlohmann::json;

core::errors::Result<std::string> string_argument(const json& arguments,
                                                  const std::string& key) {
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        return std::string();
    }
    if (!it->is_string()) {
        return CrewError{ErrorCategory::Input, "Tool argument '" + key + "' must be a string.",
                         "invalid_tool_arguments"};
    }
    return it->get<std::string>();
}

ToolRegistry ToolRegistry::with_default_tools() {
    ToolRegistry registry;

    registry.handlers_.emplace(
        "run_command",
        [](const ToolContext& context, const json& arguments)
            -> core::errors::Result<ToolResponse> {
            auto command = string_argument(arguments, "command");
            if (core::errors::is_error(command)) {
                return core::errors::get_error(command);
            }
            return context.bridge.run_command(core::errors::get_value(command),
                                              context.cancel_token);
        });

    registry.handlers_.emplace(
        "read_file",
        [](const ToolContext& context, const json& arguments)
            -> core::errors::Result<ToolResponse> {
            auto path = string_argument(arguments, "path");
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            return context.bridge.read_file(core::errors::get_value(path),
                                            context.cancel_token);
        });

    registry.handlers_.emplace(
        "apply_patch",
        [](const ToolContext& context, const json& arguments)
            -> core::errors::Result<ToolResponse> {
            auto path = string_argument(arguments, "path");
            auto patch = string_argument(arguments, "patch");
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            if (core::errors::is_error(patch)) {
                return core::errors::get_error(patch);
            }
            return context.bridge.apply_patch(core::errors::get_value(path),
                                              core::errors::get_value(patch),
                                              context.cancel_token);
        });

    return registry;
}

core::errors::Status ToolRegistry::register_tool(const std::string& name,
                                                 ToolHandler handler) {
    if (name.empty() || !handler) {
        return CrewError{ErrorCategory::Internal, "Tool registration needs a name and handler.",
                         "invalid_tool_registration"};
    }
    if (!handlers_.emplace(name, std::move(handler)).second) {
        return CrewError{ErrorCategory::Internal, "Tool already registered: " + name,
                         "duplicate_tool"};
    }
    return core::errors::ok();
}

bool ToolRegistry::contains(const std::string& name) const {
    return handlers_.find(name) != handlers_.end();
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    return names;
}

core::errors::Result<ToolResponse> ToolRegistry::dispatch(
    const ToolContext& context, const protocol::Action& action) const {
    auto it = handlers_.find(action.tool);
    if (it == handlers_.end()) {
        return CrewError{ErrorCategory::Capability,
                         "Unknown tool requested by specialist: " + action.tool,
                         "unknown_tool"};
    }
    if (!action.arguments.is_object()) {
        return CrewError{ErrorCategory::Input,
                         "Arguments for " + action.tool + " must be a JSON object.",
                         "invalid_tool_arguments"};
    }
    return it->second(context, action.arguments);
}

}  // namespace crew::tools
