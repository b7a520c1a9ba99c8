#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/crew_errors.hpp"
#include "core/sync/cancel_token.hpp"
#include "protocol/plan_contract.hpp"
#include "tools/tool_bridge.hpp"

namespace crew::tools {

struct ToolContext {
    ToolBridge& bridge;
    core::sync::CancelToken cancel_token;
};

using ToolHandler = std::function<core::errors::Result<ToolResponse>(
    const ToolContext& context, const nlohmann::json& arguments)>;

// Maps tool names requested by the model to handlers. Names not in the
// table are rejected with "unknown_tool".
class ToolRegistry {
public:
    // run_command, read_file and apply_patch, forwarded to the bridge as given.
    static ToolRegistry with_default_tools();

    core::errors::Status register_tool(const std::string& name, ToolHandler handler);
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    core::errors::Result<ToolResponse> dispatch(const ToolContext& context,
                                                const protocol::Action& action) const;

private:
    std::map<std::string, ToolHandler> handlers_;
};

// Reads an optional string argument; missing means "".
core::errors::Result<std::string> string_argument(const nlohmann::json& arguments,
                                                  const std::string& key);

}  // namespace crew::tools
