#pragma once

#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace webaudit::tools {

// Single dispatch point for tool calls. Never fails: backend, transport and
// lookup failures all come back as an unsuccessful ToolResult. Transport
// failures additionally carry channel_failure so the caller can stop the run.
class ToolExecutor {
public:
    explicit ToolExecutor(const ToolRegistry& registry);

    protocol::ToolResult execute(const core::logging::RunContext& ctx,
                                 const protocol::ToolCall& call) const;

private:
    const ToolRegistry& registry_;
};

nlohmann::json make_error_marker(const std::string& tool_name, const std::string& message);

}  // namespace webaudit::tools
