#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/audit_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"

namespace webaudit::analysis {

struct ToolSelectionRequest {
    std::string system_prompt;
    std::string user_prompt;
    std::vector<protocol::ToolDefinition> tools;
};

struct SynthesisRequest {
    std::string prompt;
    std::string schema_name;
    nlohmann::json schema;
    double temperature = 0.1;
};

// External reasoning capability: picks tool calls and writes structured output.
class AnalysisEngine {
public:
    virtual ~AnalysisEngine() = default;

    // Zero or more calls, in the order they must run.
    virtual core::errors::Result<std::vector<protocol::ToolCall>> select_tools(
        const core::logging::RunContext& ctx, const ToolSelectionRequest& request) = 0;

    // A JSON object intended to match request.schema. Callers still validate it.
    virtual core::errors::Result<nlohmann::json> synthesize(
        const core::logging::RunContext& ctx, const SynthesisRequest& request) = 0;
};

}  // namespace webaudit::analysis
