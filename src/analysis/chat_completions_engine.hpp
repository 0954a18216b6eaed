#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analysis/analysis_engine.hpp"
#include "core/config/audit_settings.hpp"
#include "net/http_client.hpp"

namespace webaudit::analysis {

// AnalysisEngine backed by an OpenAI-compatible chat completions endpoint:
// function calling for tool selection, strict json_schema output for synthesis.
class ChatCompletionsEngine : public AnalysisEngine {
public:
    explicit ChatCompletionsEngine(core::config::AnalysisSettings settings);

    core::errors::Result<std::vector<protocol::ToolCall>> select_tools(
        const core::logging::RunContext& ctx, const ToolSelectionRequest& request) override;

    core::errors::Result<nlohmann::json> synthesize(const core::logging::RunContext& ctx,
                                                    const SynthesisRequest& request) override;

private:
    core::errors::Result<nlohmann::json> complete(const core::logging::RunContext& ctx,
                                                  const nlohmann::json& body) const;

    core::config::AnalysisSettings settings_;
};

namespace chat {

nlohmann::json build_selection_body(const core::config::AnalysisSettings& settings,
                                    const ToolSelectionRequest& request);
nlohmann::json build_synthesis_body(const core::config::AnalysisSettings& settings,
                                    const SynthesisRequest& request);

// Decoding of a chat completions response into the engine's outputs.
core::errors::Result<std::vector<protocol::ToolCall>> parse_tool_calls(
    const nlohmann::json& completion);
core::errors::Result<nlohmann::json> parse_structured_content(const nlohmann::json& completion);

}  // namespace chat

}  // namespace webaudit::analysis
