#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/audit_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace webaudit::pipeline {

enum class Phase {
    SelectingTools,
    ExecutingTools,
    SynthesizingReport,
    SynthesizingSummary,
    Done,
    Failed
};

std::string to_string(Phase phase);

// Mutable record of exactly one audit run. The mutators reject anything that
// would move the phase backwards or write a synthesis result twice.
class PipelineState {
public:
    explicit PipelineState(std::string url);

    const std::string& url() const { return url_; }
    Phase phase() const { return phase_; }
    bool is_terminal() const { return phase_ == Phase::Done || phase_ == Phase::Failed; }

    const std::vector<protocol::ToolCall>& selected_calls() const { return selected_calls_; }
    const std::map<std::string, protocol::ToolResult>& tool_results() const {
        return tool_results_;
    }
    // Latest result per tool, in the order each tool first ran.
    std::vector<protocol::ToolResult> ordered_tool_results() const;
    const std::optional<nlohmann::json>& technical_report() const { return technical_report_; }
    const std::optional<nlohmann::json>& executive_summary() const { return executive_summary_; }
    const std::optional<core::errors::AuditError>& failure() const { return failure_; }

    core::errors::Result<Phase> advance_to(Phase next);
    core::errors::Result<bool> set_selected_calls(std::vector<protocol::ToolCall> calls);
    // A repeated tool name overwrites the earlier result but keeps its position.
    core::errors::Result<bool> record_tool_result(protocol::ToolResult result);
    core::errors::Result<bool> set_technical_report(nlohmann::json report);
    core::errors::Result<bool> set_executive_summary(nlohmann::json summary);

    // Moves any non-terminal state to Failed and keeps the first error.
    void fail(core::errors::AuditError error);

private:
    core::errors::AuditError misuse(const std::string& what) const;

    std::string url_;
    Phase phase_ = Phase::SelectingTools;
    std::vector<protocol::ToolCall> selected_calls_;
    std::map<std::string, protocol::ToolResult> tool_results_;
    std::vector<std::string> tool_order_;
    std::optional<nlohmann::json> technical_report_;
    std::optional<nlohmann::json> executive_summary_;
    std::optional<core::errors::AuditError> failure_;
};

}  // namespace webaudit::pipeline
