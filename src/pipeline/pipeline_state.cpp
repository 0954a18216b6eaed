#include "pipeline/pipeline_state.hpp"

#include <utility>

namespace webaudit::pipeline {

using core::errors::AuditError;
using core::errors::ErrorKind;

std::string to_string(const Phase phase) {
    switch (phase) {
        case Phase::SelectingTools:
            return "selecting_tools";
        case Phase::ExecutingTools:
            return "executing_tools";
        case Phase::SynthesizingReport:
            return "synthesizing_report";
        case Phase::SynthesizingSummary:
            return "synthesizing_summary";
        case Phase::Done:
            return "done";
        case Phase::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

PipelineState::PipelineState(std::string url) : url_(std::move(url)) {}

AuditError PipelineState::misuse(const std::string& what) const {
    return AuditError{ErrorKind::Internal,
                      what + " (phase " + to_string(phase_) + ")",
                      "invalid_phase_transition"};
}

core::errors::Result<Phase> PipelineState::advance_to(const Phase next) {
    if (is_terminal()) {
        return misuse("Run already finished, cannot enter " + to_string(next));
    }
    if (next == Phase::Failed) {
        return misuse("Use fail() to enter the failed phase");
    }
    if (static_cast<int>(next) != static_cast<int>(phase_) + 1) {
        return misuse("Cannot move to " + to_string(next));
    }
    phase_ = next;
    return phase_;
}

core::errors::Result<bool> PipelineState::set_selected_calls(
    std::vector<protocol::ToolCall> calls) {
    if (phase_ != Phase::SelectingTools) {
        return misuse("Tool selection is closed");
    }
    selected_calls_ = std::move(calls);
    return true;
}

core::errors::Result<bool> PipelineState::record_tool_result(protocol::ToolResult result) {
    if (phase_ != Phase::ExecutingTools) {
        return misuse("Tool results can only be recorded while executing tools");
    }
    const std::string name = result.name;
    if (tool_results_.count(name) == 0) {
        tool_order_.push_back(name);
    }
    tool_results_[name] = std::move(result);
    return true;
}

std::vector<protocol::ToolResult> PipelineState::ordered_tool_results() const {
    std::vector<protocol::ToolResult> ordered;
    ordered.reserve(tool_order_.size());
    for (const auto& name : tool_order_) {
        ordered.push_back(tool_results_.at(name));
    }
    return ordered;
}

core::errors::Result<bool> PipelineState::set_technical_report(nlohmann::json report) {
    if (phase_ != Phase::SynthesizingReport || technical_report_.has_value()) {
        return misuse("Technical report can only be written once, during report synthesis");
    }
    technical_report_ = std::move(report);
    return true;
}

core::errors::Result<bool> PipelineState::set_executive_summary(nlohmann::json summary) {
    if (phase_ != Phase::SynthesizingSummary || executive_summary_.has_value()) {
        return misuse("Executive summary can only be written once, during summary synthesis");
    }
    executive_summary_ = std::move(summary);
    return true;
}

void PipelineState::fail(AuditError error) {
    if (is_terminal()) {
        return;
    }
    phase_ = Phase::Failed;
    failure_ = std::move(error);
}

}  // namespace webaudit::pipeline
