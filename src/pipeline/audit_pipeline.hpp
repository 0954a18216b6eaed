#pragma once

#include <functional>
#include <memory>
#include "analysis/analysis_engine.hpp"
#include "bridge/protocol_bridge.hpp"
#include "core/config/audit_settings.hpp"
#include "core/errors/audit_errors.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/pipeline_state.hpp"
#include "protocol/audit_record.hpp"

namespace webaudit::pipeline {

using BridgeFactory =
    std::function<std::unique_ptr<bridge::ProtocolBridge>(const core::logging::RunContext&)>;

// Called each time the run enters a new phase, including Done and Failed.
using PhaseObserver = std::function<void(const PipelineState&)>;

// Drives one audit run through tool selection, tool execution, report
// synthesis and summary synthesis. Each run gets its own bridge.
class AuditPipeline {
public:
    AuditPipeline(analysis::AnalysisEngine& engine, core::config::AuditSettings settings,
                  BridgeFactory bridge_factory);

    void set_phase_observer(PhaseObserver observer);

    // Full run for ctx.url: acquires a bridge, drives every phase, releases
    // the bridge on every exit path and aggregates the record.
    core::errors::Result<protocol::AuditRecord> run(const core::logging::RunContext& ctx) const;

    // Drives `state` to Done or Failed over an already acquired bridge.
    // Returns the failure when the run ends in Failed.
    core::errors::Result<Phase> drive(const core::logging::RunContext& ctx, PipelineState& state,
                                      bridge::ProtocolBridge& bridge) const;

private:
    core::errors::Result<bool> select_tools(const core::logging::RunContext& ctx,
                                            PipelineState& state,
                                            bridge::ProtocolBridge& bridge,
                                            std::vector<protocol::ToolDefinition>& offered) const;
    core::errors::Result<bool> execute_tools(const core::logging::RunContext& ctx,
                                             PipelineState& state, bridge::ProtocolBridge& bridge,
                                             const std::vector<protocol::ToolDefinition>& offered) const;
    core::errors::Result<bool> synthesize_report(const core::logging::RunContext& ctx,
                                                 PipelineState& state) const;
    core::errors::Result<bool> synthesize_summary(const core::logging::RunContext& ctx,
                                                  PipelineState& state) const;
    core::errors::Result<bool> enter(const core::logging::RunContext& ctx, PipelineState& state,
                                     Phase next) const;
    void notify(const PipelineState& state) const;

    analysis::AnalysisEngine& engine_;
    core::config::AuditSettings settings_;
    BridgeFactory bridge_factory_;
    PhaseObserver observer_;
};

}  // namespace webaudit::pipeline
