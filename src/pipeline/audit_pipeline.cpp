#include "pipeline/audit_pipeline.hpp"

#include <chrono>
#include <optional>
#include <unordered_set>
#include <utility>
#include "aggregate/result_aggregator.hpp"
#include "analysis/prompts.hpp"
#include "analysis/report_schema.hpp"
#include "catalog/tool_catalog.hpp"
#include "tools/tool_executor.hpp"
#include "tools/tool_registry.hpp"

namespace webaudit::pipeline {

using core::errors::AuditError;
using core::errors::ErrorKind;
using core::logging::RunContext;
using nlohmann::json;

namespace {

// Engine failures surface as UpstreamAnalysis; cancellation keeps its own kind.
AuditError as_upstream(AuditError error, const std::string& phase) {
    if (error.kind != ErrorKind::Cancelled) {
        error.kind = ErrorKind::UpstreamAnalysis;
    }
    error.message = phase + ": " + error.message;
    return error;
}

AuditError cancelled_error() {
    return AuditError{ErrorKind::Cancelled, "Run cancelled.", "cancelled"};
}

}  // namespace

AuditPipeline::AuditPipeline(analysis::AnalysisEngine& engine,
                             core::config::AuditSettings settings, BridgeFactory bridge_factory)
    : engine_(engine),
      settings_(std::move(settings)),
      bridge_factory_(std::move(bridge_factory)) {}

void AuditPipeline::set_phase_observer(PhaseObserver observer) {
    observer_ = std::move(observer);
}

void AuditPipeline::notify(const PipelineState& state) const {
    if (observer_) {
        observer_(state);
    }
}

core::errors::Result<bool> AuditPipeline::enter(const RunContext& ctx, PipelineState& state,
                                                const Phase next) const {
    const Phase previous = state.phase();
    auto advanced = state.advance_to(next);
    if (core::errors::is_error(advanced)) {
        return core::errors::get_error(advanced);
    }
    LOG_RUN_INFO(ctx, "Pipeline: " + to_string(previous) + " -> " + to_string(next));
    notify(state);
    return true;
}

core::errors::Result<protocol::AuditRecord> AuditPipeline::run(const RunContext& ctx) const {
    const auto started = std::chrono::steady_clock::now();
    LOG_RUN_INFO(ctx, "Pipeline started for " + ctx.url);

    PipelineState state(ctx.url);
    notify(state);

    std::unique_ptr<bridge::ProtocolBridge> channel = bridge_factory_(ctx);
    if (!channel) {
        AuditError err{ErrorKind::Internal, "No tool backend bridge available.",
                       "bridge_unavailable"};
        state.fail(err);
        notify(state);
        return err;
    }

    core::errors::Result<Phase> outcome = Phase::Failed;
    {
        bridge::BridgeSession session(*channel);
        if (!session.ok()) {
            LOG_RUN_ERROR(ctx, "Pipeline: tool backend unavailable [" + session.error().code +
                                   "]: " + session.error().message);
            state.fail(session.error());
            notify(state);
            return session.error();
        }
        outcome = drive(ctx, state, session.bridge());
    }

    if (core::errors::is_error(outcome)) {
        return core::errors::get_error(outcome);
    }

    const aggregate::ResultAggregator aggregator;
    auto record = aggregator.build(state);
    if (core::errors::is_error(record)) {
        return core::errors::get_error(record);
    }

    const auto& audit = core::errors::get_value(record);
    const double elapsed_s =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    LOG_RUN_INFO(ctx, "[audit_completed] url=" + audit.url +
                          " overall_score=" + std::to_string(audit.overall_score) +
                          " grade=" + audit.grade + " risk_level=" + audit.security.risk_level +
                          " vulnerabilities=" +
                          std::to_string(audit.security.vulnerabilities.size()) +
                          " elapsed_s=" + std::to_string(elapsed_s));
    return record;
}

core::errors::Result<Phase> AuditPipeline::drive(const RunContext& ctx, PipelineState& state,
                                                 bridge::ProtocolBridge& bridge) const {
    using Step = std::function<core::errors::Result<bool>()>;

    std::vector<protocol::ToolDefinition> offered;
    const std::vector<std::pair<Phase, Step>> steps = {
        {Phase::SelectingTools,
         [&]() { return select_tools(ctx, state, bridge, offered); }},
        {Phase::ExecutingTools,
         [&]() { return execute_tools(ctx, state, bridge, offered); }},
        {Phase::SynthesizingReport, [&]() { return synthesize_report(ctx, state); }},
        {Phase::SynthesizingSummary, [&]() { return synthesize_summary(ctx, state); }},
    };

    for (const auto& [phase, step] : steps) {
        if (state.phase() != phase) {
            auto entered = enter(ctx, state, phase);
            if (core::errors::is_error(entered)) {
                state.fail(core::errors::get_error(entered));
                notify(state);
                return core::errors::get_error(entered);
            }
        }
        if (ctx.cancelled()) {
            state.fail(cancelled_error());
            notify(state);
            LOG_RUN_WARN(ctx, "Pipeline: cancelled during " + to_string(phase));
            return cancelled_error();
        }

        auto outcome = step();
        if (core::errors::is_error(outcome)) {
            const auto& err = core::errors::get_error(outcome);
            LOG_RUN_ERROR(ctx, "Pipeline: " + to_string(phase) + " failed [" +
                                   core::errors::to_string(err.kind) + "/" + err.code + "]: " +
                                   err.message);
            state.fail(err);
            notify(state);
            return err;
        }
    }

    auto done = enter(ctx, state, Phase::Done);
    if (core::errors::is_error(done)) {
        state.fail(core::errors::get_error(done));
        notify(state);
        return core::errors::get_error(done);
    }
    return state.phase();
}

core::errors::Result<bool> AuditPipeline::select_tools(
    const RunContext& ctx, PipelineState& state, bridge::ProtocolBridge& bridge,
    std::vector<protocol::ToolDefinition>& offered) const {
    catalog::ToolCatalog tool_catalog(bridge);
    const std::unordered_set<std::string> essential(settings_.essential_tools.begin(),
                                                    settings_.essential_tools.end());
    auto subset = tool_catalog.essential_subset(essential);
    if (core::errors::is_error(subset)) {
        return core::errors::get_error(subset);
    }
    offered = core::errors::get_value(subset);

    analysis::ToolSelectionRequest request;
    request.system_prompt = analysis::prompts::audit_expert();
    request.user_prompt = analysis::prompts::tool_selection(state.url());
    request.tools = offered;

    LOG_RUN_INFO(ctx, "Pipeline: asking analysis engine to choose from " +
                          std::to_string(offered.size()) + " tools");
    auto selected = engine_.select_tools(ctx, request);
    if (core::errors::is_error(selected)) {
        return as_upstream(core::errors::get_error(selected), "Tool selection");
    }
    LOG_RUN_INFO(ctx, "Pipeline: analysis engine selected " +
                          std::to_string(core::errors::get_value(selected).size()) + " tools");
    return state.set_selected_calls(core::errors::get_value(selected));
}

core::errors::Result<bool> AuditPipeline::execute_tools(
    const RunContext& ctx, PipelineState& state, bridge::ProtocolBridge& bridge,
    const std::vector<protocol::ToolDefinition>& offered) const {
    const tools::ToolRegistry registry = tools::ToolRegistry::for_bridge(offered, bridge);
    const tools::ToolExecutor executor(registry);

    // Strictly sequential and in the engine's order: later tools rely on page
    // state left by earlier ones.
    for (const auto& call : state.selected_calls()) {
        if (ctx.cancelled()) {
            return cancelled_error();
        }
        protocol::ToolResult result = executor.execute(ctx, call);
        std::optional<core::errors::AuditError> channel_failure = result.channel_failure;
        auto recorded = state.record_tool_result(std::move(result));
        if (core::errors::is_error(recorded)) {
            return recorded;
        }
        if (channel_failure.has_value()) {
            return channel_failure.value();
        }
    }
    return true;
}

core::errors::Result<bool> AuditPipeline::synthesize_report(const RunContext& ctx,
                                                            PipelineState& state) const {
    analysis::SynthesisRequest request;
    request.prompt =
        analysis::prompts::technical_report(state.url(), state.ordered_tool_results());
    request.schema_name = analysis::schema::kTechnicalReportName;
    request.schema = analysis::schema::technical_report();
    request.temperature = settings_.analysis.temperature;

    auto report = engine_.synthesize(ctx, request);
    if (core::errors::is_error(report)) {
        return as_upstream(core::errors::get_error(report), "Report synthesis");
    }
    auto valid = analysis::schema::validate_technical_report(core::errors::get_value(report));
    if (core::errors::is_error(valid)) {
        return as_upstream(core::errors::get_error(valid), "Report synthesis");
    }
    return state.set_technical_report(core::errors::get_value(report));
}

core::errors::Result<bool> AuditPipeline::synthesize_summary(const RunContext& ctx,
                                                             PipelineState& state) const {
    analysis::SynthesisRequest request;
    request.prompt = analysis::prompts::executive_summary(state.technical_report().value());
    request.schema_name = analysis::schema::kExecutiveSummaryName;
    request.schema = analysis::schema::executive_summary();
    request.temperature = settings_.analysis.summary_temperature;

    auto summary = engine_.synthesize(ctx, request);
    if (core::errors::is_error(summary)) {
        return as_upstream(core::errors::get_error(summary), "Summary synthesis");
    }
    auto valid = analysis::schema::validate_executive_summary(core::errors::get_value(summary));
    if (core::errors::is_error(valid)) {
        return as_upstream(core::errors::get_error(valid), "Summary synthesis");
    }
    return state.set_executive_summary(core::errors::get_value(summary));
}

}  // namespace webaudit::pipeline
