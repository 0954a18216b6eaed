#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/audit_errors.hpp"
#include "pipeline/pipeline_state.hpp"

namespace {

using nlohmann::json;
using webaudit::core::errors::AuditError;
using webaudit::core::errors::ErrorKind;
using webaudit::core::errors::get_error;
using webaudit::core::errors::is_error;
using webaudit::pipeline::Phase;
using webaudit::pipeline::PipelineState;
using webaudit::protocol::ToolResult;

ToolResult result_named(const std::string& name, bool success) {
    ToolResult r;
    r.name = name;
    r.success = success;
    return r;
}

TEST(PipelineStateTest, StartsSelectingTools) {
    PipelineState state("https://example.com");
    EXPECT_EQ(state.phase(), Phase::SelectingTools);
    EXPECT_FALSE(state.is_terminal());
    EXPECT_EQ(state.url(), "https://example.com");
}

TEST(PipelineStateTest, AdvancesOnePhaseAtATime) {
    PipelineState state("https://example.com");
    ASSERT_FALSE(is_error(state.advance_to(Phase::ExecutingTools)));
    ASSERT_FALSE(is_error(state.advance_to(Phase::SynthesizingReport)));
    ASSERT_FALSE(is_error(state.advance_to(Phase::SynthesizingSummary)));
    ASSERT_FALSE(is_error(state.advance_to(Phase::Done)));
    EXPECT_TRUE(state.is_terminal());

    auto again = state.advance_to(Phase::Done);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_phase_transition");
}

TEST(PipelineStateTest, RejectsSkippingAndGoingBack) {
    PipelineState state("https://example.com");
    auto skipped = state.advance_to(Phase::SynthesizingReport);
    ASSERT_TRUE(is_error(skipped));
    EXPECT_EQ(get_error(skipped).kind, ErrorKind::Internal);
    EXPECT_EQ(state.phase(), Phase::SelectingTools);

    ASSERT_FALSE(is_error(state.advance_to(Phase::ExecutingTools)));
    EXPECT_TRUE(is_error(state.advance_to(Phase::SelectingTools)));
    EXPECT_TRUE(is_error(state.advance_to(Phase::Failed)));
}

TEST(PipelineStateTest, ToolResultsOnlyWhileExecuting) {
    PipelineState state("https://example.com");
    EXPECT_TRUE(is_error(state.record_tool_result(result_named("navigate_page", true))));

    ASSERT_FALSE(is_error(state.set_selected_calls({})));
    ASSERT_FALSE(is_error(state.advance_to(Phase::ExecutingTools)));
    EXPECT_TRUE(is_error(state.set_selected_calls({})));
    ASSERT_FALSE(is_error(state.record_tool_result(result_named("navigate_page", false))));
    ASSERT_FALSE(is_error(state.record_tool_result(result_named("navigate_page", true))));
    ASSERT_EQ(state.tool_results().size(), 1u);
    EXPECT_TRUE(state.tool_results().at("navigate_page").success);
}

TEST(PipelineStateTest, OrderedResultsFollowExecutionOrder) {
    PipelineState state("https://example.com");
    ASSERT_FALSE(is_error(state.advance_to(Phase::ExecutingTools)));
    ASSERT_FALSE(is_error(state.record_tool_result(result_named("take_snapshot", true))));
    ASSERT_FALSE(is_error(state.record_tool_result(result_named("navigate_page", true))));
    ASSERT_FALSE(is_error(state.record_tool_result(result_named("evaluate_script", false))));
    ASSERT_FALSE(is_error(state.record_tool_result(result_named("take_snapshot", false))));

    const auto ordered = state.ordered_tool_results();
    ASSERT_EQ(ordered.size(), 3u);
    EXPECT_EQ(ordered[0].name, "take_snapshot");
    EXPECT_FALSE(ordered[0].success);
    EXPECT_EQ(ordered[1].name, "navigate_page");
    EXPECT_EQ(ordered[2].name, "evaluate_script");
}

TEST(PipelineStateTest, SynthesisOutputsAreWrittenOnce) {
    PipelineState state("https://example.com");
    ASSERT_FALSE(is_error(state.advance_to(Phase::ExecutingTools)));
    EXPECT_TRUE(is_error(state.set_technical_report(json::object())));
    ASSERT_FALSE(is_error(state.advance_to(Phase::SynthesizingReport)));
    ASSERT_FALSE(is_error(state.set_technical_report({{"overall_score", 80}})));
    EXPECT_TRUE(is_error(state.set_technical_report({{"overall_score", 10}})));
    EXPECT_EQ(state.technical_report().value()["overall_score"], 80);

    EXPECT_TRUE(is_error(state.set_executive_summary(json::object())));
    ASSERT_FALSE(is_error(state.advance_to(Phase::SynthesizingSummary)));
    ASSERT_FALSE(is_error(state.set_executive_summary({{"business_impact", "x"}})));
}

TEST(PipelineStateTest, FailKeepsFirstError) {
    PipelineState state("https://example.com");
    state.fail(AuditError{ErrorKind::Protocol, "channel closed", "no_response"});
    state.fail(AuditError{ErrorKind::Timeout, "late", "request_timeout"});
    EXPECT_EQ(state.phase(), Phase::Failed);
    ASSERT_TRUE(state.failure().has_value());
    EXPECT_EQ(state.failure()->code, "no_response");
    EXPECT_TRUE(is_error(state.advance_to(Phase::ExecutingTools)));
}

TEST(PipelineStateTest, PhaseNames) {
    EXPECT_EQ(webaudit::pipeline::to_string(Phase::SelectingTools), "selecting_tools");
    EXPECT_EQ(webaudit::pipeline::to_string(Phase::SynthesizingSummary), "synthesizing_summary");
    EXPECT_EQ(webaudit::pipeline::to_string(Phase::Failed), "failed");
}

}  // namespace
