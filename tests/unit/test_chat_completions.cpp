#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "analysis/chat_completions_engine.hpp"
#include "analysis/report_schema.hpp"
#include "core/config/audit_settings.hpp"
#include "core/errors/audit_errors.hpp"

namespace {

using nlohmann::json;
using webaudit::analysis::SynthesisRequest;
using webaudit::analysis::ToolSelectionRequest;
using webaudit::core::config::AnalysisSettings;
using webaudit::core::errors::ErrorKind;
using webaudit::core::errors::get_error;
using webaudit::core::errors::get_value;
using webaudit::core::errors::is_error;
namespace chat = webaudit::analysis::chat;

json completion_with(const json& message) {
    return {{"id", "chatcmpl-1"}, {"choices", json::array({{{"index", 0}, {"message", message}}})}};
}

TEST(ChatCompletionsTest, SelectionBodyOffersFunctions) {
    AnalysisSettings settings;
    ToolSelectionRequest request;
    request.system_prompt = "You are an auditor.";
    request.user_prompt = "Audit https://example.com";
    webaudit::protocol::ToolDefinition navigate;
    navigate.name = "navigate_page";
    request.tools.push_back(navigate);

    const json body = chat::build_selection_body(settings, request);
    EXPECT_EQ(body["model"], "gpt-4o-mini");
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.1);
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "system");
    EXPECT_EQ(body["tools"][0]["function"]["name"], "navigate_page");
    EXPECT_EQ(body["tool_choice"], "auto");
}

TEST(ChatCompletionsTest, SelectionBodyOmitsEmptyToolList) {
    const json body = chat::build_selection_body(AnalysisSettings{}, ToolSelectionRequest{});
    EXPECT_FALSE(body.contains("tools"));
    EXPECT_FALSE(body.contains("tool_choice"));
}

TEST(ChatCompletionsTest, SynthesisBodyRequestsStrictSchema) {
    SynthesisRequest request;
    request.prompt = "Summarize";
    request.schema_name = webaudit::analysis::schema::kExecutiveSummaryName;
    request.schema = webaudit::analysis::schema::executive_summary();
    request.temperature = 0.3;

    const json body = chat::build_synthesis_body(AnalysisSettings{}, request);
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.3);
    EXPECT_EQ(body["response_format"]["type"], "json_schema");
    EXPECT_EQ(body["response_format"]["json_schema"]["name"], "executive_summary");
    EXPECT_EQ(body["response_format"]["json_schema"]["strict"], true);
}

TEST(ChatCompletionsTest, ParsesToolCallsInOrder) {
    const json message = {
        {"role", "assistant"},
        {"content", nullptr},
        {"tool_calls",
         json::array({{{"id", "a"}, {"type", "function"},
                       {"function", {{"name", "navigate_page"},
                                     {"arguments", R"({"url":"https://example.com"})"}}}},
                      {{"id", "b"}, {"type", "function"},
                       {"function", {{"name", "take_snapshot"}, {"arguments", ""}}}}})}};

    auto calls = chat::parse_tool_calls(completion_with(message));
    ASSERT_FALSE(is_error(calls));
    const auto& list = get_value(calls);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].name, "navigate_page");
    EXPECT_EQ(list[0].arguments["url"], "https://example.com");
    EXPECT_EQ(list[1].name, "take_snapshot");
    EXPECT_TRUE(list[1].arguments.is_object());
}

TEST(ChatCompletionsTest, NoToolCallsMeansEmptySelection) {
    auto calls = chat::parse_tool_calls(
        completion_with({{"role", "assistant"}, {"content", "Nothing to do"}}));
    ASSERT_FALSE(is_error(calls));
    EXPECT_TRUE(get_value(calls).empty());
}

TEST(ChatCompletionsTest, InvalidArgumentsAreRejected) {
    const json message = {
        {"tool_calls",
         json::array({{{"function", {{"name", "navigate_page"}, {"arguments", "{url:"}}}}})}};
    auto calls = chat::parse_tool_calls(completion_with(message));
    ASSERT_TRUE(is_error(calls));
    EXPECT_EQ(get_error(calls).kind, ErrorKind::UpstreamAnalysis);
    EXPECT_EQ(get_error(calls).code, "invalid_tool_arguments");
}

TEST(ChatCompletionsTest, ParsesStructuredContent) {
    auto parsed = chat::parse_structured_content(
        completion_with({{"role", "assistant"}, {"content", R"({"business_impact":"High"})"}}));
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed)["business_impact"], "High");
}

TEST(ChatCompletionsTest, RefusalIsUpstreamError) {
    auto parsed = chat::parse_structured_content(
        completion_with({{"role", "assistant"}, {"content", nullptr}, {"refusal", "I can't"}}));
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "model_refusal");
}

TEST(ChatCompletionsTest, NonJsonContentIsSchemaViolation) {
    auto parsed = chat::parse_structured_content(
        completion_with({{"role", "assistant"}, {"content", "Here is your report!"}}));
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "schema_violation");
}

TEST(ChatCompletionsTest, MissingChoicesIsMalformed) {
    auto parsed = chat::parse_structured_content(json{{"error", {{"message", "quota"}}}});
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "malformed_analysis_response");
}

}  // namespace
