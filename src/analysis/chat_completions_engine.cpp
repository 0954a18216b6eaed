#include "analysis/chat_completions_engine.hpp"

#include <utility>
#include "catalog/tool_catalog.hpp"

namespace webaudit::analysis {

using core::errors::AuditError;
using core::errors::ErrorKind;
using nlohmann::json;
using protocol::ToolCall;

namespace {

constexpr std::size_t kSnippetLength = 300;

std::string snippet(const std::string& text) {
    if (text.size() <= kSnippetLength) {
        return text;
    }
    return text.substr(0, kSnippetLength) + "...";
}

AuditError upstream(const std::string& message, const std::string& code) {
    return AuditError{ErrorKind::UpstreamAnalysis, message, code};
}

core::errors::Result<json> first_message(const json& completion) {
    if (!completion.is_object() || !completion.contains("choices") ||
        !completion["choices"].is_array() || completion["choices"].empty()) {
        return upstream("Analysis response has no choices.", "malformed_analysis_response");
    }
    const json& choice = completion["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        return upstream("Analysis response has no message.", "malformed_analysis_response");
    }
    const json& message = choice["message"];
    if (message.contains("refusal") && message["refusal"].is_string()) {
        return upstream("Model refused request: " + message["refusal"].get<std::string>(),
                        "model_refusal");
    }
    return message;
}

}  // namespace

namespace chat {

json build_selection_body(const core::config::AnalysisSettings& settings,
                          const ToolSelectionRequest& request) {
    json body;
    body["model"] = settings.model;
    body["temperature"] = settings.temperature;
    body["messages"] = json::array({{{"role", "system"}, {"content", request.system_prompt}},
                                    {{"role", "user"}, {"content", request.user_prompt}}});
    if (!request.tools.empty()) {
        json tools = json::array();
        for (const auto& tool : request.tools) {
            tools.push_back(catalog::to_function_declaration(tool));
        }
        body["tools"] = std::move(tools);
        body["tool_choice"] = settings.tool_choice;
    }
    return body;
}

json build_synthesis_body(const core::config::AnalysisSettings& settings,
                          const SynthesisRequest& request) {
    json body;
    body["model"] = settings.model;
    body["temperature"] = request.temperature;
    body["messages"] = json::array({{{"role", "user"}, {"content", request.prompt}}});
    body["response_format"] = {{"type", "json_schema"},
                               {"json_schema",
                                {{"name", request.schema_name},
                                 {"strict", true},
                                 {"schema", request.schema}}}};
    return body;
}

core::errors::Result<std::vector<ToolCall>> parse_tool_calls(const json& completion) {
    auto message_result = first_message(completion);
    if (core::errors::is_error(message_result)) {
        return core::errors::get_error(message_result);
    }
    const json& message = core::errors::get_value(message_result);

    std::vector<ToolCall> calls;
    if (!message.contains("tool_calls") || message["tool_calls"].is_null()) {
        return calls;
    }
    if (!message["tool_calls"].is_array()) {
        return upstream("tool_calls is not an array.", "malformed_analysis_response");
    }

    for (const auto& entry : message["tool_calls"]) {
        if (!entry.contains("function") || !entry["function"].is_object() ||
            !entry["function"].contains("name") || !entry["function"]["name"].is_string()) {
            return upstream("Tool call without a function name: " + snippet(entry.dump()),
                            "malformed_analysis_response");
        }
        ToolCall call;
        call.name = entry["function"]["name"].get<std::string>();

        const json& function = entry["function"];
        if (function.contains("arguments") && function["arguments"].is_string()) {
            const std::string text = function["arguments"].get<std::string>();
            json arguments = text.empty() ? json::object() : json::parse(text, nullptr, false);
            if (arguments.is_discarded() || !arguments.is_object()) {
                return upstream("Invalid arguments for tool " + call.name + ": " + snippet(text),
                                "invalid_tool_arguments");
            }
            call.arguments = std::move(arguments);
        }
        calls.push_back(std::move(call));
    }
    return calls;
}

core::errors::Result<json> parse_structured_content(const json& completion) {
    auto message_result = first_message(completion);
    if (core::errors::is_error(message_result)) {
        return core::errors::get_error(message_result);
    }
    const json& message = core::errors::get_value(message_result);
    if (!message.contains("content") || !message["content"].is_string()) {
        return upstream("Analysis response has no content.", "malformed_analysis_response");
    }
    const std::string content = message["content"].get<std::string>();
    json parsed = json::parse(content, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return upstream("Analysis content is not a JSON object: " + snippet(content),
                        "schema_violation");
    }
    return parsed;
}

}  // namespace chat

ChatCompletionsEngine::ChatCompletionsEngine(core::config::AnalysisSettings settings)
    : settings_(std::move(settings)) {}

core::errors::Result<json> ChatCompletionsEngine::complete(const core::logging::RunContext& ctx,
                                                           const json& body) const {
    net::HttpRequest request;
    request.method = "POST";
    request.url = settings_.endpoint;
    request.headers = {"Content-Type: application/json",
                       "Authorization: Bearer " + settings_.api_key};
    request.body = body.dump();
    request.timeout_ms = settings_.timeout_ms;
    request.cancel_token = ctx.cancel_token;

    const auto response = net::perform(request);
    if (response.cancelled) {
        return AuditError{ErrorKind::Cancelled, "Run cancelled during analysis call.",
                          "cancelled"};
    }
    if (!response.transport_ok()) {
        return upstream("Analysis engine unreachable: " + response.error, "analysis_http_error");
    }
    if (response.status != 200) {
        return upstream("Analysis engine returned HTTP " + std::to_string(response.status) +
                            ": " + snippet(response.body),
                        "analysis_http_error");
    }
    json parsed = json::parse(response.body, nullptr, false);
    if (parsed.is_discarded()) {
        return upstream("Analysis engine returned invalid JSON: " + snippet(response.body),
                        "malformed_analysis_response");
    }
    LOG_RUN_DEBUG(ctx, "ChatCompletionsEngine: response in " +
                           std::to_string(response.latency_ms) + " ms");
    return parsed;
}

core::errors::Result<std::vector<ToolCall>> ChatCompletionsEngine::select_tools(
    const core::logging::RunContext& ctx, const ToolSelectionRequest& request) {
    auto completion = complete(ctx, chat::build_selection_body(settings_, request));
    if (core::errors::is_error(completion)) {
        return core::errors::get_error(completion);
    }
    return chat::parse_tool_calls(core::errors::get_value(completion));
}

core::errors::Result<json> ChatCompletionsEngine::synthesize(const core::logging::RunContext& ctx,
                                                             const SynthesisRequest& request) {
    auto completion = complete(ctx, chat::build_synthesis_body(settings_, request));
    if (core::errors::is_error(completion)) {
        return core::errors::get_error(completion);
    }
    return chat::parse_structured_content(core::errors::get_value(completion));
}

}  // namespace webaudit::analysis
