#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace webaudit::analysis::prompts {

// System prompt giving the engine its web audit expert persona.
std::string audit_expert();

// Asks for tool calls auditing `url`, in execution order.
std::string tool_selection(const std::string& url);

// `tool_results` are listed in the order given, which should be execution order.
std::string technical_report(const std::string& url,
                             const std::vector<protocol::ToolResult>& tool_results);

std::string executive_summary(const nlohmann::json& technical_report);

}  // namespace webaudit::analysis::prompts
