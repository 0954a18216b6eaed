#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/audit_errors.hpp"

namespace webaudit::protocol {

    // A backend operation as advertised by tools/list
    struct ToolDefinition {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
    };

    // How the analysis engine asks the executor to run something
    struct ToolCall {
        std::string name;                                       // e.g. "navigate_page"
        nlohmann::json arguments = nlohmann::json::object();
    };

    // How the executor replies back. A failed tool is still a result.
    struct ToolResult {
        std::string name;
        bool success = false;
        nlohmann::json payload;      // raw tool output, or {"error": ..., "tool": ...}
        std::string error_message;
        double duration_ms = 0.0;
        // Set when the channel itself broke (timeout, lost backend); the run cannot go on.
        std::optional<core::errors::AuditError> channel_failure;
    };

} // namespace webaudit::protocol
