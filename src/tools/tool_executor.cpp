#include "tools/tool_executor.hpp"

#include <chrono>
#include <cstdio>

namespace webaudit::tools {

using nlohmann::json;
using protocol::ToolCall;
using protocol::ToolResult;

namespace {

ToolResult failed_result(const std::string& name, const std::string& message,
                         const double duration_ms) {
    ToolResult result;
    result.name = name;
    result.success = false;
    result.error_message = message;
    result.payload = make_error_marker(name, message);
    result.duration_ms = duration_ms;
    return result;
}

// Failures of the transport rather than of the tool: the channel can no longer
// be trusted for the calls that follow.
bool breaks_channel(const core::errors::AuditError& err) {
    using core::errors::ErrorKind;
    switch (err.kind) {
        case ErrorKind::Timeout:
        case ErrorKind::Connection:
        case ErrorKind::Cancelled:
            return true;
        case ErrorKind::Protocol:
            return err.code == "channel_not_open" || err.code == "channel_write_failed" ||
                   err.code == "no_response" || err.code == "correlation_mismatch" ||
                   err.code == "malformed_response";
        default:
            return false;
    }
}

std::string format_seconds(const double duration_ms) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2fs", duration_ms / 1000.0);
    return buffer;
}

}  // namespace

json make_error_marker(const std::string& tool_name, const std::string& message) {
    return json{{"error", message}, {"tool", tool_name}};
}

ToolExecutor::ToolExecutor(const ToolRegistry& registry) : registry_(registry) {}

ToolResult ToolExecutor::execute(const core::logging::RunContext& ctx,
                                 const ToolCall& call) const {
    LOG_RUN_INFO(ctx, "[tool=" + call.name + "] Tool execution started");
    LOG_RUN_DEBUG(ctx, "[tool=" + call.name + "] Arguments: " + call.arguments.dump());

    const ToolInvoker* invoker = registry_.find(call.name);
    if (invoker == nullptr) {
        LOG_RUN_WARN(ctx, "[tool=" + call.name + "] Not an available tool");
        return failed_result(call.name, "Unknown tool: " + call.name, 0.0);
    }
    if (!call.arguments.is_object()) {
        LOG_RUN_WARN(ctx, "[tool=" + call.name + "] Arguments are not an object");
        return failed_result(call.name, "Tool arguments must be a JSON object.", 0.0);
    }

    const auto started = std::chrono::steady_clock::now();
    auto outcome = (*invoker)(call.arguments);
    const double elapsed_ms = std::chrono::duration<double, std::milli>(
                                  std::chrono::steady_clock::now() - started)
                                  .count();

    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        LOG_RUN_ERROR(ctx, "[tool=" + call.name + "] Tool execution failed [" + err.code +
                               "]: " + err.message);
        ToolResult failed = failed_result(call.name, err.message, elapsed_ms);
        if (breaks_channel(err)) {
            failed.channel_failure = err;
        }
        return failed;
    }

    ToolResult result;
    result.name = call.name;
    result.success = true;
    result.payload = core::errors::get_value(outcome);
    result.duration_ms = elapsed_ms;
    LOG_RUN_INFO(ctx, "[tool=" + call.name + "] Tool completed in " + format_seconds(elapsed_ms));
    return result;
}

}  // namespace webaudit::tools
