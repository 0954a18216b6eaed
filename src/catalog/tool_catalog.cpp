#include "catalog/tool_catalog.hpp"

#include "core/logging/logger.hpp"
#include "protocol/rpc_envelope.hpp"

namespace webaudit::catalog {

using core::errors::AuditError;
using core::errors::ErrorKind;
using nlohmann::json;
using protocol::ToolDefinition;

std::vector<ToolDefinition> parse_tool_definitions(const json& list_result) {
    std::vector<ToolDefinition> tools;
    if (!list_result.is_object() || !list_result.contains("tools") ||
        !list_result["tools"].is_array()) {
        return tools;
    }

    for (const auto& entry : list_result["tools"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            LOG_WARN("ToolCatalog: skipping tool entry without a name: " + entry.dump());
            continue;
        }
        ToolDefinition tool;
        tool.name = entry["name"].get<std::string>();
        if (entry.contains("description") && entry["description"].is_string()) {
            tool.description = entry["description"].get<std::string>();
        }
        if (entry.contains("inputSchema") && entry["inputSchema"].is_object()) {
            tool.input_schema = entry["inputSchema"];
        } else {
            tool.input_schema = {{"type", "object"}, {"properties", json::object()}};
        }
        tools.push_back(std::move(tool));
    }
    return tools;
}

json to_function_declaration(const ToolDefinition& tool) {
    json declaration;
    declaration["type"] = "function";
    declaration["function"] = {{"name", tool.name},
                               {"description", tool.description},
                               {"parameters", tool.input_schema}};
    return declaration;
}

ToolCatalog::ToolCatalog(bridge::ProtocolBridge& bridge) : bridge_(bridge) {}

core::errors::Result<std::vector<ToolDefinition>> ToolCatalog::list_tools() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!bridge_.is_open()) {
        auto opened = bridge_.open();
        if (core::errors::is_error(opened)) {
            return core::errors::get_error(opened);
        }
    }

    const std::uint64_t epoch = bridge_.session_epoch();
    if (cache_.has_value() && cached_epoch_ == epoch) {
        return cache_.value();
    }

    ++round_trips_;
    auto listed = bridge_.send(protocol::rpc::kMethodListTools, json::object());
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }

    const auto& result = core::errors::get_value(listed);
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return AuditError{ErrorKind::Protocol, "tools/list result has no tools array.",
                          "malformed_response"};
    }

    cache_ = parse_tool_definitions(result);
    cached_epoch_ = epoch;
    LOG_INFO("ToolCatalog: backend offers " + std::to_string(cache_->size()) + " tools");
    return cache_.value();
}

core::errors::Result<std::vector<ToolDefinition>> ToolCatalog::essential_subset(
    const std::unordered_set<std::string>& names) {
    auto listed = list_tools();
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }

    std::vector<ToolDefinition> subset;
    for (const auto& tool : core::errors::get_value(listed)) {
        if (names.count(tool.name) > 0) {
            subset.push_back(tool);
        }
    }
    LOG_DEBUG("ToolCatalog: essential subset has " + std::to_string(subset.size()) + " of " +
              std::to_string(names.size()) + " configured tools");
    return subset;
}

std::size_t ToolCatalog::backend_round_trips() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return round_trips_;
}

}  // namespace webaudit::catalog
