#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "bridge/protocol_bridge.hpp"
#include "core/errors/audit_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace webaudit::catalog {

// Tools discovered from the backend once per bridge session.
class ToolCatalog {
public:
    explicit ToolCatalog(bridge::ProtocolBridge& bridge);

    // Opens the bridge if needed. Only the first call of a session reaches the backend.
    core::errors::Result<std::vector<protocol::ToolDefinition>> list_tools();

    // Catalog order is kept; configured names the backend does not offer are dropped.
    core::errors::Result<std::vector<protocol::ToolDefinition>> essential_subset(
        const std::unordered_set<std::string>& names);

    std::size_t backend_round_trips() const;

private:
    bridge::ProtocolBridge& bridge_;
    mutable std::mutex mutex_;
    std::optional<std::vector<protocol::ToolDefinition>> cache_;
    std::uint64_t cached_epoch_ = 0;
    std::size_t round_trips_ = 0;
};

std::vector<protocol::ToolDefinition> parse_tool_definitions(const nlohmann::json& list_result);

// {"type":"function","function":{name, description, parameters}}
nlohmann::json to_function_declaration(const protocol::ToolDefinition& tool);

}  // namespace webaudit::catalog
