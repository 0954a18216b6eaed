#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "bridge/protocol_bridge.hpp"
#include "core/errors/audit_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace webaudit::tools {

using ToolInvoker =
    std::function<core::errors::Result<nlohmann::json>(const nlohmann::json& arguments)>;

// Maps a tool name to a uniform invoker.
class ToolRegistry {
public:
    void register_tool(const std::string& name, ToolInvoker invoker);

    const ToolInvoker* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::size_t size() const;

    // Every tool is bound to tools/call on `bridge`, which must outlive the registry.
    static ToolRegistry for_bridge(const std::vector<protocol::ToolDefinition>& tools,
                                   bridge::ProtocolBridge& bridge);

private:
    std::unordered_map<std::string, ToolInvoker> invokers_;
};

}  // namespace webaudit::tools
