#include "tools/tool_registry.hpp"

#include <utility>
#include "protocol/rpc_envelope.hpp"

namespace webaudit::tools {

using nlohmann::json;

void ToolRegistry::register_tool(const std::string& name, ToolInvoker invoker) {
    invokers_[name] = std::move(invoker);
}

const ToolInvoker* ToolRegistry::find(const std::string& name) const {
    const auto it = invokers_.find(name);
    return it == invokers_.end() ? nullptr : &it->second;
}

bool ToolRegistry::contains(const std::string& name) const {
    return invokers_.count(name) > 0;
}

std::size_t ToolRegistry::size() const {
    return invokers_.size();
}

ToolRegistry ToolRegistry::for_bridge(const std::vector<protocol::ToolDefinition>& tools,
                                      bridge::ProtocolBridge& bridge) {
    ToolRegistry registry;
    for (const auto& tool : tools) {
        const std::string name = tool.name;
        registry.register_tool(name, [&bridge, name](const json& arguments) {
            json params;
            params["name"] = name;
            params["arguments"] = arguments;
            return bridge.send(protocol::rpc::kMethodCallTool, params);
        });
    }
    return registry;
}

}  // namespace webaudit::tools
