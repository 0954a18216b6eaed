#include "bridge/bridge_factory.hpp"

#include <utility>
#include "bridge/http_bridge.hpp"
#include "bridge/stdio_bridge.hpp"

namespace webaudit::bridge {

std::unique_ptr<ProtocolBridge> make_bridge(const core::config::BackendSettings& settings,
                                            std::shared_ptr<std::atomic_bool> cancel_token) {
    switch (settings.transport) {
        case core::config::TransportKind::Http:
            return std::make_unique<HttpBridge>(settings, std::move(cancel_token));
        case core::config::TransportKind::Stdio:
        default:
            return std::make_unique<StdioBridge>(settings, std::move(cancel_token));
    }
}

}  // namespace webaudit::bridge
