#pragma once

#include <atomic>
#include <memory>
#include "bridge/protocol_bridge.hpp"
#include "core/config/audit_settings.hpp"

namespace webaudit::bridge {

// One fresh bridge per run; the transport comes from configuration only.
std::unique_ptr<ProtocolBridge> make_bridge(
    const core::config::BackendSettings& settings,
    std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

}  // namespace webaudit::bridge
