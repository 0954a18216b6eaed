#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/audit_errors.hpp"

namespace webaudit::bridge {

// One duplex channel to a tool backend with request/response correlation.
// Only one request is ever outstanding on a channel.
class ProtocolBridge {
public:
    virtual ~ProtocolBridge() = default;

    // Establishes the channel and performs the handshake. Calling open() on an
    // open bridge is a no-op.
    virtual core::errors::Result<bool> open() = 0;

    virtual core::errors::Result<nlohmann::json> send(const std::string& method,
                                                      const nlohmann::json& params) = 0;

    // Idempotent; safe after a failed open().
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    // Incremented by every successful open(). Lets caches detect a fresh session.
    virtual std::uint64_t session_epoch() const = 0;
};

// Scoped acquisition of a bridge: opened on construction, closed on every exit path.
class BridgeSession {
public:
    explicit BridgeSession(ProtocolBridge& bridge);
    ~BridgeSession();

    BridgeSession(const BridgeSession&) = delete;
    BridgeSession& operator=(const BridgeSession&) = delete;

    bool ok() const { return !core::errors::is_error(status_); }
    const core::errors::AuditError& error() const { return core::errors::get_error(status_); }
    ProtocolBridge& bridge() { return bridge_; }

private:
    ProtocolBridge& bridge_;
    core::errors::Result<bool> status_;
};

}  // namespace webaudit::bridge
