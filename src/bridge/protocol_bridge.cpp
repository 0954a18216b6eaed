#include "bridge/protocol_bridge.hpp"

namespace webaudit::bridge {

BridgeSession::BridgeSession(ProtocolBridge& bridge)
    : bridge_(bridge), status_(bridge.open()) {}

BridgeSession::~BridgeSession() {
    bridge_.close();
}

}  // namespace webaudit::bridge
