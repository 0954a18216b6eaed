#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "bridge/protocol_bridge.hpp"
#include "core/errors/audit_errors.hpp"

namespace webaudit::test_support {

// In-process bridge answering through a handler; records every method it sees.
class FakeBridge : public bridge::ProtocolBridge {
public:
    using Handler = std::function<core::errors::Result<nlohmann::json>(
        const std::string& method, const nlohmann::json& params)>;

    explicit FakeBridge(Handler handler) : handler_(std::move(handler)) {}

    core::errors::Result<bool> open() override {
        ++open_calls;
        if (open_error.has_value()) {
            return open_error.value();
        }
        if (!open_) {
            open_ = true;
            ++epoch_;
        }
        return true;
    }

    core::errors::Result<nlohmann::json> send(const std::string& method,
                                              const nlohmann::json& params) override {
        sent.push_back(method);
        if (!open_) {
            return core::errors::AuditError{core::errors::ErrorKind::Protocol, "not open",
                                            "channel_not_open"};
        }
        return handler_(method, params);
    }

    void close() override {
        ++close_calls;
        open_ = false;
    }

    bool is_open() const override { return open_; }
    std::uint64_t session_epoch() const override { return epoch_; }

    std::optional<core::errors::AuditError> open_error;
    std::vector<std::string> sent;
    int open_calls = 0;
    int close_calls = 0;

private:
    Handler handler_;
    bool open_ = false;
    std::uint64_t epoch_ = 0;
};

// Non-owning handle so a test can inspect a bridge after the pipeline released it.
class BridgeRef : public bridge::ProtocolBridge {
public:
    explicit BridgeRef(bridge::ProtocolBridge& target) : target_(target) {}

    core::errors::Result<bool> open() override { return target_.open(); }
    core::errors::Result<nlohmann::json> send(const std::string& method,
                                              const nlohmann::json& params) override {
        return target_.send(method, params);
    }
    void close() override { target_.close(); }
    bool is_open() const override { return target_.is_open(); }
    std::uint64_t session_epoch() const override { return target_.session_epoch(); }

private:
    bridge::ProtocolBridge& target_;
};

inline nlohmann::json tool_entry(const std::string& name) {
    return {{"name", name},
            {"description", name + " tool"},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}}};
}

}  // namespace webaudit::test_support
