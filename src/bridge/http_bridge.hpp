#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "bridge/protocol_bridge.hpp"
#include "core/config/audit_settings.hpp"
#include "net/http_client.hpp"

namespace webaudit::bridge {

// The same tool operations against a long-lived HTTP tool service:
// GET /health, GET /mcp/tools, POST /mcp/tools/{name}.
class HttpBridge : public ProtocolBridge {
public:
    explicit HttpBridge(core::config::BackendSettings settings,
                        std::shared_ptr<std::atomic_bool> cancel_token = nullptr);
    ~HttpBridge() override;

    core::errors::Result<bool> open() override;
    core::errors::Result<nlohmann::json> send(const std::string& method,
                                              const nlohmann::json& params) override;
    void close() override;
    bool is_open() const override;
    std::uint64_t session_epoch() const override;

private:
    net::HttpResponse request(const std::string& method, const std::string& url,
                              const std::optional<std::string>& body) const;

    core::config::BackendSettings settings_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
    mutable std::mutex mutex_;
    bool open_ = false;
    std::uint64_t epoch_ = 0;
    std::int64_t next_id_ = 1;
};

namespace http {

std::string health_url(const std::string& base_url);
std::string tools_url(const std::string& base_url);
std::string tool_call_url(const std::string& base_url, const std::string& tool_name);

core::errors::Result<bool> interpret_health(const net::HttpResponse& response);
core::errors::Result<nlohmann::json> interpret_tool_list(const net::HttpResponse& response);
core::errors::Result<nlohmann::json> interpret_tool_call(const net::HttpResponse& response,
                                                         const std::string& tool_name);

}  // namespace http

}  // namespace webaudit::bridge
