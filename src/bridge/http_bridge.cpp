#include "bridge/http_bridge.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/rpc_envelope.hpp"

namespace webaudit::bridge {

using core::errors::AuditError;
using core::errors::ErrorKind;
using nlohmann::json;
namespace rpc = protocol::rpc;

namespace {

constexpr std::size_t kSnippetLength = 200;

std::string snippet(const std::string& text) {
    if (text.size() <= kSnippetLength) {
        return text;
    }
    return text.substr(0, kSnippetLength) + "...";
}

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

AuditError transport_error(const net::HttpResponse& response, const std::string& what,
                           const ErrorKind fallback_kind, const std::string& fallback_code) {
    if (response.cancelled) {
        return AuditError{ErrorKind::Cancelled, what + ": run cancelled.", "cancelled"};
    }
    if (response.timed_out) {
        return AuditError{ErrorKind::Timeout, what + ": " + response.error, "request_timeout"};
    }
    return AuditError{fallback_kind, what + ": " + response.error, fallback_code};
}

core::errors::Result<json> parse_body(const net::HttpResponse& response) {
    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return AuditError{ErrorKind::Protocol,
                          "Malformed response from tool service: " + snippet(response.body),
                          "malformed_response"};
    }
    return body;
}

}  // namespace

namespace http {

std::string health_url(const std::string& base_url) {
    return trim_trailing_slash(base_url) + "/health";
}

std::string tools_url(const std::string& base_url) {
    return trim_trailing_slash(base_url) + "/mcp/tools";
}

std::string tool_call_url(const std::string& base_url, const std::string& tool_name) {
    return tools_url(base_url) + "/" + net::escape_segment(tool_name);
}

core::errors::Result<bool> interpret_health(const net::HttpResponse& response) {
    if (!response.transport_ok()) {
        return transport_error(response, "Tool service unreachable", ErrorKind::Connection,
                               "service_unreachable");
    }
    if (response.status != 200) {
        return AuditError{ErrorKind::Connection,
                          "Tool service is unhealthy (HTTP " +
                              std::to_string(response.status) + ")",
                          "service_unhealthy"};
    }
    auto body = parse_body(response);
    if (core::errors::is_error(body)) {
        return AuditError{ErrorKind::Connection, core::errors::get_error(body).message,
                          "service_unhealthy"};
    }
    const auto& payload = core::errors::get_value(body);
    if (!payload.contains("status") || payload["status"] != "healthy") {
        return AuditError{ErrorKind::Connection,
                          "Tool service reports status " +
                              (payload.contains("status") ? payload["status"].dump()
                                                          : std::string("<missing>")),
                          "service_unhealthy"};
    }
    return true;
}

core::errors::Result<json> interpret_tool_list(const net::HttpResponse& response) {
    if (!response.transport_ok()) {
        return transport_error(response, "Listing tools failed", ErrorKind::Protocol,
                               "no_response");
    }
    if (response.status != 200) {
        return AuditError{ErrorKind::Protocol,
                          "Listing tools failed: HTTP " + std::to_string(response.status) +
                              " - " + snippet(response.body),
                          "http_status"};
    }
    auto body = parse_body(response);
    if (core::errors::is_error(body)) {
        return core::errors::get_error(body);
    }
    const auto& payload = core::errors::get_value(body);
    if (payload.contains("error")) {
        return AuditError{ErrorKind::Protocol,
                          "Tool service error: " + payload["error"].dump(), "rpc_error"};
    }
    json result;
    result["tools"] = payload.contains("tools") ? payload["tools"] : json::array();
    return result;
}

core::errors::Result<json> interpret_tool_call(const net::HttpResponse& response,
                                               const std::string& tool_name) {
    if (!response.transport_ok()) {
        return transport_error(response, "Tool " + tool_name + " failed",
                               ErrorKind::Protocol, "no_response");
    }
    auto body = parse_body(response);
    if (response.status != 200) {
        std::string detail = snippet(response.body);
        if (!core::errors::is_error(body) &&
            core::errors::get_value(body).contains("error")) {
            detail = core::errors::get_value(body)["error"].dump();
        }
        return AuditError{ErrorKind::Protocol,
                          "Tool " + tool_name + " failed: HTTP " +
                              std::to_string(response.status) + " - " + detail,
                          "http_status"};
    }
    if (core::errors::is_error(body)) {
        return core::errors::get_error(body);
    }
    const auto& payload = core::errors::get_value(body);
    const bool has_error = payload.contains("error") && !payload["error"].is_null();
    const bool success = !has_error && payload.contains("success") &&
                         payload["success"].is_boolean() && payload["success"].get<bool>();
    if (!success) {
        const std::string error_text =
            has_error
                ? (payload["error"].is_string() ? payload["error"].get<std::string>()
                                                : payload["error"].dump())
                : std::string("Unknown error");
        return AuditError{ErrorKind::Protocol,
                          "Tool " + tool_name + " failed: " + error_text, "rpc_error"};
    }
    return payload.contains("result") ? payload["result"] : json::object();
}

}  // namespace http

HttpBridge::HttpBridge(core::config::BackendSettings settings,
                       std::shared_ptr<std::atomic_bool> cancel_token)
    : settings_(std::move(settings)), cancel_token_(std::move(cancel_token)) {}

HttpBridge::~HttpBridge() {
    close();
}

net::HttpResponse HttpBridge::request(const std::string& method, const std::string& url,
                                      const std::optional<std::string>& body) const {
    net::HttpRequest req;
    req.method = method;
    req.url = url;
    req.timeout_ms = settings_.http_timeout_ms;
    req.cancel_token = cancel_token_;
    if (body.has_value()) {
        req.headers.push_back("Content-Type: application/json");
        req.body = body;
    }
    return net::perform(req);
}

core::errors::Result<bool> HttpBridge::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) {
        return true;
    }

    net::HttpRequest probe;
    probe.url = http::health_url(settings_.service_url);
    probe.timeout_ms = settings_.startup_timeout_ms;
    probe.cancel_token = cancel_token_;
    auto healthy = http::interpret_health(net::perform(probe));
    if (core::errors::is_error(healthy)) {
        auto err = core::errors::get_error(healthy);
        if (err.kind == ErrorKind::Timeout) {
            err.kind = ErrorKind::Connection;
            err.code = "service_unreachable";
        }
        return err;
    }

    open_ = true;
    ++epoch_;
    next_id_ = 1;
    LOG_INFO("HttpBridge: connected to tool service " + settings_.service_url);
    return true;
}

core::errors::Result<json> HttpBridge::send(const std::string& method, const json& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return AuditError{ErrorKind::Protocol, "Tool service session is not open.",
                          "channel_not_open"};
    }
    const std::int64_t id = next_id_++;
    LOG_DEBUG("HttpBridge: -> " + method + " (id " + std::to_string(id) + ")");

    if (method == rpc::kMethodInitialize) {
        return json::object();
    }
    if (method == rpc::kMethodListTools) {
        return http::interpret_tool_list(
            request("GET", http::tools_url(settings_.service_url), std::nullopt));
    }
    if (method == rpc::kMethodCallTool) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return AuditError{ErrorKind::Protocol, "tools/call requires a tool name.",
                              "malformed_request"};
        }
        const std::string name = params["name"].get<std::string>();
        json body;
        body["arguments"] = params.contains("arguments") ? params["arguments"] : json::object();
        return http::interpret_tool_call(
            request("POST", http::tool_call_url(settings_.service_url, name), body.dump()),
            name);
    }
    return AuditError{ErrorKind::Protocol, "Unsupported method over HTTP: " + method,
                      "unsupported_method"};
}

void HttpBridge::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) {
        LOG_DEBUG("HttpBridge: session closed");
    }
    open_ = false;
}

bool HttpBridge::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::uint64_t HttpBridge::session_epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

}  // namespace webaudit::bridge
