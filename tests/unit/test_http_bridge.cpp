#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "bridge/bridge_factory.hpp"
#include "bridge/http_bridge.hpp"
#include "core/errors/audit_errors.hpp"
#include "net/http_client.hpp"
#include "protocol/rpc_envelope.hpp"

namespace {

using nlohmann::json;
using webaudit::bridge::HttpBridge;
using webaudit::core::errors::ErrorKind;
using webaudit::core::errors::get_error;
using webaudit::core::errors::get_value;
using webaudit::core::errors::is_error;
using webaudit::net::HttpResponse;
namespace http = webaudit::bridge::http;

HttpResponse response(long status, const std::string& body) {
    HttpResponse r;
    r.status = status;
    r.latency_ms = 3;
    r.body = body;
    return r;
}

TEST(HttpBridgeTest, BuildsServiceUrls) {
    EXPECT_EQ(http::health_url("http://chrome-mcp:3001/"), "http://chrome-mcp:3001/health");
    EXPECT_EQ(http::tools_url("http://chrome-mcp:3001"), "http://chrome-mcp:3001/mcp/tools");
    EXPECT_EQ(http::tool_call_url("http://chrome-mcp:3001", "navigate_page"),
              "http://chrome-mcp:3001/mcp/tools/navigate_page");
    EXPECT_EQ(http::tool_call_url("http://h", "a b/c"), "http://h/mcp/tools/a%20b%2Fc");
}

TEST(HttpBridgeTest, HealthyServicePasses) {
    EXPECT_FALSE(is_error(http::interpret_health(response(200, R"({"status":"healthy"})"))));
}

TEST(HttpBridgeTest, UnhealthyServiceIsConnectionError) {
    auto result = http::interpret_health(response(200, R"({"status":"degraded"})"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Connection);
    EXPECT_EQ(get_error(result).code, "service_unhealthy");

    auto down = http::interpret_health(response(503, ""));
    ASSERT_TRUE(is_error(down));
    EXPECT_EQ(get_error(down).code, "service_unhealthy");
}

TEST(HttpBridgeTest, ToolListIsNormalizedToToolsArray) {
    auto listed = http::interpret_tool_list(
        response(200, R"({"tools":[{"name":"take_snapshot","description":"","inputSchema":{}}]})"));
    ASSERT_FALSE(is_error(listed));
    ASSERT_EQ(get_value(listed)["tools"].size(), 1u);

    auto empty = http::interpret_tool_list(response(200, "{}"));
    ASSERT_FALSE(is_error(empty));
    EXPECT_TRUE(get_value(empty)["tools"].empty());
}

TEST(HttpBridgeTest, ToolListHttpErrorIsProtocolError) {
    auto listed = http::interpret_tool_list(response(500, "boom"));
    ASSERT_TRUE(is_error(listed));
    EXPECT_EQ(get_error(listed).kind, ErrorKind::Protocol);
    EXPECT_EQ(get_error(listed).code, "http_status");
}

TEST(HttpBridgeTest, SuccessfulToolCallReturnsResult) {
    auto called = http::interpret_tool_call(
        response(200, R"({"success":true,"result":{"content":[]},"error":null})"), "navigate_page");
    ASSERT_FALSE(is_error(called));
    EXPECT_TRUE(get_value(called).contains("content"));
}

TEST(HttpBridgeTest, FailedToolCallCarriesServiceError) {
    auto called = http::interpret_tool_call(
        response(200, R"({"success":false,"result":null,"error":"Navigation timeout"})"),
        "navigate_page");
    ASSERT_TRUE(is_error(called));
    EXPECT_EQ(get_error(called).code, "rpc_error");
    EXPECT_NE(get_error(called).message.find("Navigation timeout"), std::string::npos);
}

TEST(HttpBridgeTest, ErrorFieldWinsOverSuccessFlag) {
    auto called = http::interpret_tool_call(
        response(200, R"({"success":true,"result":{},"error":"partial failure"})"), "take_snapshot");
    ASSERT_TRUE(is_error(called));
    EXPECT_EQ(get_error(called).code, "rpc_error");
}

TEST(HttpBridgeTest, MalformedToolCallBodyIsProtocolError) {
    auto called = http::interpret_tool_call(response(200, "<html>"), "take_snapshot");
    ASSERT_TRUE(is_error(called));
    EXPECT_EQ(get_error(called).code, "malformed_response");
}

TEST(HttpBridgeTest, TimedOutTransportIsTimeout) {
    HttpResponse r;
    r.error = "Operation timed out";
    r.timed_out = true;
    auto called = http::interpret_tool_call(r, "take_snapshot");
    ASSERT_TRUE(is_error(called));
    EXPECT_EQ(get_error(called).kind, ErrorKind::Timeout);
}

TEST(HttpBridgeTest, UnreachableServiceFailsOpen) {
    webaudit::core::config::BackendSettings settings;
    settings.transport = webaudit::core::config::TransportKind::Http;
    settings.service_url = "http://127.0.0.1:1";
    settings.startup_timeout_ms = 2000;

    auto bridge = webaudit::bridge::make_bridge(settings);
    ASSERT_NE(dynamic_cast<HttpBridge*>(bridge.get()), nullptr);
    auto opened = bridge->open();
    ASSERT_TRUE(is_error(opened));
    EXPECT_EQ(get_error(opened).kind, ErrorKind::Connection);
    EXPECT_FALSE(bridge->is_open());

    auto listed = bridge->send(webaudit::protocol::rpc::kMethodListTools, json::object());
    ASSERT_TRUE(is_error(listed));
    EXPECT_EQ(get_error(listed).code, "channel_not_open");
}

}  // namespace
