#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/audit_errors.hpp"
#include "protocol/rpc_envelope.hpp"

namespace {

using nlohmann::json;
using webaudit::core::errors::ErrorKind;
using webaudit::core::errors::get_error;
using webaudit::core::errors::get_value;
using webaudit::core::errors::is_error;
namespace rpc = webaudit::protocol::rpc;

TEST(RpcEnvelopeTest, RequestCarriesTagIdMethodAndParams) {
    const json request = rpc::make_request(7, rpc::kMethodCallTool,
                                           {{"name", "navigate_page"}, {"arguments", json::object()}});
    EXPECT_EQ(request["jsonrpc"], "2.0");
    EXPECT_EQ(request["id"], 7);
    EXPECT_EQ(request["method"], "tools/call");
    EXPECT_EQ(request["params"]["name"], "navigate_page");
    // Sorted keys put the id first on the wire
    EXPECT_EQ(request.dump().rfind("{\"id\":7", 0), 0u);
}

TEST(RpcEnvelopeTest, NotificationHasNoId) {
    const json note = rpc::make_notification(rpc::kMethodInitialized);
    EXPECT_FALSE(note.contains("id"));
    EXPECT_EQ(note["method"], "notifications/initialized");
}

TEST(RpcEnvelopeTest, DecodesNotification) {
    auto decoded =
        rpc::decode_line(R"({"jsonrpc":"2.0","method":"notifications/message","params":{}})");
    ASSERT_FALSE(is_error(decoded));
    EXPECT_TRUE(get_value(decoded).is_notification());
}

TEST(RpcEnvelopeTest, RejectsMalformedLine) {
    auto decoded = rpc::decode_line("Starting chrome...");
    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).kind, ErrorKind::Protocol);
    EXPECT_EQ(get_error(decoded).code, "malformed_response");
}

TEST(RpcEnvelopeTest, ExtractsMatchingResult) {
    auto decoded = rpc::decode_line(R"({"jsonrpc":"2.0","id":3,"result":{"tools":[]}})");
    ASSERT_FALSE(is_error(decoded));
    auto result = rpc::extract_result(get_value(decoded), 3);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).contains("tools"));
}

TEST(RpcEnvelopeTest, MissingResultIsEmptyObject) {
    auto decoded = rpc::decode_line(R"({"jsonrpc":"2.0","id":1})");
    ASSERT_FALSE(is_error(decoded));
    auto result = rpc::extract_result(get_value(decoded), 1);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).is_object());
    EXPECT_TRUE(get_value(result).empty());
}

TEST(RpcEnvelopeTest, MismatchedIdIsCorrelationError) {
    auto decoded = rpc::decode_line(R"({"jsonrpc":"2.0","id":4,"result":{}})");
    ASSERT_FALSE(is_error(decoded));
    auto result = rpc::extract_result(get_value(decoded), 5);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Protocol);
    EXPECT_EQ(get_error(result).code, "correlation_mismatch");
}

TEST(RpcEnvelopeTest, ErrorMemberWinsOverResult) {
    auto decoded = rpc::decode_line(
        R"({"jsonrpc":"2.0","id":2,"result":{},"error":{"code":-32602,"message":"Invalid params"}})");
    ASSERT_FALSE(is_error(decoded));
    auto result = rpc::extract_result(get_value(decoded), 2);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "rpc_error");
    EXPECT_NE(get_error(result).message.find("Invalid params"), std::string::npos);
    EXPECT_NE(get_error(result).message.find("-32602"), std::string::npos);
}

TEST(RpcEnvelopeTest, MissingProtocolTagIsMalformed) {
    auto decoded = rpc::decode_line(R"({"id":1,"result":{}})");
    ASSERT_FALSE(is_error(decoded));
    auto result = rpc::extract_result(get_value(decoded), 1);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "malformed_response");
}

TEST(RpcEnvelopeTest, NullIdErrorKeepsBackendMessage) {
    auto decoded = rpc::decode_line(
        R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
    ASSERT_FALSE(is_error(decoded));
    auto result = rpc::extract_result(get_value(decoded), 3);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "rpc_error");
    EXPECT_NE(get_error(result).message.find("Parse error"), std::string::npos);
}

TEST(RpcEnvelopeTest, ResponseWithoutIdOrErrorIsMalformed) {
    auto decoded = rpc::decode_line(R"({"jsonrpc":"2.0","result":{}})");
    ASSERT_FALSE(is_error(decoded));
    auto result = rpc::extract_result(get_value(decoded), 3);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "malformed_response");
}

}  // namespace
