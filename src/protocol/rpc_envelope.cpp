#include "protocol/rpc_envelope.hpp"

namespace webaudit::protocol::rpc {

using core::errors::AuditError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

constexpr std::size_t kSnippetLength = 200;

std::string snippet(const std::string& text) {
    if (text.size() <= kSnippetLength) {
        return text;
    }
    return text.substr(0, kSnippetLength) + "...";
}

std::string describe_error(const json& error) {
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        std::string text = error["message"].get<std::string>();
        if (error.contains("code") && error["code"].is_number_integer()) {
            text += " (code " + std::to_string(error["code"].get<std::int64_t>()) + ")";
        }
        return text;
    }
    return error.dump();
}

}  // namespace

json make_request(const std::int64_t id, const std::string& method, const json& params) {
    json envelope;
    envelope["jsonrpc"] = kProtocolTag;
    envelope["id"] = id;
    envelope["method"] = method;
    envelope["params"] = params;
    return envelope;
}

json make_notification(const std::string& method, const json& params) {
    json envelope;
    envelope["jsonrpc"] = kProtocolTag;
    envelope["method"] = method;
    envelope["params"] = params;
    return envelope;
}

core::errors::Result<IncomingMessage> decode_line(const std::string& line) {
    json body = json::parse(line, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return AuditError{ErrorKind::Protocol,
                          "Malformed message from tool backend: " + snippet(line),
                          "malformed_response"};
    }

    IncomingMessage message;
    if (body.contains("id") && !body["id"].is_null()) {
        if (!body["id"].is_number_integer()) {
            return AuditError{ErrorKind::Protocol,
                              "Response id is not an integer: " + body["id"].dump(),
                              "malformed_response"};
        }
        message.id = body["id"].get<std::int64_t>();
    }
    if (body.contains("method") && body["method"].is_string()) {
        message.method = body["method"].get<std::string>();
    }
    message.body = std::move(body);
    return message;
}

core::errors::Result<json> extract_result(const IncomingMessage& message,
                                          const std::int64_t expected_id) {
    const json& body = message.body;
    if (!body.contains("jsonrpc") || body["jsonrpc"] != kProtocolTag) {
        return AuditError{ErrorKind::Protocol,
                          "Response is missing the protocol tag.",
                          "malformed_response"};
    }
    if (!message.id.has_value()) {
        // Errors the backend cannot attribute to a request (parse errors) have a null id.
        if (body.contains("error")) {
            return AuditError{ErrorKind::Protocol,
                              "Tool backend error: " + describe_error(body["error"]),
                              "rpc_error"};
        }
        return AuditError{ErrorKind::Protocol, "Response carries no id.",
                          "malformed_response"};
    }
    if (message.id.value() != expected_id) {
        return AuditError{ErrorKind::Protocol,
                          "Response id " + std::to_string(message.id.value()) +
                              " does not match request id " +
                              std::to_string(expected_id),
                          "correlation_mismatch"};
    }
    if (body.contains("error")) {
        return AuditError{ErrorKind::Protocol,
                          "Tool backend error: " + describe_error(body["error"]),
                          "rpc_error"};
    }
    if (!body.contains("result")) {
        return json::object();
    }
    return body["result"];
}

}  // namespace webaudit::protocol::rpc
