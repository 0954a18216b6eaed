#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/audit_errors.hpp"

namespace webaudit::protocol::rpc {

inline constexpr const char* kProtocolTag = "2.0";

inline constexpr const char* kMethodInitialize = "initialize";
inline constexpr const char* kMethodInitialized = "notifications/initialized";
inline constexpr const char* kMethodListTools = "tools/list";
inline constexpr const char* kMethodCallTool = "tools/call";

// One decoded line from the backend. Notifications carry a method and no id.
struct IncomingMessage {
    std::optional<std::int64_t> id;
    std::optional<std::string> method;
    nlohmann::json body;

    bool is_notification() const { return !id.has_value() && method.has_value(); }
};

nlohmann::json make_request(std::int64_t id, const std::string& method,
                            const nlohmann::json& params);

nlohmann::json make_notification(const std::string& method,
                                 const nlohmann::json& params = nlohmann::json::object());

core::errors::Result<IncomingMessage> decode_line(const std::string& line);

// Validates a response envelope against the outstanding request id and returns
// its result. An "error" member always wins over "result".
core::errors::Result<nlohmann::json> extract_result(const IncomingMessage& message,
                                                    std::int64_t expected_id);

}  // namespace webaudit::protocol::rpc
