#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace webaudit::net {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::optional<std::string> body;
    std::uint32_t timeout_ms = 60000;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct HttpResponse {
    long status = -1;
    long latency_ms = -1;
    std::string body;
    std::string error;      // transport failure text, empty when the exchange completed
    bool timed_out = false;
    bool cancelled = false;

    bool transport_ok() const { return error.empty(); }
};

HttpResponse perform(const HttpRequest& request);

// Percent-encodes a single path segment.
std::string escape_segment(const std::string& segment);

}  // namespace webaudit::net
