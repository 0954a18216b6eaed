#include "policy/url_guard.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <utility>

namespace webaudit::policy {

using core::errors::AuditError;
using core::errors::ErrorKind;

UrlGuard::UrlGuard(UrlPolicy url_policy) : url_policy_(std::move(url_policy)) {}

std::string UrlGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Result<std::string> UrlGuard::validate_url(const std::string& url) const {
    if (url.empty()) {
        return AuditError{ErrorKind::Validation, "URL must not be empty.", "empty_url"};
    }
    if (url.size() > url_policy_.max_length) {
        return AuditError{ErrorKind::Validation,
                          "URL exceeds " + std::to_string(url_policy_.max_length) +
                              " characters.",
                          "url_too_long"};
    }
    for (const unsigned char c : url) {
        if (std::isspace(c) || std::iscntrl(c)) {
            return AuditError{ErrorKind::Validation,
                              "URL contains whitespace or control characters.",
                              "invalid_url_character"};
        }
    }

    const auto scheme_end = url.find("://");
    const std::string scheme =
        scheme_end == std::string::npos ? "" : lowercase(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return AuditError{ErrorKind::Validation,
                          "Only http and https URLs can be audited: " + url,
                          "invalid_url_scheme",
                          "Prefix the address with https://"};
    }

    const std::size_t authority_begin = scheme_end + 3;
    const std::size_t authority_end = url.find_first_of("/?#", authority_begin);
    std::string authority = url.substr(
        authority_begin,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_begin);

    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string host = authority;
    std::string port;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return AuditError{ErrorKind::Validation, "Unterminated IPv6 host: " + url,
                              "missing_host"};
        }
        host = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return AuditError{ErrorKind::Validation, "Malformed host: " + url,
                                  "missing_host"};
            }
            port = authority.substr(close + 2);
            if (port.empty()) {
                return AuditError{ErrorKind::Validation, "Empty port in URL: " + url,
                                  "invalid_port"};
            }
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
            if (port.empty()) {
                return AuditError{ErrorKind::Validation, "Empty port in URL: " + url,
                                  "invalid_port"};
            }
        }
    }

    if (host.empty() || host == "[]") {
        return AuditError{ErrorKind::Validation, "URL has no host: " + url, "missing_host"};
    }

    if (!port.empty()) {
        unsigned int value = 0;
        const char* begin = port.data();
        const char* end = port.data() + port.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end || value == 0 || value > 65535) {
            return AuditError{ErrorKind::Validation, "Invalid port in URL: " + url,
                              "invalid_port"};
        }
    }

    return url;
}

}  // namespace webaudit::policy
