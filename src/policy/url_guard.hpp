#pragma once

#include <cstddef>
#include <string>
#include "core/errors/audit_errors.hpp"

namespace webaudit::policy {

struct UrlPolicy {
    std::size_t max_length = 2048;
};

// Gatekeeper for audit targets handed in from the outside.
class UrlGuard {
public:
    explicit UrlGuard(UrlPolicy url_policy = {});

    // Returns the URL unchanged when it is an absolute http(s) URL with a host.
    core::errors::Result<std::string> validate_url(const std::string& url) const;

private:
    static std::string lowercase(std::string value);

    UrlPolicy url_policy_;
};

}  // namespace webaudit::policy
