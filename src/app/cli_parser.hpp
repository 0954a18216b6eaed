#pragma once
#include "core/config/audit_settings.hpp"
#include "core/errors/audit_errors.hpp"
#include "protocol/audit_request.hpp"

namespace webaudit::app::cli {
    // `base` carries the settings known before the command line is read (defaults plus environment).
    webaudit::core::errors::Result<webaudit::protocol::AuditRequest> parse_and_validate(
        int argc, char* argv[], webaudit::core::config::AuditSettings base = {});
}
