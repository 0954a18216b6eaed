#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/audit_settings.hpp"

namespace webaudit::protocol {

    // Validated CLI input required to start one or more audit runs
    struct AuditRequest {
        std::vector<std::string> urls;
        core::config::AuditSettings settings;
        std::optional<std::filesystem::path> output_file;
        bool verbose = false;
    };

} // namespace webaudit::protocol
