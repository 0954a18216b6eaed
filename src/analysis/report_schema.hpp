#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/audit_errors.hpp"

namespace webaudit::analysis::schema {

inline constexpr const char* kTechnicalReportName = "audit_response";
inline constexpr const char* kExecutiveSummaryName = "executive_summary";

// Strict JSON schemas handed to the analysis engine as the output format.
const nlohmann::json& technical_report();
const nlohmann::json& executive_summary();

// Structural check of engine output. Optional fields may be absent, but must
// have the right type when present.
core::errors::Result<bool> validate_technical_report(const nlohmann::json& report);
core::errors::Result<bool> validate_executive_summary(const nlohmann::json& summary);

}  // namespace webaudit::analysis::schema
