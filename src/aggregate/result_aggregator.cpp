#include "aggregate/result_aggregator.hpp"

#include <cmath>
#include <optional>
#include <string>
#include "core/config/ids.hpp"

namespace webaudit::aggregate {

using core::errors::AuditError;
using core::errors::ErrorKind;
using nlohmann::json;
using protocol::AuditRecord;

namespace {

std::string string_or(const json& obj, const char* key, const std::string& fallback) {
    if (obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return fallback;
}

std::optional<double> number_or_null(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_number()) {
        return obj[key].get<double>();
    }
    return std::nullopt;
}

std::optional<int> integer_or_null(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_number()) {
        return static_cast<int>(std::lround(obj[key].get<double>()));
    }
    return std::nullopt;
}

protocol::PerformanceSection read_performance(const json& report) {
    protocol::PerformanceSection performance;
    if (!report.contains("performance") || !report["performance"].is_object()) {
        return performance;
    }
    const json& section = report["performance"];
    performance.lighthouse_score = integer_or_null(section, "lighthouse_score");
    if (section.contains("core_web_vitals") && section["core_web_vitals"].is_object()) {
        performance.core_web_vitals = section["core_web_vitals"];
    }
    performance.ttfb = number_or_null(section, "ttfb");
    performance.fcp = number_or_null(section, "fcp");
    performance.lcp = number_or_null(section, "lcp");
    performance.cls = number_or_null(section, "cls");
    return performance;
}

protocol::SecuritySection read_security(const json& report) {
    protocol::SecuritySection security;
    if (!report.contains("security") || !report["security"].is_object()) {
        return security;
    }
    const json& section = report["security"];
    security.risk_level = string_or(section, "risk_level", "unknown");
    if (section.contains("https_enabled") && section["https_enabled"].is_boolean()) {
        security.https_enabled = section["https_enabled"].get<bool>();
    }
    if (section.contains("security_headers") && section["security_headers"].is_object()) {
        for (const auto& item : section["security_headers"].items()) {
            if (item.value().is_boolean()) {
                security.security_headers[item.key()] = item.value().get<bool>();
            }
        }
    }
    if (section.contains("vulnerabilities") && section["vulnerabilities"].is_array()) {
        for (const auto& entry : section["vulnerabilities"]) {
            security.vulnerabilities.push_back(entry);
        }
    }
    return security;
}

protocol::ExecutiveSummary read_summary(const json& summary) {
    protocol::ExecutiveSummary out;
    out.business_impact = string_or(summary, "business_impact", "");
    out.investment_priority = string_or(summary, "investment_priority", "medium");
    out.roi_estimate = string_or(summary, "roi_estimate", "");
    out.timeline = string_or(summary, "timeline", "");
    if (summary.contains("key_recommendations") && summary["key_recommendations"].is_array()) {
        for (const auto& entry : summary["key_recommendations"]) {
            if (entry.is_string()) {
                out.key_recommendations.push_back(entry.get<std::string>());
            }
        }
    }
    return out;
}

}  // namespace

core::errors::Result<AuditRecord> ResultAggregator::build(
    const pipeline::PipelineState& state) const {
    if (state.phase() != pipeline::Phase::Done) {
        return AuditError{ErrorKind::Internal,
                          "Cannot aggregate a run in phase " + pipeline::to_string(state.phase()),
                          "run_not_done"};
    }
    if (!state.technical_report().has_value() || !state.executive_summary().has_value()) {
        return AuditError{ErrorKind::Internal, "Finished run is missing synthesis output.",
                          "run_not_done"};
    }

    const json& report = state.technical_report().value();

    AuditRecord record;
    record.url = state.url();
    record.audit_id = string_or(report, "audit_id", "");
    if (record.audit_id.empty()) {
        record.audit_id = core::config::generate_audit_id();
    }
    record.timestamp = string_or(report, "timestamp", "");
    if (record.timestamp.empty()) {
        record.timestamp = core::config::utc_timestamp_now();
    }
    record.status = string_or(report, "status", "completed");
    record.performance = read_performance(report);
    record.security = read_security(report);
    if (report.contains("recommendations") && report["recommendations"].is_array()) {
        for (const auto& entry : report["recommendations"]) {
            record.recommendations.push_back(entry);
        }
    }
    record.overall_score = integer_or_null(report, "overall_score").value_or(0);
    record.grade = string_or(report, "grade", "N/A");
    if (report.contains("technical_details") && report["technical_details"].is_object()) {
        record.technical_details = report["technical_details"];
    }
    record.executive_summary = read_summary(state.executive_summary().value());
    record.tool_outputs = state.tool_results();
    return record;
}

}  // namespace webaudit::aggregate
