#include "protocol/audit_record.hpp"

namespace webaudit::protocol {

using nlohmann::json;

namespace {

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value.has_value() ? json(value.value()) : json(nullptr);
}

json performance_to_json(const PerformanceSection& performance) {
    json payload;
    payload["lighthouse_score"] = optional_to_json(performance.lighthouse_score);
    payload["core_web_vitals"] = performance.core_web_vitals;
    payload["ttfb"] = optional_to_json(performance.ttfb);
    payload["fcp"] = optional_to_json(performance.fcp);
    payload["lcp"] = optional_to_json(performance.lcp);
    payload["cls"] = optional_to_json(performance.cls);
    return payload;
}

json security_to_json(const SecuritySection& security) {
    json payload;
    payload["risk_level"] = security.risk_level;
    payload["https_enabled"] = security.https_enabled;
    payload["security_headers"] = json::object();
    for (const auto& [header, present] : security.security_headers) {
        payload["security_headers"][header] = present;
    }
    payload["vulnerabilities"] = security.vulnerabilities;
    return payload;
}

json summary_to_json(const ExecutiveSummary& summary) {
    json payload;
    payload["business_impact"] = summary.business_impact;
    payload["investment_priority"] = summary.investment_priority;
    payload["roi_estimate"] = summary.roi_estimate;
    payload["timeline"] = summary.timeline;
    payload["key_recommendations"] = summary.key_recommendations;
    return payload;
}

}  // namespace

json to_json(const ToolResult& result) {
    json payload;
    payload["success"] = result.success;
    payload["payload"] = result.payload;
    payload["duration_ms"] = result.duration_ms;
    if (!result.success) {
        payload["error_message"] = result.error_message;
    }
    return payload;
}

json to_json(const AuditRecord& record) {
    json payload;
    payload["audit_id"] = record.audit_id;
    payload["url"] = record.url;
    payload["timestamp"] = record.timestamp;
    payload["status"] = record.status;
    payload["performance"] = performance_to_json(record.performance);
    payload["security"] = security_to_json(record.security);
    payload["recommendations"] = record.recommendations;
    payload["overall_score"] = record.overall_score;
    payload["grade"] = record.grade;
    payload["executive_summary"] = summary_to_json(record.executive_summary);
    payload["technical_details"] = record.technical_details;
    payload["tool_outputs"] = json::object();
    for (const auto& [name, result] : record.tool_outputs) {
        payload["tool_outputs"][name] = to_json(result);
    }
    return payload;
}

}  // namespace webaudit::protocol
