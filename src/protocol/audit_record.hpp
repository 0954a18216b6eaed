#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace webaudit::protocol {

struct PerformanceSection {
    std::optional<int> lighthouse_score;
    nlohmann::json core_web_vitals = nlohmann::json::object();
    std::optional<double> ttfb;
    std::optional<double> fcp;
    std::optional<double> lcp;
    std::optional<double> cls;
};

struct SecuritySection {
    std::string risk_level = "unknown";
    bool https_enabled = false;
    std::map<std::string, bool> security_headers;
    // Plain strings or {name, severity, description} objects
    std::vector<nlohmann::json> vulnerabilities;
};

struct ExecutiveSummary {
    std::string business_impact;
    std::string investment_priority = "medium";
    std::string roi_estimate;
    std::string timeline;
    std::vector<std::string> key_recommendations;
};

struct AuditRecord {
    std::string audit_id;
    std::string url;
    std::string timestamp;
    std::string status = "completed";
    PerformanceSection performance;
    SecuritySection security;
    std::vector<nlohmann::json> recommendations;
    int overall_score = 0;
    std::string grade = "N/A";
    ExecutiveSummary executive_summary;
    nlohmann::json technical_details = nlohmann::json::object();
    std::map<std::string, ToolResult> tool_outputs;
};

nlohmann::json to_json(const ToolResult& result);
nlohmann::json to_json(const AuditRecord& record);

}  // namespace webaudit::protocol
