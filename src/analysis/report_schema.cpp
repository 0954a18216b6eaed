#include "analysis/report_schema.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace webaudit::analysis::schema {

using core::errors::AuditError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

json nullable(const char* type) {
    return json{{"type", json::array({type, "null"})}};
}

json strict_object(json properties) {
    json required = json::array();
    for (const auto& item : properties.items()) {
        required.push_back(item.key());
    }
    return json{{"type", "object"},
                {"properties", std::move(properties)},
                {"required", std::move(required)},
                {"additionalProperties", false}};
}

json build_technical_report() {
    json vitals = strict_object({{"lcp", nullable("number")},
                                 {"fid", nullable("number")},
                                 {"cls", nullable("number")},
                                 {"inp", nullable("number")}});

    json performance = strict_object({{"lighthouse_score", nullable("integer")},
                                      {"core_web_vitals", vitals},
                                      {"ttfb", nullable("number")},
                                      {"fcp", nullable("number")},
                                      {"lcp", nullable("number")},
                                      {"cls", nullable("number")}});

    json severity = {{"type", "string"},
                     {"enum", json::array({"low", "medium", "high", "critical"})}};

    json vulnerability = strict_object({{"name", {{"type", "string"}}},
                                        {"severity", severity},
                                        {"description", {{"type", "string"}}}});

    json headers = strict_object({{"csp", {{"type", "boolean"}}},
                                  {"hsts", {{"type", "boolean"}}},
                                  {"x_frame_options", {{"type", "boolean"}}}});

    json security = strict_object(
        {{"risk_level",
          {{"type", "string"},
           {"enum", json::array({"low", "medium", "high", "critical", "unknown"})}}},
         {"https_enabled", {{"type", "boolean"}}},
         {"security_headers", headers},
         {"vulnerabilities", {{"type", "array"}, {"items", vulnerability}}}});

    json recommendation = strict_object(
        {{"category", {{"type", "string"}}},
         {"priority",
          {{"type", "string"}, {"enum", json::array({"high", "medium", "low"})}}},
         {"title", {{"type", "string"}}},
         {"description", {{"type", "string"}}}});

    return strict_object({{"url", {{"type", "string"}}},
                          {"status", {{"type", "string"}}},
                          {"overall_score", {{"type", "integer"}}},
                          {"grade", {{"type", "string"}}},
                          {"performance", performance},
                          {"security", security},
                          {"recommendations", {{"type", "array"}, {"items", recommendation}}}});
}

json build_executive_summary() {
    return strict_object(
        {{"business_impact", {{"type", "string"}}},
         {"investment_priority",
          {{"type", "string"},
           {"enum", json::array({"immediate", "quarterly", "annual", "medium"})}}},
         {"roi_estimate", {{"type", "string"}}},
         {"timeline", {{"type", "string"}}},
         {"key_recommendations", {{"type", "array"}, {"items", {{"type", "string"}}}}}});
}

AuditError violation(const std::string& what) {
    return AuditError{ErrorKind::UpstreamAnalysis, "Analysis output violates schema: " + what,
                      "schema_violation"};
}

bool present(const json& obj, const char* key) {
    return obj.contains(key) && !obj[key].is_null();
}

std::optional<AuditError> expect_type(const json& obj, const char* key, const std::string& path,
                                      bool (json::*check)() const noexcept,
                                      const char* type_name) {
    if (present(obj, key) && !(obj[key].*check)()) {
        return violation(path + key + " must be " + type_name);
    }
    return std::nullopt;
}

}  // namespace

const json& technical_report() {
    static const json schema = build_technical_report();
    return schema;
}

const json& executive_summary() {
    static const json schema = build_executive_summary();
    return schema;
}

core::errors::Result<bool> validate_technical_report(const json& report) {
    if (!report.is_object()) {
        return violation("report is not an object");
    }
    if (!report.contains("performance") || !report["performance"].is_object()) {
        return violation("performance section is required");
    }
    if (!report.contains("security") || !report["security"].is_object()) {
        return violation("security section is required");
    }

    for (auto err : {expect_type(report, "url", "", &json::is_string, "a string"),
                     expect_type(report, "status", "", &json::is_string, "a string"),
                     expect_type(report, "grade", "", &json::is_string, "a string"),
                     expect_type(report, "recommendations", "", &json::is_array, "an array"),
                     expect_type(report, "overall_score", "", &json::is_number_integer,
                                 "an integer")}) {
        if (err) {
            return *err;
        }
    }
    if (present(report, "overall_score")) {
        const auto score = report["overall_score"].get<std::int64_t>();
        if (score < 0 || score > 100) {
            return violation("overall_score must be within 0..100");
        }
    }

    const json& performance = report["performance"];
    const std::string perf = "performance.";
    for (auto err : {expect_type(performance, "lighthouse_score", perf,
                                 &json::is_number_integer, "an integer"),
                     expect_type(performance, "core_web_vitals", perf, &json::is_object,
                                 "an object"),
                     expect_type(performance, "ttfb", perf, &json::is_number, "a number"),
                     expect_type(performance, "fcp", perf, &json::is_number, "a number"),
                     expect_type(performance, "lcp", perf, &json::is_number, "a number"),
                     expect_type(performance, "cls", perf, &json::is_number, "a number")}) {
        if (err) {
            return *err;
        }
    }

    const json& security = report["security"];
    const std::string sec = "security.";
    for (auto err : {expect_type(security, "risk_level", sec, &json::is_string, "a string"),
                     expect_type(security, "https_enabled", sec, &json::is_boolean,
                                 "a boolean"),
                     expect_type(security, "security_headers", sec, &json::is_object,
                                 "an object"),
                     expect_type(security, "vulnerabilities", sec, &json::is_array,
                                 "an array")}) {
        if (err) {
            return *err;
        }
    }
    if (present(security, "security_headers")) {
        for (const auto& item : security["security_headers"].items()) {
            if (!item.value().is_boolean()) {
                return violation("security.security_headers." + item.key() +
                                 " must be a boolean");
            }
        }
    }
    if (present(security, "vulnerabilities")) {
        for (const auto& entry : security["vulnerabilities"]) {
            if (!entry.is_string() && !entry.is_object()) {
                return violation("security.vulnerabilities entries must be strings or objects");
            }
        }
    }
    return true;
}

core::errors::Result<bool> validate_executive_summary(const json& summary) {
    if (!summary.is_object()) {
        return violation("executive summary is not an object");
    }
    if (!summary.contains("business_impact") || !summary["business_impact"].is_string()) {
        return violation("business_impact is required");
    }
    for (auto err : {expect_type(summary, "investment_priority", "", &json::is_string,
                                 "a string"),
                     expect_type(summary, "roi_estimate", "", &json::is_string, "a string"),
                     expect_type(summary, "timeline", "", &json::is_string, "a string"),
                     expect_type(summary, "key_recommendations", "", &json::is_array,
                                 "an array")}) {
        if (err) {
            return *err;
        }
    }
    if (present(summary, "key_recommendations")) {
        for (const auto& entry : summary["key_recommendations"]) {
            if (!entry.is_string()) {
                return violation("key_recommendations entries must be strings");
            }
        }
    }
    return true;
}

}  // namespace webaudit::analysis::schema
