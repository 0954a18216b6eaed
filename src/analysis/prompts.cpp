#include "analysis/prompts.hpp"

#include <sstream>

namespace webaudit::analysis::prompts {

using nlohmann::json;

namespace {

// Large payloads such as screenshots are cut so the prompt stays bounded.
constexpr std::size_t kMaxToolPayloadChars = 20000;

std::string tool_results_block(const std::vector<protocol::ToolResult>& results) {
    nlohmann::ordered_json block = nlohmann::ordered_json::object();
    for (const auto& result : results) {
        std::string text = result.payload.dump();
        if (text.size() > kMaxToolPayloadChars) {
            text = text.substr(0, kMaxToolPayloadChars) + "...[truncated]";
        }
        block[result.name] = {{"success", result.success}, {"output", text}};
    }
    return block.dump(2);
}

}  // namespace

std::string audit_expert() {
    return R"(You are a senior web performance and security auditor.

EXPERTISE:
- Core Web Vitals (LCP, FID, CLS, INP) and their optimization
- OWASP Top 10 assessment
- Performance bottlenecks and mobile-first tuning

METHOD:
- Lighthouse-style performance scoring
- Security header review (CSP, HSTS, X-Frame-Options)
- HTTPS and mixed-content checks

TOOL USE:
- Start with navigate_page so every later tool sees the target page
- Measure Core Web Vitals with performance_start_trace / performance_stop_trace
- Use evaluate_script for in-page security checks
- Use emulate_network for mobile conditions
- Use take_screenshot for visual evidence

Every finding must be actionable and tied to business impact.)";
}

std::string tool_selection(const std::string& url) {
    std::ostringstream out;
    out << "Audit the website " << url << ".\n\n"
        << "Call the tools in this order:\n"
        << "1. navigate_page(url=\"" << url << "\")\n"
        << "2. take_snapshot()\n"
        << "3. performance_start_trace(reload=true, autoStop=true)\n"
        << "4. emulate_network(\"Fast 3G\") (optional)\n"
        << "5. performance_stop_trace()\n"
        << "6. list_network_requests()\n"
        << "7. evaluate_script() with a function returning: https (location.protocol), "
           "presence of CSP / HSTS / X-Frame-Options meta tags, mixed content on "
           "img/script/link, and a csrf-token meta check\n"
        << "8. list_console_messages()\n"
        << "9. take_screenshot(fullPage=true)\n\n"
        << "The report must cover Core Web Vitals, security headers, HTTPS and "
           "resource optimization.";
    return out.str();
}

std::string technical_report(const std::string& url,
                             const std::vector<protocol::ToolResult>& tool_results) {
    std::ostringstream out;
    out << "Write the technical audit report for " << url << ".\n\n"
        << "TOOL RESULTS:\n" << tool_results_block(tool_results) << "\n\n"
        << "PERFORMANCE:\n"
        << "- Read LCP, FID and CLS from the performance trace results\n"
        << "- Derive lighthouse_score (0-100)\n"
        << "- grade A: LCP < 2.5s, FID < 100ms, CLS < 0.1; B: LCP < 4s, FID < 300ms, "
           "CLS < 0.25; C otherwise\n\n"
        << "SECURITY:\n"
        << "- https_enabled and security_headers from the evaluate_script output\n"
        << "- vulnerabilities as {name, severity, description} with severity "
           "low|medium|high|critical, for example:\n"
        << "  missing CSP -> \"Content Security Policy Missing\" (medium)\n"
        << "  missing HSTS -> \"HTTP Strict Transport Security Missing\" (medium)\n"
        << "  plain HTTP -> \"Insecure Protocol\" (high)\n"
        << "  mixed content -> \"Mixed Content Vulnerability\" (medium)\n"
        << "  eval/innerHTML sinks -> \"Cross-Site Scripting (XSS)\" (high)\n"
        << "  no CSRF token -> \"Cross-Site Request Forgery\" (medium)\n"
        << "- risk_level is the highest severity found\n\n"
        << "RECOMMENDATIONS:\n"
        << "- Performance and security items ordered by business impact, each with "
           "concrete implementation guidance\n\n"
        << "Tools that failed are reported with an \"error\" field; say which data is "
           "missing instead of inventing it.\n"
        << "Return only JSON matching the output schema.";
    return out.str();
}

std::string executive_summary(const json& technical_report) {
    std::ostringstream out;
    out << "You are a digital strategy consultant writing for C-level leadership.\n\n"
        << "AUDIT DATA:\n" << technical_report.dump(2) << "\n\n"
        << "Cover business impact (revenue, user experience, brand risk), the top "
           "risks in business terms, investment priority, expected ROI and an action "
           "timeline with resource needs.\n\n"
        << "Fields:\n"
        << "- business_impact: 2-3 sentences\n"
        << "- investment_priority: \"immediate\", \"quarterly\" or \"annual\"\n"
        << "- roi_estimate: expected return and timeframe\n"
        << "- timeline: implementation phases\n"
        << "- key_recommendations: up to five short items\n\n"
        << "Return only JSON matching the ExecutiveSummary schema.";
    return out.str();
}

}  // namespace webaudit::analysis::prompts
