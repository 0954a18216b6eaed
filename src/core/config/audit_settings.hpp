#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/audit_errors.hpp"

namespace webaudit::core::config {

enum class TransportKind {
    Stdio,
    Http
};

std::string to_string(TransportKind kind);

struct BackendSettings {
    TransportKind transport = TransportKind::Stdio;

    // Spawned-process transport
    std::string command = "npx";
    std::vector<std::string> args = {"-y", "chrome-devtools-mcp@latest",
                                     "--headless=true", "--isolated=true"};

    // Remote service transport
    std::string service_url = "http://chrome-mcp:3001";
    std::uint32_t http_timeout_ms = 60000;

    std::uint32_t startup_timeout_ms = 30000;
    std::uint32_t request_timeout_ms = 60000;

    std::string protocol_version = "2024-11-05";
    std::string client_name = "web-audit-agent";
    std::string client_version = "1.0.0";
};

struct AnalysisSettings {
    std::string endpoint = "https://api.openai.com/v1/chat/completions";
    std::string model = "gpt-4o-mini";
    std::string api_key;
    std::string tool_choice = "auto";
    double temperature = 0.1;
    double summary_temperature = 0.3;
    std::uint32_t timeout_ms = 120000;
};

struct AuditSettings {
    BackendSettings backend;
    AnalysisSettings analysis;
    std::vector<std::string> essential_tools = {
        "navigate_page",
        "performance_start_trace",
        "performance_stop_trace",
        "evaluate_script",
        "take_snapshot",
        "list_network_requests",
        "emulate_network",
        "list_console_messages",
        "take_screenshot"};
};

core::errors::Result<TransportKind> parse_transport(const std::string& text);

// Overlays the keys present in `overrides` onto `settings`. Unknown keys are
// ignored; a key with the wrong JSON type is an Input error.
core::errors::Result<AuditSettings> apply_overrides(AuditSettings settings,
                                                    const nlohmann::json& overrides);

core::errors::Result<AuditSettings> load_settings_file(
    const std::filesystem::path& path, AuditSettings base = {});

}  // namespace webaudit::core::config
