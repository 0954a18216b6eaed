#include "core/config/audit_settings.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace webaudit::core::config {

using core::errors::AuditError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

AuditError wrong_type(const std::string& key, const std::string& expected) {
    return AuditError{ErrorKind::Input,
                      "Config key '" + key + "' must be " + expected + ".",
                      "invalid_config_value"};
}

// Each reader returns an error only when the key exists with the wrong type.
std::optional<AuditError> read_string(const json& obj, const char* key,
                                      const std::string& path, std::string& out) {
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    if (!obj[key].is_string()) {
        return wrong_type(path + key, "a string");
    }
    out = obj[key].get<std::string>();
    return std::nullopt;
}

std::optional<AuditError> read_millis(const json& obj, const char* key,
                                      const std::string& path, std::uint32_t& out) {
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    const auto& value = obj[key];
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0 ||
        value.get<std::int64_t>() > static_cast<std::int64_t>(UINT32_MAX)) {
        return wrong_type(path + key, "a non-negative integer");
    }
    out = value.get<std::uint32_t>();
    return std::nullopt;
}

std::optional<AuditError> read_double(const json& obj, const char* key,
                                      const std::string& path, double& out) {
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    if (!obj[key].is_number()) {
        return wrong_type(path + key, "a number");
    }
    out = obj[key].get<double>();
    return std::nullopt;
}

std::optional<AuditError> read_string_list(const json& obj, const char* key,
                                           const std::string& path,
                                           std::vector<std::string>& out) {
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    const auto& value = obj[key];
    if (!value.is_array()) {
        return wrong_type(path + key, "an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return wrong_type(path + key, "an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    out = std::move(items);
    return std::nullopt;
}

}  // namespace

std::string to_string(const TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio:
            return "stdio";
        case TransportKind::Http:
            return "http";
        default:
            return "unknown";
    }
}

core::errors::Result<TransportKind> parse_transport(const std::string& text) {
    if (text == "stdio") {
        return TransportKind::Stdio;
    }
    if (text == "http") {
        return TransportKind::Http;
    }
    return AuditError{ErrorKind::Input, "Unknown transport: " + text,
                      "invalid_transport", "Use 'stdio' or 'http'."};
}

core::errors::Result<AuditSettings> apply_overrides(AuditSettings settings,
                                                    const json& overrides) {
    if (!overrides.is_object()) {
        return AuditError{ErrorKind::Input, "Config root must be a JSON object.",
                          "invalid_config"};
    }

    if (auto err = read_string_list(overrides, "essential_tools", "",
                                    settings.essential_tools)) {
        return *err;
    }

    if (overrides.contains("backend")) {
        const auto& backend = overrides["backend"];
        if (!backend.is_object()) {
            return wrong_type("backend", "an object");
        }
        auto& b = settings.backend;
        const std::string p = "backend.";

        std::string transport_text;
        if (auto err = read_string(backend, "transport", p, transport_text)) {
            return *err;
        }
        if (!transport_text.empty()) {
            auto transport = parse_transport(transport_text);
            if (core::errors::is_error(transport)) {
                return core::errors::get_error(transport);
            }
            b.transport = core::errors::get_value(transport);
        }

        for (auto err : {read_string(backend, "command", p, b.command),
                         read_string_list(backend, "args", p, b.args),
                         read_string(backend, "service_url", p, b.service_url),
                         read_millis(backend, "http_timeout_ms", p, b.http_timeout_ms),
                         read_millis(backend, "startup_timeout_ms", p,
                                     b.startup_timeout_ms),
                         read_millis(backend, "request_timeout_ms", p,
                                     b.request_timeout_ms),
                         read_string(backend, "protocol_version", p,
                                     b.protocol_version),
                         read_string(backend, "client_name", p, b.client_name),
                         read_string(backend, "client_version", p, b.client_version)}) {
            if (err) {
                return *err;
            }
        }
    }

    if (overrides.contains("analysis")) {
        const auto& analysis = overrides["analysis"];
        if (!analysis.is_object()) {
            return wrong_type("analysis", "an object");
        }
        auto& a = settings.analysis;
        const std::string p = "analysis.";
        for (auto err : {read_string(analysis, "endpoint", p, a.endpoint),
                         read_string(analysis, "model", p, a.model),
                         read_string(analysis, "api_key", p, a.api_key),
                         read_string(analysis, "tool_choice", p, a.tool_choice),
                         read_double(analysis, "temperature", p, a.temperature),
                         read_double(analysis, "summary_temperature", p,
                                     a.summary_temperature),
                         read_millis(analysis, "timeout_ms", p, a.timeout_ms)}) {
            if (err) {
                return *err;
            }
        }
    }

    return settings;
}

core::errors::Result<AuditSettings> load_settings_file(
    const std::filesystem::path& path, AuditSettings base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AuditError{ErrorKind::Input,
                          "Unable to open config file: " + path.string(),
                          "config_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json parsed = json::parse(buffer.str(), nullptr, false);
    if (parsed.is_discarded()) {
        return AuditError{ErrorKind::Input,
                          "Config file is not valid JSON: " + path.string(),
                          "invalid_config"};
    }
    return apply_overrides(std::move(base), parsed);
}

}  // namespace webaudit::core::config
