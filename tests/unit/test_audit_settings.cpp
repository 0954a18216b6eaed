#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/audit_settings.hpp"
#include "core/errors/audit_errors.hpp"

namespace {

using nlohmann::json;
using webaudit::core::config::apply_overrides;
using webaudit::core::config::AuditSettings;
using webaudit::core::config::TransportKind;
using webaudit::core::errors::ErrorKind;
using webaudit::core::errors::get_error;
using webaudit::core::errors::get_value;
using webaudit::core::errors::is_error;

TEST(AuditSettingsTest, DefaultsMatchReferenceDeployment) {
    const AuditSettings settings;
    EXPECT_EQ(settings.backend.transport, TransportKind::Stdio);
    EXPECT_EQ(settings.backend.command, "npx");
    EXPECT_EQ(settings.backend.protocol_version, "2024-11-05");
    EXPECT_EQ(settings.backend.client_name, "web-audit-agent");
    EXPECT_EQ(settings.analysis.model, "gpt-4o-mini");
    EXPECT_DOUBLE_EQ(settings.analysis.temperature, 0.1);
    EXPECT_DOUBLE_EQ(settings.analysis.summary_temperature, 0.3);
    ASSERT_EQ(settings.essential_tools.size(), 9u);
    EXPECT_EQ(settings.essential_tools.front(), "navigate_page");
}

TEST(AuditSettingsTest, OverridesOnlyPresentKeys) {
    const json overrides = {
        {"backend", {{"transport", "http"}, {"request_timeout_ms", 5000}}},
        {"analysis", {{"temperature", 0.0}}},
        {"essential_tools", json::array({"navigate_page", "take_snapshot"})},
        {"unrelated", true}};

    auto result = apply_overrides(AuditSettings{}, overrides);
    ASSERT_FALSE(is_error(result));

    const auto& settings = get_value(result);
    EXPECT_EQ(settings.backend.transport, TransportKind::Http);
    EXPECT_EQ(settings.backend.request_timeout_ms, 5000u);
    EXPECT_EQ(settings.backend.startup_timeout_ms, 30000u);
    EXPECT_DOUBLE_EQ(settings.analysis.temperature, 0.0);
    EXPECT_DOUBLE_EQ(settings.analysis.summary_temperature, 0.3);
    ASSERT_EQ(settings.essential_tools.size(), 2u);
}

TEST(AuditSettingsTest, RejectsWrongType) {
    auto result = apply_overrides(AuditSettings{},
                                  json{{"backend", {{"request_timeout_ms", "fast"}}}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Input);
    EXPECT_EQ(get_error(result).code, "invalid_config_value");
    EXPECT_NE(get_error(result).message.find("backend.request_timeout_ms"), std::string::npos);
}

TEST(AuditSettingsTest, RejectsNonObjectRoot) {
    auto result = apply_overrides(AuditSettings{}, json::array());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

}  // namespace
