#include "cli_parser.hpp"
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "policy/url_guard.hpp"

namespace webaudit::app::cli {

    using namespace webaudit::core::errors;
    using webaudit::core::config::AuditSettings;
    using webaudit::protocol::AuditRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::vector<std::string> urls;
        std::optional<std::string> transport;
        std::optional<std::string> service_url;
        std::optional<std::string> backend_cmd;
        std::optional<std::string> config_file;
        std::optional<std::string> output_file;
        bool verbose = false;
    };

    Result<AuditRequest> parse_and_validate(int argc, char* argv[], AuditSettings base) {
        if (argc < 2) {
            return AuditError{ErrorKind::Input, "No command provided.", "missing_command", "Usage: web_audit_cli audit --url https://example.com"};
        }

        std::string command = argv[1];
        if (command != "audit") {
            return AuditError{ErrorKind::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'audit' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'audit' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--url") {
                if (i + 1 < args.size()) raw.urls.push_back(args[++i]);
                else return AuditError{ErrorKind::Input, "Missing value for --url", "missing_value"};
            } else if (args[i] == "--transport") {
                if (i + 1 < args.size()) raw.transport = args[++i];
                else return AuditError{ErrorKind::Input, "Missing value for --transport", "missing_value"};
            } else if (args[i] == "--service-url") {
                if (i + 1 < args.size()) raw.service_url = args[++i];
                else return AuditError{ErrorKind::Input, "Missing value for --service-url", "missing_value"};
            } else if (args[i] == "--backend-cmd") {
                if (i + 1 < args.size()) raw.backend_cmd = args[++i];
                else return AuditError{ErrorKind::Input, "Missing value for --backend-cmd", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config_file = args[++i];
                else return AuditError{ErrorKind::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--output") {
                if (i + 1 < args.size()) raw.output_file = args[++i];
                else return AuditError{ErrorKind::Input, "Missing value for --output", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return AuditError{ErrorKind::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        if (raw.urls.empty()) {
            return AuditError{ErrorKind::Input, "Must provide at least one --url", "missing_required_flag"};
        }

        AuditRequest req;
        req.verbose = raw.verbose;

        // Precedence: base < config file < flags
        req.settings = std::move(base);
        if (raw.config_file) {
            auto loaded = webaudit::core::config::load_settings_file(raw.config_file.value(), req.settings);
            if (is_error(loaded)) return get_error(loaded);
            req.settings = get_value(loaded);
        }

        if (raw.transport) {
            auto transport = webaudit::core::config::parse_transport(raw.transport.value());
            if (is_error(transport)) return get_error(transport);
            req.settings.backend.transport = get_value(transport);
        }

        if (raw.service_url) {
            const webaudit::policy::UrlGuard guard;
            auto checked = guard.validate_url(raw.service_url.value());
            if (is_error(checked)) {
                auto err = get_error(checked);
                err.kind = ErrorKind::Input;
                err.message = "--service-url: " + err.message;
                return err;
            }
            req.settings.backend.service_url = raw.service_url.value();
        }

        // Whitespace-separated; the first word is the executable
        if (raw.backend_cmd) {
            std::istringstream words(raw.backend_cmd.value());
            std::vector<std::string> parts;
            for (std::string word; words >> word;) parts.push_back(word);
            if (parts.empty()) {
                return AuditError{ErrorKind::Input, "--backend-cmd must not be empty", "missing_value"};
            }
            req.settings.backend.command = parts.front();
            req.settings.backend.args.assign(parts.begin() + 1, parts.end());
        }

        if (raw.output_file) {
            if (raw.output_file->empty()) {
                return AuditError{ErrorKind::Input, "--output must not be empty", "missing_value"};
            }
            req.output_file = std::filesystem::path(raw.output_file.value());
        }

        const webaudit::policy::UrlGuard guard;
        for (const auto& url : raw.urls) {
            auto checked = guard.validate_url(url);
            if (is_error(checked)) return get_error(checked);
            req.urls.push_back(get_value(checked));
        }

        return req;
    }

} // namespace webaudit::app::cli
