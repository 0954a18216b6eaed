#pragma once
#include <string>
#include <variant>

namespace webaudit::core::errors {

    // 1. Typed error kinds
    enum class ErrorKind {
        Connection,        // Backend process failed to start, service unreachable
        Protocol,          // Malformed response, id mismatch, channel closed
        Timeout,           // Bounded wait on the channel expired
        ToolExecution,     // A single tool failed at the backend (never fatal)
        UpstreamAnalysis,  // Analysis engine refused or broke its schema
        Validation,        // Malformed audit URL
        Cancelled,         // Run cancelled from outside
        Input,             // Bad CLI flag or config value
        Internal           // pipe()/fork() and friends
    };

    // The standardized error payload
    struct AuditError {
        ErrorKind kind;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Connection:
                return "connection";
            case ErrorKind::Protocol:
                return "protocol";
            case ErrorKind::Timeout:
                return "timeout";
            case ErrorKind::ToolExecution:
                return "tool_execution";
            case ErrorKind::UpstreamAnalysis:
                return "upstream_analysis";
            case ErrorKind::Validation:
                return "validation";
            case ErrorKind::Cancelled:
                return "cancelled";
            case ErrorKind::Input:
                return "input";
            case ErrorKind::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

    // 2. Propagation strategy: a Result holds either a value of type T, OR an AuditError.
    template <typename T>
    using Result = std::variant<T, AuditError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AuditError>(result);
    }

    template <typename T>
    const AuditError& get_error(const Result<T>& result) {
        return std::get<AuditError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

} // namespace webaudit::core::errors
