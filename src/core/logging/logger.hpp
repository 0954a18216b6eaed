#pragma once
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace webaudit::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Per-run correlation, handed down the pipeline call chain explicitly.
    struct RunContext {
        std::string run_id;
        std::string url;
        std::shared_ptr<std::atomic_bool> cancel_token;

        bool cancelled() const { return cancel_token && cancel_token->load(); }
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            write(level, "", message);
        }

        void log(LogLevel level, const RunContext& ctx, const std::string& message) {
            write(level, ctx.run_id, message);
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;

        // stdout is reserved for the audit record
        void write(LogLevel level, const std::string& run_id, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
            std::clog << "[" << level_to_string(level) << "] "
                      << (run_id.empty() ? "" : "[" + run_id + "] ")
                      << message << std::endl;
        }

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg) webaudit::core::logging::Logger::get().log(webaudit::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  webaudit::core::logging::Logger::get().log(webaudit::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  webaudit::core::logging::Logger::get().log(webaudit::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) webaudit::core::logging::Logger::get().log(webaudit::core::logging::LogLevel::ERROR, msg)

    #define LOG_RUN_DEBUG(ctx, msg) webaudit::core::logging::Logger::get().log(webaudit::core::logging::LogLevel::DEBUG, ctx, msg)
    #define LOG_RUN_INFO(ctx, msg)  webaudit::core::logging::Logger::get().log(webaudit::core::logging::LogLevel::INFO, ctx, msg)
    #define LOG_RUN_WARN(ctx, msg)  webaudit::core::logging::Logger::get().log(webaudit::core::logging::LogLevel::WARN, ctx, msg)
    #define LOG_RUN_ERROR(ctx, msg) webaudit::core::logging::Logger::get().log(webaudit::core::logging::LogLevel::ERROR, ctx, msg)

} // namespace webaudit::core::logging
