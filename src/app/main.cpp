#include <atomic>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "analysis/chat_completions_engine.hpp"
#include "app/cli_parser.hpp"
#include "bridge/bridge_factory.hpp"
#include "core/errors/audit_errors.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/audit_pipeline.hpp"
#include "protocol/audit_record.hpp"
#include "session/run_manager.hpp"

namespace {

using webaudit::core::errors::AuditError;
using webaudit::core::errors::Result;
using nlohmann::json;

json error_to_json(const AuditError& err) {
    json out = {{"kind", webaudit::core::errors::to_string(err.kind)},
                {"code", err.code},
                {"message", err.message}};
    if (!err.hint.empty()) {
        out["hint"] = err.hint;
    }
    return out;
}

json outcome_to_json(const std::string& url,
                     const Result<webaudit::protocol::AuditRecord>& outcome) {
    if (webaudit::core::errors::is_error(outcome)) {
        return {{"url", url},
                {"status", "failed"},
                {"error", error_to_json(webaudit::core::errors::get_error(outcome))}};
    }
    return {{"url", url},
            {"status", "completed"},
            {"record", webaudit::protocol::to_json(webaudit::core::errors::get_value(outcome))}};
}

// Waits for SIGINT/SIGTERM on a dedicated thread; the signals are blocked everywhere else.
class SignalWatcher {
public:
    SignalWatcher(webaudit::session::RunManager& runs, sigset_t signals)
        : runs_(runs), signals_(signals), thread_([this]() { watch(); }) {}

    ~SignalWatcher() {
        stop_.store(true);
        thread_.join();
    }

private:
    void watch() {
        const timespec slice{0, 100 * 1000 * 1000};
        while (!stop_.load()) {
            const int sig = sigtimedwait(&signals_, nullptr, &slice);
            if (sig == SIGINT || sig == SIGTERM) {
                const auto raised = runs_.cancel_all();
                LOG_WARN("Signal " + std::to_string(sig) + " received, cancelling " +
                         std::to_string(raised) + " run(s)");
            }
        }
    }

    webaudit::session::RunManager& runs_;
    sigset_t signals_;
    std::atomic_bool stop_{false};
    std::thread thread_;
};

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Environment supplies the analysis credential; config file and flags may override it
    webaudit::core::config::AuditSettings base;
    if (const char* key = std::getenv("OPENAI_API_KEY")) {
        base.analysis.api_key = key;
    }

    // 2. Parse CLI input and return normalized input errors
    LOG_INFO("Web Audit CLI: Bootstrapping...");
    auto parsed = webaudit::app::cli::parse_and_validate(argc, argv, base);
    if (webaudit::core::errors::is_error(parsed)) {
        const auto& err = webaudit::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& req = webaudit::core::errors::get_value(parsed);
    if (req.verbose) {
        webaudit::core::logging::Logger::get().set_min_level(
            webaudit::core::logging::LogLevel::DEBUG);
    }
    if (req.settings.analysis.api_key.empty()) {
        LOG_WARN("No analysis API key configured; set OPENAI_API_KEY or analysis.api_key");
    }
    LOG_INFO("Tool backend transport: " +
             webaudit::core::config::to_string(req.settings.backend.transport));

    // 3. Route termination signals to the watcher before any worker thread exists
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    static_cast<void>(pthread_sigmask(SIG_BLOCK, &signals, nullptr));

    webaudit::session::RunManager run_manager;
    struct RunSlot {
        std::string url;
        std::string run_id;
        std::optional<Result<webaudit::protocol::AuditRecord>> outcome;
    };
    std::vector<RunSlot> slots;
    slots.reserve(req.urls.size());

    for (const auto& url : req.urls) {
        auto started = run_manager.start_run(url);
        if (webaudit::core::errors::is_error(started)) {
            const auto& err = webaudit::core::errors::get_error(started);
            LOG_ERROR("Failed to start run [" + err.code + "]: " + err.message);
            slots.push_back({url, "", Result<webaudit::protocol::AuditRecord>(err)});
            continue;
        }
        slots.push_back({url, webaudit::core::errors::get_value(started), std::nullopt});
    }

    // 4. One thread and one bridge per URL
    {
        SignalWatcher watcher(run_manager, signals);
        std::vector<std::thread> workers;
        for (auto& slot : slots) {
            if (slot.outcome.has_value()) {
                continue;
            }
            auto token_result = run_manager.get_cancel_token(slot.run_id);
            if (webaudit::core::errors::is_error(token_result)) {
                slot.outcome = webaudit::core::errors::get_error(token_result);
                continue;
            }
            webaudit::core::logging::RunContext ctx{
                slot.run_id, slot.url, webaudit::core::errors::get_value(token_result)};

            workers.emplace_back([&req, &slot, ctx]() {
                LOG_RUN_INFO(ctx, "Run started: " + ctx.url);
                webaudit::analysis::ChatCompletionsEngine engine(req.settings.analysis);
                const auto& backend = req.settings.backend;
                webaudit::pipeline::AuditPipeline pipeline(
                    engine, req.settings,
                    [&backend](const webaudit::core::logging::RunContext& run) {
                        return webaudit::bridge::make_bridge(backend, run.cancel_token);
                    });
                slot.outcome = pipeline.run(ctx);
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    // 5. Settle run states and emit one JSON document
    bool any_failed = false;
    for (const auto& slot : slots) {
        const auto& outcome = slot.outcome.value();
        const bool failed = webaudit::core::errors::is_error(outcome);
        any_failed = any_failed || failed;
        if (slot.run_id.empty()) {
            continue;
        }

        Result<webaudit::session::RunState> settled = webaudit::session::RunState::Completed;
        if (!failed) {
            settled = run_manager.mark_completed(slot.run_id);
        } else {
            const auto& err = webaudit::core::errors::get_error(outcome);
            LOG_ERROR("Run " + slot.run_id + " failed [" +
                      webaudit::core::errors::to_string(err.kind) + "/" + err.code + "]: " +
                      err.message);
            settled = err.kind == webaudit::core::errors::ErrorKind::Cancelled
                          ? run_manager.cancel_run(slot.run_id)
                          : run_manager.mark_failed(slot.run_id, err.message);
        }
        if (webaudit::core::errors::is_error(settled)) {
            const auto& settle_err = webaudit::core::errors::get_error(settled);
            LOG_ERROR("Failed to settle run " + slot.run_id + " [" + settle_err.code + "]: " +
                      settle_err.message);
            continue;
        }
        LOG_INFO("Final run state for " + slot.url + ": " +
                 webaudit::session::to_string(webaudit::core::errors::get_value(settled)));
    }

    json document;
    if (slots.size() == 1 && !webaudit::core::errors::is_error(slots.front().outcome.value())) {
        document = webaudit::protocol::to_json(
            webaudit::core::errors::get_value(slots.front().outcome.value()));
    } else if (slots.size() == 1) {
        document = outcome_to_json(slots.front().url, slots.front().outcome.value());
    } else {
        document = json::array();
        for (const auto& slot : slots) {
            document.push_back(outcome_to_json(slot.url, slot.outcome.value()));
        }
    }

    const std::string rendered = document.dump(2);
    if (req.output_file.has_value()) {
        std::ofstream out(req.output_file.value(), std::ios::trunc);
        out << rendered << "\n";
        out.flush();
        if (!out) {
            LOG_ERROR("Failed to write output file: " + req.output_file->string());
            return 3;
        }
        LOG_INFO("Audit output: " + req.output_file->string());
    } else {
        std::cout << rendered << std::endl;
        if (!std::cout) {
            LOG_ERROR("Failed to write audit output to stdout");
            return 3;
        }
    }

    return any_failed ? 1 : 0;
}
