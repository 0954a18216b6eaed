#include "session/run_manager.hpp"
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace webaudit::session {

using core::errors::AuditError;
using core::errors::ErrorKind;

std::string to_string(const RunState state) {
    switch (state) {
        case RunState::Created:
            return "created";
        case RunState::Running:
            return "running";
        case RunState::Completed:
            return "completed";
        case RunState::Failed:
            return "failed";
        case RunState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

bool RunManager::is_terminal(const RunState state) {
    return state == RunState::Completed || state == RunState::Failed ||
           state == RunState::Cancelled;
}

core::errors::Result<std::string> RunManager::start_run(const std::string& url) {
    if (url.empty()) {
        return AuditError{ErrorKind::Input, "Run requires a target URL.",
                          "invalid_run_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string run_id = core::config::generate_run_id();
        if (runs_.find(run_id) != runs_.end()) {
            continue;
        }

        RunRecord record;
        record.run_id = run_id;
        record.url = url;
        record.state = RunState::Created;
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        runs_.emplace(run_id, std::move(record));
        order_.push_back(run_id);
        LOG_INFO("RunManager: run " + run_id + " (" + url + ") transition created -> running");
        runs_[run_id].state = RunState::Running;
        return run_id;
    }

    return AuditError{ErrorKind::Internal,
                      "Unable to allocate unique run ID.",
                      "run_id_generation_failed"};
}

core::errors::Result<RunState> RunManager::cancel_run(const std::string& run_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runs_.find(run_id);
        if (it != runs_.end() && !is_terminal(it->second.state)) {
            it->second.cancel_token->store(true);
        }
    }
    return transition_to_terminal(run_id, RunState::Cancelled, std::nullopt);
}

core::errors::Result<RunState> RunManager::mark_completed(
    const std::string& run_id) {
    return transition_to_terminal(run_id, RunState::Completed, std::nullopt);
}

core::errors::Result<RunState> RunManager::mark_failed(
    const std::string& run_id, const std::string& reason) {
    return transition_to_terminal(run_id, RunState::Failed, reason);
}

core::errors::Result<RunState> RunManager::transition_to_terminal(
    const std::string& run_id, const RunState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return AuditError{ErrorKind::Input, "Run ID not found: " + run_id,
                          "run_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return AuditError{ErrorKind::Input,
                          "Run is already terminal: " +
                              to_string(it->second.state),
                          "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    LOG_INFO("RunManager: run " + run_id + " transition " + prev + " -> " +
             to_string(next_state));
    return it->second.state;
}

core::errors::Result<RunState> RunManager::get_run_state(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return AuditError{ErrorKind::Input, "Run ID not found: " + run_id,
                          "run_not_found"};
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> RunManager::get_cancel_token(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return AuditError{ErrorKind::Input, "Run ID not found: " + run_id,
                          "run_not_found"};
    }
    return it->second.cancel_token;
}

std::size_t RunManager::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t raised = 0;
    for (auto& [run_id, record] : runs_) {
        if (!is_terminal(record.state) && !record.cancel_token->exchange(true)) {
            ++raised;
        }
    }
    return raised;
}

std::vector<std::string> RunManager::run_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

std::size_t RunManager::run_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

}  // namespace webaudit::session
