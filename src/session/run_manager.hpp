#pragma once

#include <cstddef>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/audit_errors.hpp"

namespace webaudit::session {

enum class RunState {
    Created,
    Running,
    Completed,
    Failed,
    Cancelled
};

std::string to_string(RunState state);

struct RunRecord {
    std::string run_id;
    std::string url;
    RunState state = RunState::Created;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Tracks concurrent audit runs. Each run owns its own cancel token.
class RunManager {
public:
    core::errors::Result<std::string> start_run(const std::string& url);
    core::errors::Result<RunState> cancel_run(const std::string& run_id);
    core::errors::Result<RunState> get_run_state(const std::string& run_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& run_id) const;

    core::errors::Result<RunState> mark_completed(const std::string& run_id);
    core::errors::Result<RunState> mark_failed(const std::string& run_id,
                                               const std::string& reason);

    // Raises every live cancel token. Safe to call from a signal-watching thread.
    std::size_t cancel_all();

    std::vector<std::string> run_ids() const;
    std::size_t run_count() const;

private:
    core::errors::Result<RunState> transition_to_terminal(
        const std::string& run_id, RunState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(RunState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunRecord> runs_;
    std::vector<std::string> order_;
};

}  // namespace webaudit::session
