#include <string>
#include <gtest/gtest.h>
#include "core/errors/audit_errors.hpp"
#include "session/run_manager.hpp"

namespace {

using webaudit::core::errors::get_error;
using webaudit::core::errors::get_value;
using webaudit::core::errors::is_error;
using webaudit::session::RunManager;
using webaudit::session::RunState;

const std::string kUrl = "https://example.com";

TEST(RunManagerTest, StartRunMovesToRunning) {
    RunManager manager;
    auto start = manager.start_run(kUrl);
    ASSERT_FALSE(is_error(start));

    const std::string run_id = get_value(start);
    EXPECT_EQ(run_id.rfind("run-", 0), 0u);
    auto state = manager.get_run_state(run_id);
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), RunState::Running);
}

TEST(RunManagerTest, CancelRunMovesToCancelled) {
    RunManager manager;
    auto start = manager.start_run(kUrl);
    ASSERT_FALSE(is_error(start));

    const std::string run_id = get_value(start);
    auto cancel = manager.cancel_run(run_id);
    ASSERT_FALSE(is_error(cancel));
    EXPECT_EQ(get_value(cancel), RunState::Cancelled);

    auto state = manager.get_run_state(run_id);
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), RunState::Cancelled);
}

TEST(RunManagerTest, CancelRunSetsCancellationToken) {
    RunManager manager;
    auto start = manager.start_run(kUrl);
    ASSERT_FALSE(is_error(start));
    const std::string run_id = get_value(start);

    auto token_result = manager.get_cancel_token(run_id);
    ASSERT_FALSE(is_error(token_result));
    auto token = get_value(token_result);
    ASSERT_TRUE(token != nullptr);
    EXPECT_FALSE(token->load());

    auto cancel = manager.cancel_run(run_id);
    ASSERT_FALSE(is_error(cancel));
    EXPECT_TRUE(token->load());
}

TEST(RunManagerTest, CancelRunFailsForUnknownId) {
    RunManager manager;
    auto cancel = manager.cancel_run("run-does-not-exist");
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "run_not_found");
}

TEST(RunManagerTest, GetCancelTokenFailsForUnknownRun) {
    RunManager manager;
    auto token = manager.get_cancel_token("run-does-not-exist");
    ASSERT_TRUE(is_error(token));
    EXPECT_EQ(get_error(token).code, "run_not_found");
}

TEST(RunManagerTest, CancelRunFailsAfterCompletion) {
    RunManager manager;
    auto start = manager.start_run(kUrl);
    ASSERT_FALSE(is_error(start));

    const std::string run_id = get_value(start);
    auto complete = manager.mark_completed(run_id);
    ASSERT_FALSE(is_error(complete));
    EXPECT_EQ(get_value(complete), RunState::Completed);

    auto cancel = manager.cancel_run(run_id);
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "invalid_state_transition");
}

TEST(RunManagerTest, MarkFailedIsTerminal) {
    RunManager manager;
    auto start = manager.start_run(kUrl);
    ASSERT_FALSE(is_error(start));
    const std::string run_id = get_value(start);

    auto failed = manager.mark_failed(run_id, "backend exited");
    ASSERT_FALSE(is_error(failed));
    EXPECT_EQ(get_value(failed), RunState::Failed);

    auto again = manager.mark_completed(run_id);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_state_transition");
}

TEST(RunManagerTest, StartRunRejectsEmptyUrl) {
    RunManager manager;
    auto start = manager.start_run("");
    ASSERT_TRUE(is_error(start));
    EXPECT_EQ(get_error(start).code, "invalid_run_request");
}

TEST(RunManagerTest, CancelAllRaisesOnlyLiveTokens) {
    RunManager manager;
    const std::string first = get_value(manager.start_run(kUrl));
    const std::string second = get_value(manager.start_run("https://example.org"));
    ASSERT_FALSE(is_error(manager.mark_completed(first)));

    EXPECT_EQ(manager.cancel_all(), 1u);
    EXPECT_FALSE(get_value(manager.get_cancel_token(first))->load());
    EXPECT_TRUE(get_value(manager.get_cancel_token(second))->load());
    EXPECT_EQ(manager.cancel_all(), 0u);

    EXPECT_EQ(manager.run_count(), 2u);
    ASSERT_EQ(manager.run_ids().size(), 2u);
    EXPECT_EQ(manager.run_ids().front(), first);
}

}  // namespace
