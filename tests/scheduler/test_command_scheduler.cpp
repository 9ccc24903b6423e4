/*
 * test_command_scheduler.cpp - Tests for the command scheduler
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "app/eventloop.hpp"
#include "events/event_bus.hpp"
#include "process/launcher.hpp"
#include "scheduler/command_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace devflow;
using namespace devflow::scheduler;
using namespace std::chrono_literals;

class CommandSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override { makeScheduler(3); }

    void makeScheduler(int maxConcurrent) {
        scheduler_.reset();
        SchedulerConfig config;
        config.maxConcurrent = maxConcurrent;
        config.runner.killGracePeriod = 300ms;
        config.runner.progressTick = 20ms;
        bus_ = events::EventBus::create();
        scheduler_ = std::make_unique<CommandScheduler>(
            loop_, bus_, process::createDefaultLauncher(), CommandResolver{},
            config);
        scheduler_->setResultHandler(
            [this](const CommandResult& result) { results_.push_back(result); });
    }

    void TearDown() override {
        scheduler_->cancelAll();
        scheduler_->waitForIdle(5s);
        scheduler_.reset();
    }

    auto submitShell(const std::string& script,
                     Priority priority = Priority::Normal) -> std::string {
        CommandOptions options;
        options.program = "/bin/sh";
        options.args = {"-c", script};
        return scheduler_->submit(CommandAction::Custom, "", priority,
                                  std::move(options));
    }

    auto resultFor(const std::string& id) const -> const CommandResult* {
        for (const auto& result : results_) {
            if (result.id == id) {
                return &result;
            }
        }
        return nullptr;
    }

    app::EventLoop loop_;
    std::shared_ptr<events::EventBus> bus_;
    std::unique_ptr<CommandScheduler> scheduler_;
    std::vector<CommandResult> results_;
};

// ============================================================================
// Dispatch Tests
// ============================================================================

TEST_F(CommandSchedulerTest, RunsCommandAndRecordsHistory) {
    auto id = submitShell("echo hello");
    EXPECT_FALSE(id.empty());
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    auto record = scheduler_->queue().findInHistory(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, ExecutionStatus::Completed);
    EXPECT_TRUE(record->success);
    EXPECT_EQ(record->progress, 100);
    EXPECT_EQ(scheduler_->getCommandOutput(id).value_or(""), "hello\n");
    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_.front().id, id);
}

TEST_F(CommandSchedulerTest, NeverExceedsMaxConcurrent) {
    makeScheduler(2);
    std::size_t peak = 0;
    auto probe = loop_.setInterval(
        [&] { peak = std::max(peak, scheduler_->runningCount()); }, 5ms);

    for (int i = 0; i < 5; ++i) {
        submitShell("sleep 0.1");
    }
    ASSERT_TRUE(scheduler_->waitForIdle(10s));
    loop_.cancelTimer(probe);

    EXPECT_EQ(peak, 2u);
    EXPECT_EQ(results_.size(), 5u);
    EXPECT_EQ(scheduler_->queue().historySize(), 5u);
    for (const auto& result : results_) {
        EXPECT_EQ(result.status, ExecutionStatus::Completed);
    }
}

TEST_F(CommandSchedulerTest, DispatchesInPriorityOrder) {
    makeScheduler(1);
    auto low = submitShell("true", Priority::Low);
    auto normal = submitShell("true", Priority::Normal);
    auto high = submitShell("true", Priority::High);
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    ASSERT_EQ(results_.size(), 3u);
    EXPECT_EQ(results_[0].id, high);
    EXPECT_EQ(results_[1].id, normal);
    EXPECT_EQ(results_[2].id, low);
}

TEST_F(CommandSchedulerTest, FailedCommandKeepsExitReason) {
    auto id = submitShell("echo nope >&2; exit 4");
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    const auto* result = resultFor(id);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->status, ExecutionStatus::Failed);
    EXPECT_EQ(result->reason, ErrorKind::Runtime);
    EXPECT_EQ(result->error.value_or(""), "nope\n");
}

// ============================================================================
// Rejection Tests
// ============================================================================

TEST_F(CommandSchedulerTest, InvalidCommandIsRejectedWithoutSpawning) {
    std::optional<ProcessResult> completion;
    auto id = scheduler_->submit(CommandAction::NxTest, "", Priority::Normal, {});
    auto sub = bus_->subscribeTo(id, [&](const events::ExecutionEvent& event) {
        if (event.kind == events::EventKind::Complete) {
            completion = event.result;
        }
    });
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    const auto* result = resultFor(id);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->status, ExecutionStatus::Failed);
    EXPECT_EQ(result->reason, ErrorKind::Validation);
    ASSERT_TRUE(completion.has_value());
    EXPECT_EQ(completion->exitCode, -1);
    EXPECT_EQ(completion->reason, ErrorKind::Validation);
}

TEST_F(CommandSchedulerTest, MissingProgramIsSpawnFailure) {
    CommandOptions options;
    options.program = "/nonexistent/devflow-missing-binary";
    auto id = scheduler_->submit(CommandAction::Custom, "", Priority::Normal,
                                 options);
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    const auto* result = resultFor(id);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->status, ExecutionStatus::Failed);
    EXPECT_EQ(result->reason, ErrorKind::Spawn);
}

// ============================================================================
// Cancellation Tests
// ============================================================================

TEST_F(CommandSchedulerTest, CancelRunningCommand) {
    auto id = submitShell("sleep 10");
    loop_.setTimeout([&] { EXPECT_TRUE(scheduler_->cancel(id)); }, 100ms);
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    auto record = scheduler_->queue().findInHistory(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, ExecutionStatus::Cancelled);
    EXPECT_EQ(record->reason, ErrorKind::Cancellation);
    EXPECT_EQ(scheduler_->queue().historySize(), 1u);
    EXPECT_EQ(results_.size(), 1u);
}

TEST_F(CommandSchedulerTest, CancelQueuedCommandNeverRuns) {
    makeScheduler(1);
    auto first = submitShell("sleep 0.2");
    auto second = submitShell("echo should-not-run");
    EXPECT_TRUE(scheduler_->cancel(second));
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    EXPECT_NE(resultFor(first), nullptr);
    EXPECT_EQ(resultFor(second), nullptr);
    EXPECT_FALSE(scheduler_->cancel("unknown"));
}

TEST_F(CommandSchedulerTest, CancelAllStopsEverything) {
    makeScheduler(1);
    auto running = submitShell("sleep 10");
    auto pending = submitShell("sleep 10");
    loop_.setTimeout([&] { EXPECT_EQ(scheduler_->cancelAll(), 2u); }, 100ms);
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    EXPECT_EQ(scheduler_->queue().findInHistory(running)->status,
              ExecutionStatus::Cancelled);
    EXPECT_EQ(scheduler_->queue().findInHistory(pending)->error.value_or(""),
              "Cancelled before start");
}

// ============================================================================
// Retry and Configuration Tests
// ============================================================================

TEST_F(CommandSchedulerTest, RetryRunsFailedCommandAgain) {
    auto id = submitShell("exit 1");
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    auto retryId = scheduler_->retryCommand(id);
    ASSERT_TRUE(retryId.has_value());
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    auto retried = scheduler_->queue().findInHistory(*retryId);
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(retried->status, ExecutionStatus::Failed);
    EXPECT_FALSE(scheduler_->retryCommand("unknown").has_value());
}

TEST_F(CommandSchedulerTest, MaxConcurrentIsClamped) {
    scheduler_->setMaxConcurrent(50);
    EXPECT_EQ(scheduler_->maxConcurrent(), CommandScheduler::kMaxConcurrent);
    scheduler_->setMaxConcurrent(0);
    EXPECT_EQ(scheduler_->maxConcurrent(), CommandScheduler::kMinConcurrent);
    ASSERT_TRUE(scheduler_->waitForIdle(1s));
}

TEST_F(CommandSchedulerTest, StatsReportRunners) {
    submitShell("true");
    ASSERT_TRUE(scheduler_->waitForIdle(5s));

    auto stats = scheduler_->getStats();
    EXPECT_EQ(stats["maxConcurrent"], 3);
    EXPECT_EQ(stats["running"], 0);
    EXPECT_EQ(stats["runners"], 1);
}
