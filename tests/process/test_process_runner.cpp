/*
 * test_process_runner.cpp - Tests for the streaming process runner
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "app/eventloop.hpp"
#include "events/event_bus.hpp"
#include "process/launcher.hpp"
#include "process/process_runner.hpp"

#include <signal.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace devflow;
using namespace devflow::process;
using namespace std::chrono_literals;

namespace {

auto shell(const std::string& script) -> CommandLine {
    return CommandLine{"/bin/sh", {"-c", script}};
}

/**
 * Forwards to the real child and records every signal sent to it.
 */
class RecordingChild : public IChildProcess {
public:
    using SignalTimes =
        std::vector<std::chrono::steady_clock::time_point>;

    RecordingChild(std::unique_ptr<IChildProcess> inner,
                   std::shared_ptr<std::vector<int>> signals,
                   std::shared_ptr<SignalTimes> times)
        : inner_(std::move(inner)),
          signals_(std::move(signals)),
          times_(std::move(times)) {}

    auto pid() const noexcept -> int override { return inner_->pid(); }
    auto stdoutFd() const noexcept -> int override { return inner_->stdoutFd(); }
    auto stderrFd() const noexcept -> int override { return inner_->stderrFd(); }
    auto exitFd() const noexcept -> int override { return inner_->exitFd(); }
    void closeStdout() override { inner_->closeStdout(); }
    void closeStderr() override { inner_->closeStderr(); }
    auto kill(int signal) -> Result<void> override {
        signals_->push_back(signal);
        times_->push_back(std::chrono::steady_clock::now());
        return inner_->kill(signal);
    }
    auto tryReap() -> std::optional<ExitStatus> override {
        return inner_->tryReap();
    }
    auto hasExited() const noexcept -> bool override {
        return inner_->hasExited();
    }

private:
    std::unique_ptr<IChildProcess> inner_;
    std::shared_ptr<std::vector<int>> signals_;
    std::shared_ptr<SignalTimes> times_;
};

class RecordingLauncher : public IProcessLauncher {
public:
    auto launch(const CommandLine& command, const LaunchOptions& options)
        -> Result<std::unique_ptr<IChildProcess>> override {
        ++launches;
        auto child = real_.launch(command, options);
        if (!child) {
            return std::unexpected(child.error());
        }
        return std::make_unique<RecordingChild>(std::move(*child), signals,
                                                signalTimes);
    }

    std::shared_ptr<std::vector<int>> signals =
        std::make_shared<std::vector<int>>();
    std::shared_ptr<RecordingChild::SignalTimes> signalTimes =
        std::make_shared<RecordingChild::SignalTimes>();
    int launches{0};

private:
    PosixProcessLauncher real_;
};

}  // namespace

class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_ = events::EventBus::create();
        launcher_ = std::make_shared<RecordingLauncher>();
        RunnerConfig config;
        config.killGracePeriod = 300ms;
        config.progressTick = 20ms;
        runner_ = std::make_unique<ProcessRunner>(loop_, bus_, launcher_,
                                                  config);
        events_ = bus_->subscribe([this](const events::ExecutionEvent& event) {
            received_.push_back(event);
        });
    }

    void TearDown() override {
        events_.unsubscribe();
        runner_.reset();
    }

    auto count(events::EventKind kind) const -> std::size_t {
        std::size_t n = 0;
        for (const auto& event : received_) {
            if (event.kind == kind) {
                ++n;
            }
        }
        return n;
    }

    app::EventLoop loop_;
    std::shared_ptr<events::EventBus> bus_;
    std::shared_ptr<RecordingLauncher> launcher_;
    std::unique_ptr<ProcessRunner> runner_;
    events::Subscription events_;
    std::vector<events::ExecutionEvent> received_;
};

// ============================================================================
// Completion Tests
// ============================================================================

TEST_F(ProcessRunnerTest, SuccessfulCommandStreamsOutput) {
    auto result = runner_->runSync(CommandLine{"printf", {"ok\\n"}}, {});
    ASSERT_TRUE(result.has_value());

    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_EQ(result->output, "ok\n");
    EXPECT_EQ(result->reason, ErrorKind::None);
    EXPECT_FALSE(result->error.has_value());
    EXPECT_FALSE(runner_->isRunning());

    std::string streamed;
    for (const auto& event : received_) {
        if (event.kind == events::EventKind::Output) {
            streamed += event.text;
        }
    }
    EXPECT_EQ(streamed, "ok\n");
    EXPECT_EQ(count(events::EventKind::Complete), 1u);
    ASSERT_FALSE(received_.empty());
    EXPECT_EQ(received_.front().kind, events::EventKind::Status);
    EXPECT_EQ(received_.front().text, "Starting command execution...");
    EXPECT_EQ(received_.back().kind, events::EventKind::Complete);
}

TEST_F(ProcessRunnerTest, NonZeroExitIsRuntimeFailure) {
    auto result =
        runner_->runSync(shell("echo broken >&2; exit 3"), {});
    ASSERT_TRUE(result.has_value());

    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->exitCode, 3);
    EXPECT_EQ(result->reason, ErrorKind::Runtime);
    EXPECT_EQ(result->error.value_or(""), "broken\n");
    EXPECT_EQ(runner_->getCurrentError(), "broken\n");
    EXPECT_GE(count(events::EventKind::Error), 1u);
}

TEST_F(ProcessRunnerTest, MissingProgramResolvesAsSpawnError) {
    auto result = runner_->runSync(
        CommandLine{"/nonexistent/devflow-missing-binary", {}}, {});
    ASSERT_TRUE(result.has_value());

    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->exitCode, 1);
    EXPECT_EQ(result->reason, ErrorKind::Spawn);
    EXPECT_NE(result->error.value_or("").find("devflow-missing-binary"),
              std::string::npos);
    EXPECT_EQ(count(events::EventKind::Complete), 1u);
}

TEST_F(ProcessRunnerTest, SpawnErrorIsPublishedBeforeCompletion) {
    auto result = runner_->runSync(
        CommandLine{"/nonexistent/devflow-missing-binary", {}}, {});
    ASSERT_TRUE(result.has_value());

    auto error = std::find_if(received_.begin(), received_.end(),
                              [](const events::ExecutionEvent& event) {
                                  return event.kind == events::EventKind::Error;
                              });
    ASSERT_NE(error, received_.end());
    EXPECT_EQ(error->text, result->error.value_or(""));
    EXPECT_EQ(received_.back().kind, events::EventKind::Complete);
}

TEST_F(ProcessRunnerTest, MissingWorkingDirectoryIsSpawnError) {
    RunOptions options;
    options.cwd = "/nonexistent/devflow-dir";
    auto result = runner_->runSync(CommandLine{"true", {}}, options);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->reason, ErrorKind::Spawn);
    EXPECT_EQ(result->exitCode, 1);
}

TEST_F(ProcessRunnerTest, EnvironmentAndWorkingDirectoryAreApplied) {
    RunOptions options;
    options.cwd = "/";
    options.environment["DEVFLOW_TEST_VALUE"] = "forty-two";
    auto result =
        runner_->runSync(shell("printf '%s %s' \"$DEVFLOW_TEST_VALUE\" \"$(pwd -P)\""),
                         options);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->output, "forty-two /");
}

TEST_F(ProcessRunnerTest, RejectsEmptyProgram) {
    auto started = runner_->execute(CommandLine{"", {}}, {});
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, RunnerError::InvalidCommand);
    EXPECT_EQ(launcher_->launches, 0);
}

TEST_F(ProcessRunnerTest, RejectsSecondExecutionWhileRunning) {
    ASSERT_TRUE(runner_->execute(shell("sleep 0.2"), {}).has_value());
    auto second = runner_->execute(shell("true"), {});
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, RunnerError::AlreadyRunning);

    loop_.runUntil([this] { return !runner_->isRunning(); }, 5s);
    EXPECT_FALSE(runner_->isRunning());
}

TEST_F(ProcessRunnerTest, GeneratesExecutionIdWhenMissing) {
    RunOptions options;
    options.executionId = "custom-id";
    ASSERT_TRUE(runner_->runSync(shell("true"), options).has_value());
    EXPECT_EQ(received_.back().executionId, "custom-id");

    ASSERT_TRUE(runner_->runSync(shell("true"), {}).has_value());
    EXPECT_EQ(received_.back().executionId.rfind("run-", 0), 0u);
}

// ============================================================================
// Output Buffer Tests
// ============================================================================

TEST_F(ProcessRunnerTest, ClearOutputKeepsResultComplete) {
    std::optional<ProcessResult> result;
    ASSERT_TRUE(runner_
                    ->execute(shell("echo first; echo oops >&2; sleep 0.3; "
                                    "echo second"),
                              {},
                              [&](const ProcessResult& r) { result = r; })
                    .has_value());
    std::string beforeClear;
    loop_.setTimeout(
        [&] {
            beforeClear = runner_->getCurrentOutput();
            runner_->clearOutput();
        },
        150ms);
    loop_.runUntil([&] { return result.has_value(); }, 5s);

    ASSERT_TRUE(result.has_value());
    EXPECT_NE(beforeClear.find("first\n"), std::string::npos);
    EXPECT_EQ(result->output, "first\nsecond\n");
    EXPECT_EQ(result->error.value_or(""), "oops\n");
    EXPECT_EQ(runner_->getCurrentOutput(), "second\n");
    EXPECT_TRUE(runner_->getCurrentError().empty());

    ASSERT_FALSE(received_.empty());
    ASSERT_EQ(received_.back().kind, events::EventKind::Complete);
    ASSERT_TRUE(received_.back().result.has_value());
    EXPECT_EQ(received_.back().result->output, "first\nsecond\n");
}

TEST_F(ProcessRunnerTest, CurrentOutputInterleavesBothStreams) {
    std::optional<ProcessResult> result;
    ASSERT_TRUE(runner_
                    ->execute(shell("echo out; sleep 0.05; echo err >&2; "
                                    "sleep 0.3"),
                              {},
                              [&](const ProcessResult& r) { result = r; })
                    .has_value());
    std::string midRun;
    std::string midRunError;
    loop_.setTimeout(
        [&] {
            midRun = runner_->getCurrentOutput();
            midRunError = runner_->getCurrentError();
        },
        200ms);
    loop_.runUntil([&] { return result.has_value(); }, 5s);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(midRun, "out\nerr\n");
    EXPECT_EQ(midRunError, "err\n");
    EXPECT_EQ(result->output, "out\n");
}

// ============================================================================
// Termination Tests
// ============================================================================

TEST_F(ProcessRunnerTest, TimeoutTerminatesCommand) {
    RunOptions options;
    options.timeout = 100ms;
    auto result = runner_->runSync(shell("sleep 10"), options);
    ASSERT_TRUE(result.has_value());

    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->reason, ErrorKind::Timeout);
    EXPECT_EQ(result->error.value_or("").rfind("Command timed out after 100ms", 0),
              0u);
    EXPECT_LT(result->duration, 5s);
    ASSERT_FALSE(launcher_->signals->empty());
    EXPECT_EQ(launcher_->signals->front(), SIGTERM);
}

TEST_F(ProcessRunnerTest, CancelStopsCooperativeProcess) {
    std::optional<ProcessResult> result;
    ASSERT_TRUE(runner_
                    ->execute(shell("sleep 10"), {},
                              [&](const ProcessResult& r) { result = r; })
                    .has_value());
    loop_.setTimeout([this] { runner_->cancel(); }, 50ms);
    loop_.runUntil([&] { return result.has_value(); }, 5s);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->reason, ErrorKind::Cancellation);
    EXPECT_EQ(result->error.value_or("").rfind("Command cancelled", 0), 0u);
    EXPECT_EQ(*launcher_->signals, std::vector<int>{SIGTERM});
}

TEST_F(ProcessRunnerTest, CancelEscalatesToSigkillOnce) {
    std::optional<ProcessResult> result;
    std::chrono::steady_clock::time_point lastCancel{};
    ASSERT_TRUE(runner_
                    ->execute(shell("trap '' TERM; sleep 10"), {},
                              [&](const ProcessResult& r) { result = r; })
                    .has_value());
    auto cancelNow = [&] {
        lastCancel = std::chrono::steady_clock::now();
        runner_->cancel();
    };
    loop_.setTimeout(cancelNow, 100ms);
    // A second cancel restarts the grace period but never doubles SIGKILL
    loop_.setTimeout(cancelNow, 200ms);
    loop_.runUntil([&] { return result.has_value(); }, 5s);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->reason, ErrorKind::Cancellation);
    EXPECT_EQ(result->signal.value_or(0), SIGKILL);

    const auto& signals = *launcher_->signals;
    EXPECT_EQ(std::count(signals.begin(), signals.end(), SIGKILL), 1);
    ASSERT_FALSE(signals.empty());
    EXPECT_EQ(signals.back(), SIGKILL);
    EXPECT_EQ(count(events::EventKind::Complete), 1u);

    ASSERT_EQ(launcher_->signalTimes->size(), signals.size());
    const auto killDelay = launcher_->signalTimes->back() - lastCancel;
    EXPECT_GE(killDelay, runner_->config().killGracePeriod);
}

TEST_F(ProcessRunnerTest, DefaultGracePeriodIsFiveSeconds) {
    EXPECT_EQ(RunnerConfig{}.killGracePeriod, 5000ms);
}

TEST_F(ProcessRunnerTest, CancelWhenIdleIsNoOp) {
    runner_->cancel();
    EXPECT_TRUE(launcher_->signals->empty());
    EXPECT_TRUE(received_.empty());
}

TEST_F(ProcessRunnerTest, ProgressEventsStayInRange) {
    RunOptions options;
    options.progressSteps = {"first", "second"};
    auto result = runner_->runSync(
        shell("echo first; sleep 0.1; echo second; sleep 0.1"), options);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);

    int last = 0;
    for (const auto& event : received_) {
        if (event.kind != events::EventKind::Progress) {
            continue;
        }
        EXPECT_GE(event.progress, last);
        EXPECT_LE(event.progress, 100);
        last = event.progress;
    }
    EXPECT_GT(last, 0);
}
