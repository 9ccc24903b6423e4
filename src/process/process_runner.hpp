/*
 * process_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file process_runner.hpp
 * @brief Streaming runner for one external process at a time
 * @date 2025-03-02
 * @version 1.0.0
 *
 * State machine: Idle -> Running -> (completed | failed | cancelled) -> Idle.
 * Output is streamed through the EventBus while the process runs; exactly
 * one Complete event is published per execution, whichever of exit, timeout
 * or cancellation happens first.
 */

#ifndef DEVFLOW_PROCESS_PROCESS_RUNNER_HPP
#define DEVFLOW_PROCESS_PROCESS_RUNNER_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/eventloop.hpp"
#include "core/types.hpp"
#include "events/event_bus.hpp"
#include "launcher.hpp"
#include "progress.hpp"
#include "types.hpp"

namespace devflow::process {

/**
 * @brief Runner tuning shared by every execution
 */
struct RunnerConfig {
    std::chrono::milliseconds killGracePeriod{5000};  ///< SIGTERM -> SIGKILL
    std::chrono::milliseconds progressTick{100};
    std::chrono::milliseconds expectedDuration{kDefaultExpectedDuration};
    std::chrono::milliseconds reapPollInterval{10};  ///< Without pidfd only
};

/**
 * @brief Per-execution options
 */
struct RunOptions {
    std::optional<std::filesystem::path> cwd;
    std::unordered_map<std::string, std::string> environment;
    std::optional<std::chrono::milliseconds> timeout;
    std::vector<std::string> progressSteps;  ///< Output milestones, if any
    std::string executionId;  ///< Tag for published events; generated if empty
};

enum class RunnerState { Idle, Running };

using CompletionHandler = std::function<void(const ProcessResult&)>;

/**
 * @brief Runs one external process, streaming its output
 *
 * Not thread-safe: every method must be called on the EventLoop's thread.
 */
class ProcessRunner {
public:
    ProcessRunner(app::EventLoop& loop, std::shared_ptr<events::EventBus> bus,
                  std::shared_ptr<IProcessLauncher> launcher,
                  RunnerConfig config = {});
    ~ProcessRunner();

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    /**
     * @brief Starts a process.
     *
     * Spawn failures are not returned here: they resolve asynchronously as a
     * failed result with exit code 1, like any other completion.
     *
     * @param command Program and arguments
     * @param options Working directory, environment, timeout, milestones
     * @param onComplete Invoked once with the terminal result
     * @return AlreadyRunning or InvalidCommand on rejection
     */
    auto execute(const CommandLine& command, RunOptions options,
                 CompletionHandler onComplete = {}) -> Result<void>;

    /**
     * @brief Executes and pumps the event loop until the result is ready
     */
    auto runSync(const CommandLine& command, RunOptions options)
        -> Result<ProcessResult>;

    /**
     * @brief Requests graceful termination, escalating after the grace period.
     *
     * No-op when idle. A repeated call re-sends SIGTERM and restarts the
     * grace period.
     */
    void cancel();

    [[nodiscard]] auto isRunning() const noexcept -> bool {
        return state_ == RunnerState::Running;
    }
    [[nodiscard]] auto state() const noexcept -> RunnerState { return state_; }
    [[nodiscard]] auto executionId() const -> const std::string& {
        return execution_id_;
    }
    [[nodiscard]] auto pid() const -> std::optional<int>;
    [[nodiscard]] auto progress() const -> int;

    /**
     * @brief Stdout and stderr of the current run, interleaved in arrival
     * order, since the last clearOutput()
     */
    [[nodiscard]] auto getCurrentOutput() const -> const std::string& {
        return output_;
    }
    /**
     * @brief Stderr only, since the last clearOutput()
     */
    [[nodiscard]] auto getCurrentError() const -> const std::string& {
        return error_;
    }
    /**
     * @brief Resets the display buffers; the terminal result keeps the full
     * output of the run
     */
    void clearOutput();

    [[nodiscard]] auto config() const -> const RunnerConfig& { return config_; }

private:
    enum class Stream { Stdout, Stderr };

    void watchChild();
    void drain(Stream stream);
    void handleChunk(Stream stream, std::string chunk);
    void onExitReady();
    void onTick();
    void onTimeout();
    void requestTermination(ErrorKind reason);
    void forceKill();
    void finish(const ExitStatus& status);
    void finishWithSpawnError(std::string message);
    void resolve(ProcessResult result);
    void teardown();
    void publishProgress(const ProgressUpdate& update);
    [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds;

    app::EventLoop& loop_;
    std::shared_ptr<events::EventBus> bus_;
    std::shared_ptr<IProcessLauncher> launcher_;
    RunnerConfig config_;

    RunnerState state_{RunnerState::Idle};
    std::unique_ptr<IChildProcess> child_;
    std::unique_ptr<IProgressEstimator> estimator_;
    CompletionHandler on_complete_;

    std::string execution_id_;
    std::string output_;  ///< Display buffer, both streams
    std::string error_;   ///< Display buffer, stderr
    std::string run_stdout_;
    std::string run_stderr_;
    app::EventLoop::Clock::time_point started_{};
    std::optional<std::chrono::milliseconds> timeout_;
    std::optional<ErrorKind> termination_;
    bool sigkill_sent_{false};

    app::EventLoop::TimerId tick_timer_{app::EventLoop::kInvalidTimer};
    app::EventLoop::TimerId timeout_timer_{app::EventLoop::kInvalidTimer};
    app::EventLoop::TimerId kill_timer_{app::EventLoop::kInvalidTimer};
    app::EventLoop::TimerId reap_timer_{app::EventLoop::kInvalidTimer};

    std::uint64_t generation_{0};
    std::uint64_t run_counter_{0};
    std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

}  // namespace devflow::process

#endif  // DEVFLOW_PROCESS_PROCESS_RUNNER_HPP
