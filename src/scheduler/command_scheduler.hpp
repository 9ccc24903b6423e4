/*
 * command_scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file command_scheduler.hpp
 * @brief Dispatches queued commands onto a bounded pool of process runners
 * @date 2025-03-02
 * @version 1.0.0
 */

#ifndef DEVFLOW_SCHEDULER_COMMAND_SCHEDULER_HPP
#define DEVFLOW_SCHEDULER_COMMAND_SCHEDULER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "app/eventloop.hpp"
#include "command_resolver.hpp"
#include "core/types.hpp"
#include "events/event_bus.hpp"
#include "process/launcher.hpp"
#include "process/process_runner.hpp"
#include "queue/execution_queue.hpp"

namespace devflow::scheduler {

struct SchedulerConfig {
    int maxConcurrent{3};
    process::RunnerConfig runner;
};

using ResultHandler = std::function<void(const CommandResult&)>;

/**
 * @brief Glue between the ExecutionQueue and the ProcessRunners
 *
 * Commands submitted in the same loop round are dispatched together, in
 * priority order, on the next round. Runner events for an execution are
 * folded back into the queue; the terminal result moves it into history.
 * Single-threaded: call from the EventLoop's thread only.
 */
class CommandScheduler {
public:
    static constexpr int kDefaultMaxConcurrent = 3;
    static constexpr int kMinConcurrent = 1;
    static constexpr int kMaxConcurrent = 10;

    CommandScheduler(app::EventLoop& loop,
                     std::shared_ptr<events::EventBus> bus,
                     std::shared_ptr<process::IProcessLauncher> launcher,
                     CommandResolver resolver, SchedulerConfig config = {});
    ~CommandScheduler();

    CommandScheduler(const CommandScheduler&) = delete;
    CommandScheduler& operator=(const CommandScheduler&) = delete;

    /**
     * @brief Queues a command for execution.
     *
     * A command the resolver rejects is recorded as a failed result with
     * reason `validation` when it is dispatched.
     *
     * @return The command id (generated when empty)
     */
    auto submit(QueuedCommand command) -> std::string;

    auto submit(CommandAction action, std::string project,
                Priority priority = Priority::Normal,
                CommandOptions options = {}) -> std::string;

    /**
     * @brief Checks a command against the resolver without queueing it
     * @throws ValidationError
     */
    void validate(const QueuedCommand& command) const;

    /**
     * @brief Cancels a running or queued command
     * @return false when the id is unknown
     */
    auto cancel(const std::string& id) -> bool;

    /**
     * @brief Cancels every running command and drains the queue
     * @return Number of commands cancelled
     */
    auto cancelAll() -> std::size_t;

    /**
     * @brief Re-queues a failed command
     * @return New command id
     */
    auto retryCommand(const std::string& id) -> std::optional<std::string>;

    /**
     * @brief Changes the pool size, clamped to [1, 10]
     */
    void setMaxConcurrent(int maxConcurrent);
    [[nodiscard]] auto maxConcurrent() const noexcept -> int {
        return max_concurrent_;
    }

    /**
     * @brief Live output of a running command, or the recorded output of a
     * finished one
     */
    [[nodiscard]] auto getCommandOutput(const std::string& id) const
        -> std::optional<std::string>;

    /**
     * @brief Clears the live output buffers of a running command
     */
    auto clearCommandOutput(const std::string& id) -> bool;

    /**
     * @brief Pumps the loop until nothing is queued or running
     */
    auto waitForIdle(std::optional<std::chrono::milliseconds> timeout =
                         std::nullopt) -> bool;

    [[nodiscard]] auto isIdle() const -> bool;
    [[nodiscard]] auto runningCount() const -> std::size_t;

    /**
     * @brief Called after each command's result lands in history
     */
    void setResultHandler(ResultHandler handler);

    [[nodiscard]] auto queue() -> queue::ExecutionQueue& { return queue_; }
    [[nodiscard]] auto queue() const -> const queue::ExecutionQueue& {
        return queue_;
    }
    [[nodiscard]] auto bus() const -> const std::shared_ptr<events::EventBus>& {
        return bus_;
    }

    [[nodiscard]] auto getStats() const -> nlohmann::json;

private:
    struct Slot {
        std::unique_ptr<process::ProcessRunner> runner;
        std::string executionId;
        events::Subscription subscription;
    };

    void schedulePump();
    void pump();
    auto acquireSlot() -> Slot&;
    void dispatch(Slot& slot, QueuedCommand command);
    void rejectCommand(const CommandExecution& execution,
                       const std::string& message, ErrorKind reason);
    void onEvent(const events::ExecutionEvent& event);
    void onRunnerComplete(Slot& slot, const ProcessResult& result);
    [[nodiscard]] auto findSlot(const std::string& id) const -> Slot*;
    auto nextId(CommandAction action) -> std::string;

    app::EventLoop& loop_;
    std::shared_ptr<events::EventBus> bus_;
    std::shared_ptr<process::IProcessLauncher> launcher_;
    CommandResolver resolver_;
    process::RunnerConfig runner_config_;
    int max_concurrent_;

    queue::ExecutionQueue queue_;
    std::vector<std::unique_ptr<Slot>> slots_;
    ResultHandler result_handler_;

    bool pump_pending_{false};
    std::uint64_t id_counter_{0};
    std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

}  // namespace devflow::scheduler

#endif  // DEVFLOW_SCHEDULER_COMMAND_SCHEDULER_HPP
