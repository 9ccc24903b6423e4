/*
 * execution_queue.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file execution_queue.hpp
 * @brief Priority-ordered command queue with active set and bounded history
 * @date 2025-03-02
 * @version 1.0.0
 */

#ifndef DEVFLOW_QUEUE_EXECUTION_QUEUE_HPP
#define DEVFLOW_QUEUE_EXECUTION_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/types.hpp"

namespace devflow::queue {

/**
 * @brief Immutable copy of the queue state used by analytics
 */
struct QueueSnapshot {
    std::vector<QueuedCommand> queue;       ///< Execution order
    std::vector<CommandExecution> active;   ///< Ordered by start time
    std::vector<CommandResult> history;     ///< Oldest first
    TimePoint takenAt{SystemClock::now()};
};

/**
 * @brief Owns the pending queue, the active set and the history
 *
 * Every mutation goes through this class. Terminal transitions go through
 * complete(), which evicts the id from the active set, so a terminal record
 * is never modified afterwards.
 */
class ExecutionQueue {
public:
    static constexpr std::size_t kMaxHistory = 50;

    explicit ExecutionQueue(std::size_t maxHistory = kMaxHistory);

    /**
     * @brief Inserts a command; priority desc, then timestamp asc.
     * Duplicate ids are accepted.
     */
    void enqueue(QueuedCommand command);

    /**
     * @brief Removes and returns the next command to run
     */
    auto dequeue() -> std::optional<QueuedCommand>;

    /**
     * @brief Removes every queued entry with the id
     * @return Number of entries removed
     */
    auto removeFromQueue(const std::string& id) -> std::size_t;

    /**
     * @brief Marks an execution active.
     *
     * Queued entries with the same id are dropped. An active execution with
     * the same id is replaced.
     */
    void start(CommandExecution execution);

    /**
     * @brief Sets progress (clamped to 0-100) and appends an output chunk.
     * @return false when the id is not active
     */
    auto updateProgress(const std::string& id, int progress,
                        std::optional<std::string> outputChunk = std::nullopt)
        -> bool;

    /**
     * @brief Appends an output chunk without touching progress
     */
    auto appendOutput(const std::string& id, std::string chunk) -> bool;

    /**
     * @brief Moves an active execution into history.
     *
     * History is capped; the oldest entries are evicted first.
     *
     * @return false when the id is not active (the result is dropped)
     */
    auto complete(const std::string& id, CommandResult result) -> bool;

    /**
     * @brief Completes an active execution as cancelled
     */
    auto cancel(const std::string& id) -> bool;

    /**
     * @brief Cancels every active execution and drains the pending queue.
     *
     * Pending entries are recorded in history as cancelled too.
     *
     * @return Number of executions and queued entries cancelled
     */
    auto cancelAll() -> std::size_t;

    /**
     * @brief Re-enqueues a failed or cancelled command at normal priority
     * @return The new id, or nullopt if absent or successful
     */
    auto retryCommand(const std::string& id) -> std::optional<std::string>;

    void clearHistory();

    [[nodiscard]] auto getQueue() const -> std::vector<QueuedCommand>;
    [[nodiscard]] auto getActiveExecutions() const
        -> std::vector<CommandExecution>;
    [[nodiscard]] auto getHistory() const -> std::vector<CommandResult>;
    [[nodiscard]] auto getActive(const std::string& id) const
        -> std::optional<CommandExecution>;

    /**
     * @brief Most recent history entry with the id
     */
    [[nodiscard]] auto findInHistory(const std::string& id) const
        -> std::optional<CommandResult>;

    [[nodiscard]] auto isActive(const std::string& id) const -> bool;
    [[nodiscard]] auto queueSize() const -> std::size_t;
    [[nodiscard]] auto activeCount() const -> std::size_t;
    [[nodiscard]] auto historySize() const -> std::size_t;
    [[nodiscard]] auto maxHistory() const noexcept -> std::size_t {
        return max_history_;
    }

    [[nodiscard]] auto snapshot() const -> QueueSnapshot;

    /**
     * @brief Counters and analytics as JSON
     */
    [[nodiscard]] auto getStats() const -> nlohmann::json;

    /**
     * @brief Builds the terminal record for an execution
     */
    [[nodiscard]] static auto makeResult(const CommandExecution& execution,
                                         ExecutionStatus status,
                                         std::optional<std::string> error,
                                         ErrorKind reason,
                                         TimePoint endTime = SystemClock::now())
        -> CommandResult;

private:
    void sortQueue();
    auto completeLocked(const std::string& id, CommandResult result) -> bool;
    void appendHistory(CommandResult result);
    [[nodiscard]] auto activeByStartLocked() const
        -> std::vector<CommandExecution>;

    std::size_t max_history_;
    mutable std::mutex mutex_;
    std::vector<QueuedCommand> queue_;
    std::unordered_map<std::string, CommandExecution> active_;
    std::deque<CommandResult> history_;
};

}  // namespace devflow::queue

#endif  // DEVFLOW_QUEUE_EXECUTION_QUEUE_HPP
