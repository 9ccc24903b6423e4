/*
 * execution_queue.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "execution_queue.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "analytics.hpp"

namespace devflow::queue {

ExecutionQueue::ExecutionQueue(std::size_t maxHistory)
    : max_history_(std::max<std::size_t>(maxHistory, 1)) {}

void ExecutionQueue::enqueue(QueuedCommand command) {
    std::lock_guard lock(mutex_);
    spdlog::debug("ExecutionQueue: enqueued {} ({}, {})", command.id,
                  actionToString(command.action),
                  priorityToString(command.priority));
    queue_.push_back(std::move(command));
    sortQueue();
}

auto ExecutionQueue::dequeue() -> std::optional<QueuedCommand> {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    QueuedCommand next = std::move(queue_.front());
    queue_.erase(queue_.begin());
    return next;
}

auto ExecutionQueue::removeFromQueue(const std::string& id) -> std::size_t {
    std::lock_guard lock(mutex_);
    return std::erase_if(queue_,
                         [&id](const QueuedCommand& c) { return c.id == id; });
}

void ExecutionQueue::start(CommandExecution execution) {
    std::lock_guard lock(mutex_);
    std::erase_if(queue_, [&execution](const QueuedCommand& c) {
        return c.id == execution.id;
    });

    if (active_.contains(execution.id)) {
        spdlog::warn("ExecutionQueue: replacing active execution {}",
                     execution.id);
    }
    execution.status = ExecutionStatus::Running;
    execution.progress = std::clamp(execution.progress, 0, 100);
    auto id = execution.id;
    active_.insert_or_assign(std::move(id), std::move(execution));
}

auto ExecutionQueue::updateProgress(const std::string& id, int progress,
                                    std::optional<std::string> outputChunk)
    -> bool {
    std::lock_guard lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
        return false;
    }
    it->second.progress = std::clamp(progress, 0, 100);
    if (outputChunk && !outputChunk->empty()) {
        it->second.output.push_back(std::move(*outputChunk));
    }
    return true;
}

auto ExecutionQueue::appendOutput(const std::string& id, std::string chunk)
    -> bool {
    std::lock_guard lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
        return false;
    }
    if (!chunk.empty()) {
        it->second.output.push_back(std::move(chunk));
    }
    return true;
}

auto ExecutionQueue::complete(const std::string& id, CommandResult result)
    -> bool {
    std::lock_guard lock(mutex_);
    return completeLocked(id, std::move(result));
}

auto ExecutionQueue::completeLocked(const std::string& id,
                                    CommandResult result) -> bool {
    auto it = active_.find(id);
    if (it == active_.end()) {
        spdlog::debug("ExecutionQueue: ignoring completion of inactive {}",
                      id);
        return false;
    }
    active_.erase(it);

    result.id = id;
    if (!isTerminal(result.status)) {
        result.status = result.success ? ExecutionStatus::Completed
                                       : ExecutionStatus::Failed;
    }
    result.progress = std::clamp(result.progress, 0, 100);
    spdlog::debug("ExecutionQueue: {} -> {}", id,
                  statusToString(result.status));
    appendHistory(std::move(result));
    return true;
}

void ExecutionQueue::appendHistory(CommandResult result) {
    history_.push_back(std::move(result));
    while (history_.size() > max_history_) {
        history_.pop_front();
    }
}

auto ExecutionQueue::cancel(const std::string& id) -> bool {
    std::lock_guard lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
        return false;
    }
    auto result = makeResult(it->second, ExecutionStatus::Cancelled,
                             std::string("Command cancelled"),
                             ErrorKind::Cancellation);
    spdlog::info("ExecutionQueue: cancelled {}", id);
    return completeLocked(id, std::move(result));
}

auto ExecutionQueue::cancelAll() -> std::size_t {
    std::lock_guard lock(mutex_);
    const auto now = SystemClock::now();
    std::size_t cancelled = 0;

    std::vector<std::string> ids;
    ids.reserve(active_.size());
    for (const auto& [id, execution] : active_) {
        ids.push_back(id);
    }
    // Deterministic history order: oldest start first
    std::sort(ids.begin(), ids.end(),
              [this](const std::string& a, const std::string& b) {
                  return active_.at(a).startTime < active_.at(b).startTime;
              });
    for (const auto& id : ids) {
        auto result = makeResult(active_.at(id), ExecutionStatus::Cancelled,
                                 std::string("Command cancelled"),
                                 ErrorKind::Cancellation, now);
        if (completeLocked(id, std::move(result))) {
            ++cancelled;
        }
    }

    for (auto& pending : queue_) {
        CommandExecution execution;
        execution.id = pending.id;
        execution.action = pending.action;
        execution.project = pending.project;
        execution.priority = pending.priority;
        execution.options = std::move(pending.options);
        execution.startTime = now;
        appendHistory(makeResult(execution, ExecutionStatus::Cancelled,
                                 std::string("Cancelled before start"),
                                 ErrorKind::Cancellation, now));
        ++cancelled;
    }
    queue_.clear();

    spdlog::info("ExecutionQueue: cancelled {} command(s)", cancelled);
    return cancelled;
}

auto ExecutionQueue::retryCommand(const std::string& id)
    -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(history_.rbegin(), history_.rend(),
                           [&id](const CommandResult& r) { return r.id == id; });
    if (it == history_.rend() || it->success) {
        return std::nullopt;
    }

    QueuedCommand retry;
    retry.timestamp = SystemClock::now();
    retry.id = fmt::format("{}-retry-{}", id, epochMillis(retry.timestamp));
    retry.action = it->action;
    retry.project = it->project;
    retry.priority = Priority::Normal;
    retry.options = it->options;

    auto newId = retry.id;
    spdlog::info("ExecutionQueue: retrying {} as {}", id, newId);
    queue_.push_back(std::move(retry));
    sortQueue();
    return newId;
}

void ExecutionQueue::clearHistory() {
    std::lock_guard lock(mutex_);
    history_.clear();
}

auto ExecutionQueue::getQueue() const -> std::vector<QueuedCommand> {
    std::lock_guard lock(mutex_);
    return queue_;
}

auto ExecutionQueue::getActiveExecutions() const
    -> std::vector<CommandExecution> {
    std::lock_guard lock(mutex_);
    return activeByStartLocked();
}

auto ExecutionQueue::activeByStartLocked() const
    -> std::vector<CommandExecution> {
    std::vector<CommandExecution> result;
    result.reserve(active_.size());
    for (const auto& [id, execution] : active_) {
        result.push_back(execution);
    }
    std::sort(result.begin(), result.end(),
              [](const CommandExecution& a, const CommandExecution& b) {
                  return a.startTime < b.startTime;
              });
    return result;
}

auto ExecutionQueue::getHistory() const -> std::vector<CommandResult> {
    std::lock_guard lock(mutex_);
    return {history_.begin(), history_.end()};
}

auto ExecutionQueue::getActive(const std::string& id) const
    -> std::optional<CommandExecution> {
    std::lock_guard lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto ExecutionQueue::findInHistory(const std::string& id) const
    -> std::optional<CommandResult> {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(history_.rbegin(), history_.rend(),
                           [&id](const CommandResult& r) { return r.id == id; });
    if (it == history_.rend()) {
        return std::nullopt;
    }
    return *it;
}

auto ExecutionQueue::isActive(const std::string& id) const -> bool {
    std::lock_guard lock(mutex_);
    return active_.contains(id);
}

auto ExecutionQueue::queueSize() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

auto ExecutionQueue::activeCount() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return active_.size();
}

auto ExecutionQueue::historySize() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return history_.size();
}

auto ExecutionQueue::snapshot() const -> QueueSnapshot {
    std::lock_guard lock(mutex_);
    QueueSnapshot snap;
    snap.queue = queue_;
    snap.active = activeByStartLocked();
    snap.history.assign(history_.begin(), history_.end());
    snap.takenAt = SystemClock::now();
    return snap;
}

auto ExecutionQueue::getStats() const -> nlohmann::json {
    auto stats = summarize(snapshot());
    stats["maxHistory"] = max_history_;
    return stats;
}

auto ExecutionQueue::makeResult(const CommandExecution& execution,
                                ExecutionStatus status,
                                std::optional<std::string> error,
                                ErrorKind reason, TimePoint endTime)
    -> CommandResult {
    CommandResult result;
    static_cast<CommandExecution&>(result) = execution;
    result.status = status;
    result.endTime = endTime;
    result.error = std::move(error);
    result.reason = reason;
    result.success = status == ExecutionStatus::Completed;
    if (result.success) {
        result.progress = 100;
    }
    result.duration = std::max(
        std::chrono::milliseconds(0),
        std::chrono::duration_cast<std::chrono::milliseconds>(
            endTime - execution.startTime));
    return result;
}

void ExecutionQueue::sortQueue() {
    std::stable_sort(queue_.begin(), queue_.end(),
                     [](const QueuedCommand& a, const QueuedCommand& b) {
                         const int ra = priorityRank(a.priority);
                         const int rb = priorityRank(b.priority);
                         if (ra != rb) {
                             return ra > rb;
                         }
                         return a.timestamp < b.timestamp;
                     });
}

}  // namespace devflow::queue
