/*
 * command_scheduler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_scheduler.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/exception.hpp"

namespace devflow::scheduler {

namespace {

auto clampConcurrency(int value) -> int {
    return std::clamp(value, CommandScheduler::kMinConcurrent,
                      CommandScheduler::kMaxConcurrent);
}

auto joinChunks(const std::vector<std::string>& chunks) -> std::string {
    std::string joined;
    for (const auto& chunk : chunks) {
        joined += chunk;
    }
    return joined;
}

}  // namespace

CommandScheduler::CommandScheduler(
    app::EventLoop& loop, std::shared_ptr<events::EventBus> bus,
    std::shared_ptr<process::IProcessLauncher> launcher,
    CommandResolver resolver, SchedulerConfig config)
    : loop_(loop),
      bus_(bus ? std::move(bus) : events::EventBus::create()),
      launcher_(launcher ? std::move(launcher)
                         : process::createDefaultLauncher()),
      resolver_(std::move(resolver)),
      runner_config_(config.runner),
      max_concurrent_(clampConcurrency(config.maxConcurrent)) {
    if (max_concurrent_ != config.maxConcurrent) {
        spdlog::warn("CommandScheduler: maxConcurrent {} clamped to {}",
                     config.maxConcurrent, max_concurrent_);
    }
    spdlog::debug("CommandScheduler: initialized with {} runner(s)",
                  max_concurrent_);
}

CommandScheduler::~CommandScheduler() {
    const auto running = runningCount();
    if (running > 0) {
        spdlog::warn("CommandScheduler: shutting down with {} running "
                     "command(s)",
                     running);
    }
    for (auto& slot : slots_) {
        slot->subscription.unsubscribe();
    }
    slots_.clear();
}

auto CommandScheduler::submit(QueuedCommand command) -> std::string {
    if (command.id.empty()) {
        command.id = nextId(command.action);
    }
    auto id = command.id;
    spdlog::info("CommandScheduler: submitted {} ({} {})", id,
                 actionToString(command.action), command.project);
    queue_.enqueue(std::move(command));
    schedulePump();
    return id;
}

auto CommandScheduler::submit(CommandAction action, std::string project,
                              Priority priority, CommandOptions options)
    -> std::string {
    QueuedCommand command;
    command.action = action;
    command.project = std::move(project);
    command.priority = priority;
    command.options = std::move(options);
    command.timestamp = SystemClock::now();
    return submit(std::move(command));
}

void CommandScheduler::validate(const QueuedCommand& command) const {
    [[maybe_unused]] auto resolved = resolver_.resolve(command);
}

auto CommandScheduler::cancel(const std::string& id) -> bool {
    if (auto* slot = findSlot(id)) {
        // The runner keeps its slot until the process is gone
        slot->runner->cancel();
        queue_.cancel(id);
        return true;
    }
    if (queue_.cancel(id)) {
        return true;
    }
    return queue_.removeFromQueue(id) > 0;
}

auto CommandScheduler::cancelAll() -> std::size_t {
    for (auto& slot : slots_) {
        if (slot->runner->isRunning()) {
            slot->runner->cancel();
        }
    }
    return queue_.cancelAll();
}

auto CommandScheduler::retryCommand(const std::string& id)
    -> std::optional<std::string> {
    auto newId = queue_.retryCommand(id);
    if (newId) {
        schedulePump();
    }
    return newId;
}

void CommandScheduler::setMaxConcurrent(int maxConcurrent) {
    max_concurrent_ = clampConcurrency(maxConcurrent);
    spdlog::info("CommandScheduler: maxConcurrent set to {}", max_concurrent_);
    schedulePump();
}

auto CommandScheduler::getCommandOutput(const std::string& id) const
    -> std::optional<std::string> {
    if (auto* slot = findSlot(id)) {
        return slot->runner->getCurrentOutput();
    }
    if (auto active = queue_.getActive(id)) {
        return joinChunks(active->output);
    }
    if (auto result = queue_.findInHistory(id)) {
        return joinChunks(result->output);
    }
    return std::nullopt;
}

auto CommandScheduler::clearCommandOutput(const std::string& id) -> bool {
    if (auto* slot = findSlot(id)) {
        slot->runner->clearOutput();
        return true;
    }
    return false;
}

auto CommandScheduler::waitForIdle(
    std::optional<std::chrono::milliseconds> timeout) -> bool {
    return loop_.runUntil([this] { return isIdle(); }, timeout);
}

auto CommandScheduler::isIdle() const -> bool {
    return !pump_pending_ && runningCount() == 0 && queue_.queueSize() == 0;
}

auto CommandScheduler::runningCount() const -> std::size_t {
    return static_cast<std::size_t>(
        std::count_if(slots_.begin(), slots_.end(), [](const auto& slot) {
            return slot->runner->isRunning();
        }));
}

void CommandScheduler::setResultHandler(ResultHandler handler) {
    result_handler_ = std::move(handler);
}

auto CommandScheduler::getStats() const -> nlohmann::json {
    auto stats = queue_.getStats();
    stats["maxConcurrent"] = max_concurrent_;
    stats["running"] = runningCount();
    stats["runners"] = slots_.size();
    return stats;
}

void CommandScheduler::schedulePump() {
    if (pump_pending_) {
        return;
    }
    pump_pending_ = true;
    loop_.post([this, alive = std::weak_ptr<bool>(alive_)] {
        if (alive.expired()) {
            return;
        }
        pump_pending_ = false;
        pump();
    });
}

void CommandScheduler::pump() {
    while (runningCount() < static_cast<std::size_t>(max_concurrent_)) {
        auto next = queue_.dequeue();
        if (!next) {
            return;
        }
        dispatch(acquireSlot(), std::move(*next));
    }
}

auto CommandScheduler::acquireSlot() -> Slot& {
    for (auto& slot : slots_) {
        if (!slot->runner->isRunning()) {
            return *slot;
        }
    }
    auto slot = std::make_unique<Slot>();
    slot->runner = std::make_unique<process::ProcessRunner>(
        loop_, bus_, launcher_, runner_config_);
    slots_.push_back(std::move(slot));
    spdlog::debug("CommandScheduler: created runner #{}", slots_.size());
    return *slots_.back();
}

void CommandScheduler::dispatch(Slot& slot, QueuedCommand command) {
    CommandExecution execution;
    execution.id = command.id;
    execution.action = command.action;
    execution.project = command.project;
    execution.priority = command.priority;
    execution.options = command.options;
    execution.startTime = SystemClock::now();
    execution.status = ExecutionStatus::Running;

    ResolvedCommand resolved;
    try {
        resolved = resolver_.resolve(command);
    } catch (const ValidationError& e) {
        spdlog::warn("CommandScheduler: rejected {}: {}", command.id,
                     e.what());
        rejectCommand(execution, e.what(), ErrorKind::Validation);
        return;
    }

    queue_.start(execution);
    slot.executionId = command.id;
    slot.subscription = bus_->subscribeTo(
        command.id,
        [this](const events::ExecutionEvent& event) { onEvent(event); });

    auto started = slot.runner->execute(
        resolved.commandLine, std::move(resolved.runOptions),
        [this, slotPtr = &slot](const ProcessResult& result) {
            onRunnerComplete(*slotPtr, result);
        });
    if (!started) {
        slot.subscription.unsubscribe();
        slot.executionId.clear();
        const auto reason =
            started.error().code == process::RunnerError::InvalidCommand
                ? ErrorKind::Validation
                : ErrorKind::Spawn;
        if (auto active = queue_.getActive(command.id)) {
            auto record = queue::ExecutionQueue::makeResult(
                *active, ExecutionStatus::Failed, started.error().describe(),
                reason);
            queue_.complete(command.id, record);
            if (result_handler_) {
                result_handler_(record);
            }
        }
    }
}

void CommandScheduler::rejectCommand(const CommandExecution& execution,
                                     const std::string& message,
                                     ErrorKind reason) {
    queue_.start(execution);
    auto record = queue::ExecutionQueue::makeResult(
        execution, ExecutionStatus::Failed, message, reason);
    queue_.complete(execution.id, record);

    ProcessResult result;
    result.success = false;
    result.exitCode = -1;
    result.error = message;
    result.reason = reason;
    bus_->publish(events::ExecutionEvent::complete(execution.id, result));

    if (result_handler_) {
        result_handler_(record);
    }
}

void CommandScheduler::onEvent(const events::ExecutionEvent& event) {
    switch (event.kind) {
        case events::EventKind::Output:
            queue_.appendOutput(event.executionId, event.text);
            break;
        case events::EventKind::Progress:
            queue_.updateProgress(event.executionId, event.progress);
            break;
        case events::EventKind::Error:
        case events::EventKind::Status:
        case events::EventKind::Complete:
            break;
    }
}

void CommandScheduler::onRunnerComplete(Slot& slot, const ProcessResult& result) {
    const auto id = std::move(slot.executionId);
    slot.executionId.clear();
    slot.subscription.unsubscribe();

    if (auto active = queue_.getActive(id)) {
        ExecutionStatus status = ExecutionStatus::Failed;
        if (result.success) {
            status = ExecutionStatus::Completed;
        } else if (result.reason == ErrorKind::Cancellation) {
            status = ExecutionStatus::Cancelled;
        }
        auto record = queue::ExecutionQueue::makeResult(*active, status,
                                                        result.error,
                                                        result.reason);
        record.duration = result.duration;
        queue_.complete(id, record);
        if (result_handler_) {
            result_handler_(record);
        }
    } else {
        // Cancelled through the queue while the process was still exiting
        spdlog::debug("CommandScheduler: {} already finalized", id);
        auto record = queue_.findInHistory(id);
        if (record && result_handler_) {
            result_handler_(*record);
        }
    }

    schedulePump();
}

auto CommandScheduler::findSlot(const std::string& id) const -> Slot* {
    for (const auto& slot : slots_) {
        if (slot->runner->isRunning() && slot->executionId == id) {
            return slot.get();
        }
    }
    return nullptr;
}

auto CommandScheduler::nextId(CommandAction action) -> std::string {
    return fmt::format("{}-{}-{}", actionToString(action),
                       epochMillis(SystemClock::now()), ++id_counter_);
}

}  // namespace devflow::scheduler
