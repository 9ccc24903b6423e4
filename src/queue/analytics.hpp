/*
 * analytics.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file analytics.hpp
 * @brief Derived statistics computed from a queue snapshot
 * @date 2025-03-02
 * @version 1.0.0
 *
 * Every function here is pure: it reads the snapshot it is given and never
 * touches the live queue.
 */

#ifndef DEVFLOW_QUEUE_ANALYTICS_HPP
#define DEVFLOW_QUEUE_ANALYTICS_HPP

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/types.hpp"
#include "execution_queue.hpp"

namespace devflow::queue {

enum class OverallStatus { Idle, Running, Queued };

[[nodiscard]] constexpr std::string_view overallStatusToString(
    OverallStatus status) noexcept {
    switch (status) {
        case OverallStatus::Idle: return "idle";
        case OverallStatus::Running: return "running";
        case OverallStatus::Queued: return "queued";
    }
    return "idle";
}

/**
 * @brief Pending commands split by priority, each in execution order
 */
struct PriorityBuckets {
    std::vector<QueuedCommand> high;
    std::vector<QueuedCommand> normal;
    std::vector<QueuedCommand> low;
};

/**
 * @brief Successful entries divided by history length; 0 for no history
 */
[[nodiscard]] auto successRate(const std::vector<CommandResult>& history)
    -> double;

/**
 * @brief Mean of endTime - startTime over entries with an end time
 */
[[nodiscard]] auto averageExecutionTime(
    const std::vector<CommandResult>& history) -> std::chrono::milliseconds;

[[nodiscard]] auto successRateByAction(
    const std::vector<CommandResult>& history, CommandAction action) -> double;

[[nodiscard]] auto averageExecutionTimeByAction(
    const std::vector<CommandResult>& history, CommandAction action)
    -> std::chrono::milliseconds;

[[nodiscard]] auto groupByProject(const std::vector<CommandResult>& history)
    -> std::map<std::string, std::vector<CommandResult>>;

[[nodiscard]] auto groupByAction(const std::vector<CommandResult>& history)
    -> std::map<CommandAction, std::vector<CommandResult>>;

[[nodiscard]] auto partitionByPriority(const std::vector<QueuedCommand>& queue)
    -> PriorityBuckets;

/**
 * @brief idle when nothing is active or queued, running when anything is
 * active, queued otherwise
 */
[[nodiscard]] auto overallStatus(const QueueSnapshot& snapshot)
    -> OverallStatus;

/**
 * @brief Up to @p limit history entries, most recent start time first
 */
[[nodiscard]] auto recentActivity(const std::vector<CommandResult>& history,
                                  std::size_t limit = 20)
    -> std::vector<CommandResult>;

/**
 * @brief Full analytics summary of a snapshot
 */
[[nodiscard]] auto summarize(const QueueSnapshot& snapshot) -> nlohmann::json;

}  // namespace devflow::queue

#endif  // DEVFLOW_QUEUE_ANALYTICS_HPP
