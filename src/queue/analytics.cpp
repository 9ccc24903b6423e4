/*
 * analytics.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "analytics.hpp"

#include <algorithm>
#include <iterator>

namespace devflow::queue {

namespace {

auto filterByAction(const std::vector<CommandResult>& history,
                    CommandAction action) -> std::vector<CommandResult> {
    std::vector<CommandResult> matching;
    std::copy_if(history.begin(), history.end(), std::back_inserter(matching),
                 [action](const CommandResult& r) { return r.action == action; });
    return matching;
}

auto toJsonArray(const std::vector<QueuedCommand>& commands)
    -> nlohmann::json {
    auto array = nlohmann::json::array();
    for (const auto& command : commands) {
        array.push_back(command.id);
    }
    return array;
}

}  // namespace

auto successRate(const std::vector<CommandResult>& history) -> double {
    if (history.empty()) {
        return 0.0;
    }
    const auto successes = std::count_if(
        history.begin(), history.end(),
        [](const CommandResult& r) { return r.success; });
    return static_cast<double>(successes) /
           static_cast<double>(history.size());
}

auto averageExecutionTime(const std::vector<CommandResult>& history)
    -> std::chrono::milliseconds {
    long long total = 0;
    long long counted = 0;
    for (const auto& entry : history) {
        if (!entry.endTime) {
            continue;
        }
        total += std::chrono::duration_cast<std::chrono::milliseconds>(
                     *entry.endTime - entry.startTime)
                     .count();
        ++counted;
    }
    if (counted == 0) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(total / counted);
}

auto successRateByAction(const std::vector<CommandResult>& history,
                         CommandAction action) -> double {
    return successRate(filterByAction(history, action));
}

auto averageExecutionTimeByAction(const std::vector<CommandResult>& history,
                                  CommandAction action)
    -> std::chrono::milliseconds {
    return averageExecutionTime(filterByAction(history, action));
}

auto groupByProject(const std::vector<CommandResult>& history)
    -> std::map<std::string, std::vector<CommandResult>> {
    std::map<std::string, std::vector<CommandResult>> groups;
    for (const auto& entry : history) {
        groups[entry.project].push_back(entry);
    }
    return groups;
}

auto groupByAction(const std::vector<CommandResult>& history)
    -> std::map<CommandAction, std::vector<CommandResult>> {
    std::map<CommandAction, std::vector<CommandResult>> groups;
    for (const auto& entry : history) {
        groups[entry.action].push_back(entry);
    }
    return groups;
}

auto partitionByPriority(const std::vector<QueuedCommand>& queue)
    -> PriorityBuckets {
    PriorityBuckets buckets;
    for (const auto& command : queue) {
        switch (command.priority) {
            case Priority::High:
                buckets.high.push_back(command);
                break;
            case Priority::Normal:
                buckets.normal.push_back(command);
                break;
            case Priority::Low:
                buckets.low.push_back(command);
                break;
        }
    }
    return buckets;
}

auto overallStatus(const QueueSnapshot& snapshot) -> OverallStatus {
    if (!snapshot.active.empty()) {
        return OverallStatus::Running;
    }
    if (!snapshot.queue.empty()) {
        return OverallStatus::Queued;
    }
    return OverallStatus::Idle;
}

auto recentActivity(const std::vector<CommandResult>& history,
                    std::size_t limit) -> std::vector<CommandResult> {
    const auto count = std::min(limit, history.size());
    std::vector<CommandResult> recent(
        history.end() - static_cast<std::ptrdiff_t>(count), history.end());
    std::stable_sort(recent.begin(), recent.end(),
                     [](const CommandResult& a, const CommandResult& b) {
                         return a.startTime > b.startTime;
                     });
    return recent;
}

auto summarize(const QueueSnapshot& snapshot) -> nlohmann::json {
    const auto& history = snapshot.history;

    nlohmann::json byAction = nlohmann::json::object();
    for (const auto& [action, entries] : groupByAction(history)) {
        byAction[std::string(actionToString(action))] = {
            {"count", entries.size()},
            {"successRate", successRate(entries)},
            {"averageMs", averageExecutionTime(entries).count()}};
    }

    nlohmann::json byProject = nlohmann::json::object();
    for (const auto& [project, entries] : groupByProject(history)) {
        byProject[project] = {{"count", entries.size()},
                              {"successRate", successRate(entries)}};
    }

    const auto buckets = partitionByPriority(snapshot.queue);
    auto active = nlohmann::json::array();
    for (const auto& execution : snapshot.active) {
        active.push_back({{"id", execution.id},
                          {"action", std::string(actionToString(execution.action))},
                          {"progress", execution.progress}});
    }

    return {{"status", std::string(overallStatusToString(overallStatus(snapshot)))},
            {"queued", snapshot.queue.size()},
            {"active", snapshot.active.size()},
            {"historySize", history.size()},
            {"successRate", successRate(history)},
            {"averageExecutionMs", averageExecutionTime(history).count()},
            {"queueByPriority",
             {{"high", toJsonArray(buckets.high)},
              {"normal", toJsonArray(buckets.normal)},
              {"low", toJsonArray(buckets.low)}}},
            {"activeExecutions", active},
            {"byAction", byAction},
            {"byProject", byProject},
            {"timestamp", formatTimestamp(snapshot.takenAt)}};
}

}  // namespace devflow::queue
