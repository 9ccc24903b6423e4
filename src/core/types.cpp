/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace devflow {

namespace {

template <typename Enum, std::size_t N>
auto lookup(const std::array<std::pair<std::string_view, Enum>, N>& table,
            std::string_view text) -> std::optional<Enum> {
    for (const auto& [name, value] : table) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace

auto actionFromString(std::string_view text) -> std::optional<CommandAction> {
    static constexpr std::array<std::pair<std::string_view, CommandAction>, 7>
        kActions{{{"aiDebug", CommandAction::AiDebug},
                  {"nxTest", CommandAction::NxTest},
                  {"gitDiff", CommandAction::GitDiff},
                  {"prepareToPush", CommandAction::PrepareToPush},
                  {"lint", CommandAction::Lint},
                  {"format", CommandAction::Format},
                  {"custom", CommandAction::Custom}}};
    return lookup(kActions, text);
}

auto priorityFromString(std::string_view text) -> std::optional<Priority> {
    static constexpr std::array<std::pair<std::string_view, Priority>, 3>
        kPriorities{{{"high", Priority::High},
                     {"normal", Priority::Normal},
                     {"low", Priority::Low}}};
    return lookup(kPriorities, text);
}

auto outputTypeFromString(std::string_view text) -> std::optional<OutputType> {
    static constexpr std::array<std::pair<std::string_view, OutputType>, 4>
        kTypes{{{"ai-debug-context", OutputType::AiDebugContext},
                {"jest-output", OutputType::JestOutput},
                {"diff", OutputType::Diff},
                {"pr-description", OutputType::PrDescription}}};
    return lookup(kTypes, text);
}

auto formatTimestamp(TimePoint time) -> std::string {
    auto timeT = SystemClock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  time.time_since_epoch()) %
              1000;

    std::tm tm{};
    gmtime_r(&timeT, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

auto epochMillis(TimePoint time) -> long long {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               time.time_since_epoch())
        .count();
}

// ============================================================================
// CommandOptions
// ============================================================================

auto CommandOptions::toJson() const -> nlohmann::json {
    nlohmann::json j{{"args", args},
                     {"environment", environment},
                     {"quick", quick},
                     {"fullContext", fullContext},
                     {"noDiff", noDiff},
                     {"useExpected", useExpected},
                     {"fullOutput", fullOutput}};
    if (program) {
        j["program"] = *program;
    }
    if (cwd) {
        j["cwd"] = cwd->string();
    }
    if (timeout) {
        j["timeoutMs"] = timeout->count();
    }
    if (focus) {
        j["focus"] = *focus;
    }
    return j;
}

auto CommandOptions::fromJson(const nlohmann::json& j) -> CommandOptions {
    CommandOptions options;
    if (j.contains("program")) {
        options.program = j["program"].get<std::string>();
    }
    options.args = j.value("args", std::vector<std::string>{});
    if (j.contains("cwd")) {
        options.cwd = std::filesystem::path(j["cwd"].get<std::string>());
    }
    options.environment = j.value(
        "environment", std::unordered_map<std::string, std::string>{});
    if (j.contains("timeoutMs")) {
        options.timeout =
            std::chrono::milliseconds(j["timeoutMs"].get<long long>());
    }
    options.quick = j.value("quick", false);
    options.fullContext = j.value("fullContext", false);
    options.noDiff = j.value("noDiff", false);
    if (j.contains("focus")) {
        options.focus = j["focus"].get<std::string>();
    }
    options.useExpected = j.value("useExpected", false);
    options.fullOutput = j.value("fullOutput", false);
    return options;
}

// ============================================================================
// Queue records
// ============================================================================

auto QueuedCommand::toJson() const -> nlohmann::json {
    return {{"id", id},
            {"action", std::string(actionToString(action))},
            {"project", project},
            {"priority", std::string(priorityToString(priority))},
            {"options", options.toJson()},
            {"timestamp", formatTimestamp(timestamp)}};
}

auto CommandExecution::toJson() const -> nlohmann::json {
    nlohmann::json j{{"id", id},
                     {"action", std::string(actionToString(action))},
                     {"project", project},
                     {"status", std::string(statusToString(status))},
                     {"startTime", formatTimestamp(startTime)},
                     {"progress", progress},
                     {"output", output},
                     {"priority", std::string(priorityToString(priority))},
                     {"reason", std::string(errorKindToString(reason))}};
    if (endTime) {
        j["endTime"] = formatTimestamp(*endTime);
    }
    if (error) {
        j["error"] = *error;
    }
    return j;
}

auto CommandResult::toJson() const -> nlohmann::json {
    auto j = CommandExecution::toJson();
    j["duration"] = duration.count();
    j["success"] = success;
    return j;
}

auto ProcessResult::toJson() const -> nlohmann::json {
    nlohmann::json j{{"success", success},
                     {"exitCode", exitCode},
                     {"output", output},
                     {"duration", duration.count()},
                     {"reason", std::string(errorKindToString(reason))}};
    if (error) {
        j["error"] = *error;
    }
    if (signal) {
        j["signal"] = *signal;
    }
    return j;
}

}  // namespace devflow
