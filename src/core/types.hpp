/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Common type definitions for command scheduling and execution
 * @date 2025-03-02
 * @version 1.0.0
 */

#ifndef DEVFLOW_CORE_TYPES_HPP
#define DEVFLOW_CORE_TYPES_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace devflow {

using SystemClock = std::chrono::system_clock;
using TimePoint = SystemClock::time_point;

/**
 * @brief Developer workflow commands known to the resolver
 */
enum class CommandAction {
    AiDebug,        ///< Test run plus context collection
    NxTest,         ///< Project test run
    GitDiff,        ///< Working tree diff
    PrepareToPush,  ///< Lint gate before pushing
    Lint,           ///< Project lint
    Format,         ///< Format check
    Custom          ///< Arbitrary program from CommandOptions
};

/**
 * @brief Queue priority buckets
 */
enum class Priority { High, Normal, Low };

/**
 * @brief Lifecycle status of an execution
 */
enum class ExecutionStatus { Pending, Running, Completed, Failed, Cancelled };

/**
 * @brief Reason tag shared by every terminal result
 */
enum class ErrorKind {
    None,          ///< Exit code 0
    Validation,    ///< Rejected before spawning
    Spawn,         ///< Executable missing or not executable
    Runtime,       ///< Nonzero exit code or killed by a signal
    Timeout,       ///< No exit within the configured bound
    Cancellation   ///< User-initiated termination
};

/**
 * @brief Generated output files handled by the batch coordinator
 */
enum class OutputType { AiDebugContext, JestOutput, Diff, PrDescription };

[[nodiscard]] constexpr std::string_view actionToString(
    CommandAction action) noexcept {
    switch (action) {
        case CommandAction::AiDebug: return "aiDebug";
        case CommandAction::NxTest: return "nxTest";
        case CommandAction::GitDiff: return "gitDiff";
        case CommandAction::PrepareToPush: return "prepareToPush";
        case CommandAction::Lint: return "lint";
        case CommandAction::Format: return "format";
        case CommandAction::Custom: return "custom";
    }
    return "custom";
}

[[nodiscard]] constexpr std::string_view priorityToString(
    Priority priority) noexcept {
    switch (priority) {
        case Priority::High: return "high";
        case Priority::Normal: return "normal";
        case Priority::Low: return "low";
    }
    return "normal";
}

[[nodiscard]] constexpr std::string_view statusToString(
    ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Pending: return "pending";
        case ExecutionStatus::Running: return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

[[nodiscard]] constexpr std::string_view errorKindToString(
    ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Spawn: return "spawn";
        case ErrorKind::Runtime: return "runtime";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Cancellation: return "cancellation";
    }
    return "none";
}

[[nodiscard]] constexpr std::string_view outputTypeToString(
    OutputType type) noexcept {
    switch (type) {
        case OutputType::AiDebugContext: return "ai-debug-context";
        case OutputType::JestOutput: return "jest-output";
        case OutputType::Diff: return "diff";
        case OutputType::PrDescription: return "pr-description";
    }
    return "diff";
}

[[nodiscard]] auto actionFromString(std::string_view text)
    -> std::optional<CommandAction>;
[[nodiscard]] auto priorityFromString(std::string_view text)
    -> std::optional<Priority>;
[[nodiscard]] auto outputTypeFromString(std::string_view text)
    -> std::optional<OutputType>;

/**
 * @brief Numeric rank used for ordering, higher runs first
 */
[[nodiscard]] constexpr int priorityRank(Priority priority) noexcept {
    switch (priority) {
        case Priority::High: return 3;
        case Priority::Normal: return 2;
        case Priority::Low: return 1;
    }
    return 2;
}

[[nodiscard]] constexpr bool isTerminal(ExecutionStatus status) noexcept {
    return status == ExecutionStatus::Completed ||
           status == ExecutionStatus::Failed ||
           status == ExecutionStatus::Cancelled;
}

/**
 * @brief Formats a wall-clock time as ISO 8601 UTC with milliseconds
 */
[[nodiscard]] auto formatTimestamp(TimePoint time) -> std::string;

/**
 * @brief Milliseconds since the Unix epoch
 */
[[nodiscard]] auto epochMillis(TimePoint time) -> long long;

/**
 * @brief Per-command options supplied by the caller
 */
struct CommandOptions {
    std::optional<std::string> program;    ///< Program for custom commands
    std::vector<std::string> args;         ///< Extra arguments appended last
    std::optional<std::filesystem::path> cwd;                 ///< Working directory
    std::unordered_map<std::string, std::string> environment; ///< Env overrides
    std::optional<std::chrono::milliseconds> timeout;         ///< Execution bound

    bool quick{false};        ///< aiDebug: --quick
    bool fullContext{false};  ///< aiDebug: --full-context
    bool noDiff{false};       ///< aiDebug: --no-diff
    std::optional<std::string> focus;  ///< aiDebug: --focus=<area>
    bool useExpected{false};  ///< nxTest: --use-expected
    bool fullOutput{false};   ///< nxTest: --full-output

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> CommandOptions;
};

/**
 * @brief A command waiting in the execution queue
 */
struct QueuedCommand {
    std::string id;
    CommandAction action{CommandAction::Custom};
    std::string project;
    Priority priority{Priority::Normal};
    CommandOptions options;
    TimePoint timestamp{SystemClock::now()};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief A command that has been dequeued and is (or was) running
 */
struct CommandExecution {
    std::string id;
    CommandAction action{CommandAction::Custom};
    std::string project;
    ExecutionStatus status{ExecutionStatus::Pending};
    TimePoint startTime{SystemClock::now()};
    std::optional<TimePoint> endTime;
    int progress{0};                  ///< Always within [0, 100]
    std::vector<std::string> output;  ///< Output chunks in emission order
    std::optional<std::string> error;
    Priority priority{Priority::Normal};
    CommandOptions options;
    ErrorKind reason{ErrorKind::None};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Terminal execution record stored in history
 */
struct CommandResult : CommandExecution {
    std::chrono::milliseconds duration{0};
    bool success{false};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Terminal result of one ProcessRunner execution
 */
struct ProcessResult {
    bool success{false};
    int exitCode{-1};
    std::string output;                ///< Cumulative stdout
    std::optional<std::string> error;  ///< Stderr or failure description
    std::chrono::milliseconds duration{0};
    ErrorKind reason{ErrorKind::None};
    std::optional<int> signal;         ///< Set when killed by a signal

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace devflow

#endif  // DEVFLOW_CORE_TYPES_HPP
