/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Error and result types for process launching and running
 * @date 2025-03-02
 * @version 1.0.0
 */

#ifndef DEVFLOW_PROCESS_TYPES_HPP
#define DEVFLOW_PROCESS_TYPES_HPP

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace devflow::process {

/**
 * @brief Error codes for runner and launcher operations
 */
enum class RunnerError {
    Success = 0,
    AlreadyRunning,
    NotRunning,
    InvalidCommand,
    ProcessSpawnFailed,
    PipeCreationFailed,
    SignalFailed,
    UnknownError
};

/**
 * @brief Get string representation of RunnerError
 */
[[nodiscard]] constexpr std::string_view runnerErrorToString(
    RunnerError error) noexcept {
    switch (error) {
        case RunnerError::Success: return "Success";
        case RunnerError::AlreadyRunning: return "Process already running";
        case RunnerError::NotRunning: return "No process running";
        case RunnerError::InvalidCommand: return "Invalid command";
        case RunnerError::ProcessSpawnFailed: return "Process spawn failed";
        case RunnerError::PipeCreationFailed: return "Pipe creation failed";
        case RunnerError::SignalFailed: return "Signal delivery failed";
        case RunnerError::UnknownError: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Error code plus a human-readable detail message
 */
struct Error {
    RunnerError code{RunnerError::UnknownError};
    std::string message;

    [[nodiscard]] auto describe() const -> std::string {
        if (message.empty()) {
            return std::string(runnerErrorToString(code));
        }
        return message;
    }
};

/**
 * @brief Result type for runner and launcher operations
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Program and argument vector to execute
 */
struct CommandLine {
    std::string program;            ///< Resolved through PATH when relative
    std::vector<std::string> args;  ///< Arguments, excluding argv[0]

    /**
     * @brief Space-joined rendering for logs
     */
    [[nodiscard]] auto toString() const -> std::string {
        std::string text = program;
        for (const auto& arg : args) {
            text += ' ';
            text += arg;
        }
        return text;
    }
};

}  // namespace devflow::process

#endif  // DEVFLOW_PROCESS_TYPES_HPP
