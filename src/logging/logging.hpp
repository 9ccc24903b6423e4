/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-03-02

Description: spdlog setup for the devflow executable

**************************************************/

#ifndef DEVFLOW_LOGGING_LOGGING_HPP
#define DEVFLOW_LOGGING_LOGGING_HPP

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace devflow::logging {

/**
 * @brief Logger configuration
 *
 * @example
 * ```json
 * "logging": {
 *   "level": "info",
 *   "enableConsole": true,
 *   "enableFile": true,
 *   "filePath": "logs/devflow.log"
 * }
 * ```
 */
struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};

    bool enableConsole{true};  ///< Console output on stderr
    bool consoleColor{true};   ///< ANSI colors on the console sink

    bool enableFile{false};                 ///< Plain file output
    std::string filePath{"logs/devflow.log"};  ///< Created with its parent dirs

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;
};

/**
 * @brief Parses a level name; unknown names map to info
 */
[[nodiscard]] auto levelFromString(std::string_view name)
    -> spdlog::level::level_enum;

[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

/**
 * @brief Builds the "devflow" logger from the configured sinks and makes it
 * the spdlog default logger.
 *
 * A file sink that cannot be created is reported and skipped.
 */
auto initializeLogging(const LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace devflow::logging

#endif  // DEVFLOW_LOGGING_LOGGING_HPP
