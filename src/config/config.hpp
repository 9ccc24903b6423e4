/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-03-02

Description: devflow configuration sections and loader

**************************************************/

#ifndef DEVFLOW_CONFIG_CONFIG_HPP
#define DEVFLOW_CONFIG_CONFIG_HPP

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "batch/batch_coordinator.hpp"
#include "logging/logging.hpp"
#include "scheduler/command_resolver.hpp"
#include "scheduler/command_scheduler.hpp"

namespace devflow::config {

using json = nlohmann::json;
using LoggingSection = logging::LoggingConfig;

/**
 * @brief Concurrency limits
 */
struct SchedulerSection {
    int maxConcurrent{3};  ///< Clamped to [1, 10] by the scheduler

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> SchedulerSection;
};

/**
 * @brief Process runner timing, all values in milliseconds
 */
struct RunnerSection {
    long long killGracePeriodMs{5000};
    long long progressTickMs{100};
    long long expectedDurationMs{30000};
    long long defaultTimeoutMs{0};  ///< 0 disables the default timeout

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> RunnerSection;
};

/**
 * @brief How workflow actions map onto programs
 */
struct CommandsSection {
    std::string nxCommand{"yarn nx"};
    std::string gitCommand{"git"};
    std::string workingDirectory;  ///< Empty means the current directory

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> CommandsSection;
};

/**
 * @brief Output file batches
 */
struct BatchSection {
    std::string outputDirectory{batch::kDefaultOutputDirectory};
    int maxRetries{0};
    long long retryDelayMs{100};
    bool createBackup{false};
    bool validateContent{false};
    bool trackHistory{true};

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> BatchSection;

    /**
     * @brief Options for BatchCoordinator::executeBatch
     */
    [[nodiscard]] auto batchOptions() const -> batch::BatchOptions;
};

/**
 * @brief Complete devflow configuration
 *
 * @example
 * ```json
 * {
 *   "scheduler": { "maxConcurrent": 3 },
 *   "runner": { "killGracePeriodMs": 5000, "defaultTimeoutMs": 600000 },
 *   "commands": { "nxCommand": "yarn nx", "gitCommand": "git" },
 *   "batch": { "outputDirectory": ".github/instructions/ai_utilities_context" },
 *   "logging": { "level": "info" }
 * }
 * ```
 */
struct DevflowConfig {
    SchedulerSection scheduler;
    RunnerSection runner;
    CommandsSection commands;
    BatchSection batch;
    LoggingSection logging;

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Missing keys keep their defaults
     * @throws ConfigError when a section or value has the wrong type
     */
    [[nodiscard]] static auto fromJson(const json& j) -> DevflowConfig;

    [[nodiscard]] auto schedulerConfig() const
        -> ::devflow::scheduler::SchedulerConfig;
    [[nodiscard]] auto resolverConfig() const
        -> ::devflow::scheduler::ResolverConfig;
};

/**
 * @brief Reads a JSON configuration file
 * @throws ConfigError when the file cannot be read or parsed
 */
[[nodiscard]] auto loadConfig(const std::filesystem::path& path)
    -> DevflowConfig;

/**
 * @brief Applies DEVFLOW_MAX_CONCURRENT, DEVFLOW_OUTPUT_DIR and
 * DEVFLOW_LOG_LEVEL
 * @throws ConfigError when DEVFLOW_MAX_CONCURRENT is not a number
 */
void applyEnvironmentOverrides(DevflowConfig& config);

}  // namespace devflow::config

#endif  // DEVFLOW_CONFIG_CONFIG_HPP
