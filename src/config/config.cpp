/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>

#include <spdlog/spdlog.h>

#include "core/exception.hpp"

namespace devflow::config {

namespace {

auto section(const json& root, const char* name) -> json {
    if (!root.contains(name)) {
        return json::object();
    }
    const auto& value = root.at(name);
    if (!value.is_object()) {
        THROW_CONFIG_ERROR(
            fmt::format("config section '{}' must be an object", name));
    }
    return value;
}

auto getEnv(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

// ============================================================================
// Sections
// ============================================================================

auto SchedulerSection::toJson() const -> json {
    return {{"maxConcurrent", maxConcurrent}};
}

auto SchedulerSection::fromJson(const json& j) -> SchedulerSection {
    SchedulerSection cfg;
    cfg.maxConcurrent = j.value("maxConcurrent", cfg.maxConcurrent);
    return cfg;
}

auto RunnerSection::toJson() const -> json {
    return {{"killGracePeriodMs", killGracePeriodMs},
            {"progressTickMs", progressTickMs},
            {"expectedDurationMs", expectedDurationMs},
            {"defaultTimeoutMs", defaultTimeoutMs}};
}

auto RunnerSection::fromJson(const json& j) -> RunnerSection {
    RunnerSection cfg;
    cfg.killGracePeriodMs = j.value("killGracePeriodMs", cfg.killGracePeriodMs);
    cfg.progressTickMs = j.value("progressTickMs", cfg.progressTickMs);
    cfg.expectedDurationMs =
        j.value("expectedDurationMs", cfg.expectedDurationMs);
    cfg.defaultTimeoutMs = j.value("defaultTimeoutMs", cfg.defaultTimeoutMs);
    return cfg;
}

auto CommandsSection::toJson() const -> json {
    return {{"nxCommand", nxCommand},
            {"gitCommand", gitCommand},
            {"workingDirectory", workingDirectory}};
}

auto CommandsSection::fromJson(const json& j) -> CommandsSection {
    CommandsSection cfg;
    cfg.nxCommand = j.value("nxCommand", cfg.nxCommand);
    cfg.gitCommand = j.value("gitCommand", cfg.gitCommand);
    cfg.workingDirectory = j.value("workingDirectory", cfg.workingDirectory);
    return cfg;
}

auto BatchSection::toJson() const -> json {
    return {{"outputDirectory", outputDirectory},
            {"maxRetries", maxRetries},
            {"retryDelayMs", retryDelayMs},
            {"createBackup", createBackup},
            {"validateContent", validateContent},
            {"trackHistory", trackHistory}};
}

auto BatchSection::fromJson(const json& j) -> BatchSection {
    BatchSection cfg;
    cfg.outputDirectory = j.value("outputDirectory", cfg.outputDirectory);
    cfg.maxRetries = j.value("maxRetries", cfg.maxRetries);
    cfg.retryDelayMs = j.value("retryDelayMs", cfg.retryDelayMs);
    cfg.createBackup = j.value("createBackup", cfg.createBackup);
    cfg.validateContent = j.value("validateContent", cfg.validateContent);
    cfg.trackHistory = j.value("trackHistory", cfg.trackHistory);
    return cfg;
}

auto BatchSection::batchOptions() const -> batch::BatchOptions {
    batch::BatchOptions options;
    options.createBackup = createBackup;
    options.validateContent = validateContent;
    options.trackHistory = trackHistory;
    options.notifyUser = true;
    options.maxRetries = maxRetries;
    return options;
}

// ============================================================================
// DevflowConfig
// ============================================================================

auto DevflowConfig::toJson() const -> json {
    return {{"scheduler", scheduler.toJson()},
            {"runner", runner.toJson()},
            {"commands", commands.toJson()},
            {"batch", batch.toJson()},
            {"logging", logging.toJson()}};
}

auto DevflowConfig::fromJson(const json& j) -> DevflowConfig {
    if (!j.is_object()) {
        THROW_CONFIG_ERROR("config root must be a JSON object");
    }
    DevflowConfig cfg;
    try {
        cfg.scheduler = SchedulerSection::fromJson(section(j, "scheduler"));
        cfg.runner = RunnerSection::fromJson(section(j, "runner"));
        cfg.commands = CommandsSection::fromJson(section(j, "commands"));
        cfg.batch = BatchSection::fromJson(section(j, "batch"));
        cfg.logging = LoggingSection::fromJson(section(j, "logging"));
    } catch (const json::exception& e) {
        THROW_CONFIG_ERROR(fmt::format("invalid config value: {}", e.what()));
    }
    return cfg;
}

auto DevflowConfig::schedulerConfig() const
    -> ::devflow::scheduler::SchedulerConfig {
    ::devflow::scheduler::SchedulerConfig cfg;
    cfg.maxConcurrent = scheduler.maxConcurrent;
    cfg.runner.killGracePeriod =
        std::chrono::milliseconds(runner.killGracePeriodMs);
    cfg.runner.progressTick = std::chrono::milliseconds(runner.progressTickMs);
    cfg.runner.expectedDuration =
        std::chrono::milliseconds(runner.expectedDurationMs);
    return cfg;
}

auto DevflowConfig::resolverConfig() const
    -> ::devflow::scheduler::ResolverConfig {
    ::devflow::scheduler::ResolverConfig cfg;
    cfg.nxCommand = commands.nxCommand;
    cfg.gitCommand = commands.gitCommand;
    if (!commands.workingDirectory.empty()) {
        cfg.workingDirectory = commands.workingDirectory;
    }
    if (runner.defaultTimeoutMs > 0) {
        cfg.defaultTimeout = std::chrono::milliseconds(runner.defaultTimeoutMs);
    }
    return cfg;
}

// ============================================================================
// Loading
// ============================================================================

auto loadConfig(const std::filesystem::path& path) -> DevflowConfig {
    std::ifstream in(path);
    if (!in) {
        THROW_CONFIG_ERROR(
            fmt::format("cannot open config file {}", path.string()));
    }
    json root;
    try {
        root = json::parse(in);
    } catch (const json::parse_error& e) {
        THROW_CONFIG_ERROR(fmt::format("cannot parse config file {}: {}",
                                       path.string(), e.what()));
    }
    auto config = DevflowConfig::fromJson(root);
    spdlog::debug("Config: loaded {}", path.string());
    return config;
}

void applyEnvironmentOverrides(DevflowConfig& config) {
    if (auto value = getEnv("DEVFLOW_MAX_CONCURRENT")) {
        int parsed = 0;
        const auto* end = value->data() + value->size();
        auto [ptr, ec] = std::from_chars(value->data(), end, parsed);
        if (ec != std::errc() || ptr != end) {
            THROW_CONFIG_ERROR(fmt::format(
                "DEVFLOW_MAX_CONCURRENT must be an integer, got '{}'", *value));
        }
        config.scheduler.maxConcurrent = parsed;
    }
    if (auto value = getEnv("DEVFLOW_OUTPUT_DIR")) {
        config.batch.outputDirectory = *value;
    }
    if (auto value = getEnv("DEVFLOW_LOG_LEVEL")) {
        config.logging.level = *value;
    }
}

}  // namespace devflow::config
