/*
 * test_config.cpp - Tests for configuration loading and logging setup
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "config/config.hpp"
#include "core/exception.hpp"
#include "logging/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <stdlib.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using namespace devflow;
using namespace devflow::config;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("devflow-config-" + std::to_string(::getpid()) + "-" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name() +
                 ".json");
        ::unsetenv("DEVFLOW_MAX_CONCURRENT");
        ::unsetenv("DEVFLOW_OUTPUT_DIR");
        ::unsetenv("DEVFLOW_LOG_LEVEL");
    }

    void TearDown() override {
        fs::remove(path_);
        ::unsetenv("DEVFLOW_MAX_CONCURRENT");
        ::unsetenv("DEVFLOW_OUTPUT_DIR");
        ::unsetenv("DEVFLOW_LOG_LEVEL");
    }

    void writeFile(const std::string& text) { std::ofstream(path_) << text; }

    fs::path path_;
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    DevflowConfig config;
    EXPECT_EQ(config.scheduler.maxConcurrent, 3);
    EXPECT_EQ(config.runner.killGracePeriodMs, 5000);
    EXPECT_EQ(config.commands.nxCommand, "yarn nx");
    EXPECT_EQ(config.batch.outputDirectory,
              ".github/instructions/ai_utilities_context");
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, LoadKeepsDefaultsForMissingKeys) {
    writeFile(R"({
        "scheduler": { "maxConcurrent": 5 },
        "runner": { "defaultTimeoutMs": 60000 },
        "commands": { "workingDirectory": "/work" }
    })");

    auto config = loadConfig(path_);
    EXPECT_EQ(config.scheduler.maxConcurrent, 5);
    EXPECT_EQ(config.runner.killGracePeriodMs, 5000);
    EXPECT_EQ(config.commands.gitCommand, "git");

    auto resolver = config.resolverConfig();
    ASSERT_TRUE(resolver.workingDirectory.has_value());
    EXPECT_EQ(resolver.workingDirectory->string(), "/work");
    EXPECT_EQ(resolver.defaultTimeout.value(), 60000ms);

    auto scheduler = config.schedulerConfig();
    EXPECT_EQ(scheduler.maxConcurrent, 5);
    EXPECT_EQ(scheduler.runner.killGracePeriod, 5000ms);
}

TEST_F(ConfigTest, RoundTripsThroughJson) {
    DevflowConfig config;
    config.batch.maxRetries = 2;
    config.logging.enableFile = true;

    auto restored = DevflowConfig::fromJson(config.toJson());
    EXPECT_EQ(restored.batch.maxRetries, 2);
    EXPECT_TRUE(restored.logging.enableFile);
    EXPECT_EQ(restored.toJson(), config.toJson());
}

TEST_F(ConfigTest, MalformedInputThrowsConfigError) {
    writeFile("{ not json");
    EXPECT_THROW((void)loadConfig(path_), ConfigError);

    writeFile(R"({ "scheduler": 3 })");
    EXPECT_THROW((void)loadConfig(path_), ConfigError);

    writeFile(R"({ "scheduler": { "maxConcurrent": "many" } })");
    EXPECT_THROW((void)loadConfig(path_), ConfigError);

    EXPECT_THROW((void)loadConfig(path_.string() + ".missing"), ConfigError);
}

TEST_F(ConfigTest, EnvironmentOverridesFileValues) {
    ::setenv("DEVFLOW_MAX_CONCURRENT", "7", 1);
    ::setenv("DEVFLOW_OUTPUT_DIR", "/tmp/devflow-out", 1);
    ::setenv("DEVFLOW_LOG_LEVEL", "debug", 1);

    DevflowConfig config;
    applyEnvironmentOverrides(config);
    EXPECT_EQ(config.scheduler.maxConcurrent, 7);
    EXPECT_EQ(config.batch.outputDirectory, "/tmp/devflow-out");
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, NonNumericConcurrencyOverrideThrows) {
    ::setenv("DEVFLOW_MAX_CONCURRENT", "3x", 1);
    DevflowConfig config;
    EXPECT_THROW(applyEnvironmentOverrides(config), ConfigError);
}

TEST_F(ConfigTest, BatchOptionsFollowSection) {
    DevflowConfig config;
    config.batch.maxRetries = 4;
    config.batch.validateContent = true;

    auto options = config.batch.batchOptions();
    EXPECT_EQ(options.maxRetries, 4);
    EXPECT_TRUE(options.validateContent);
    EXPECT_TRUE(options.trackHistory);
}

// ============================================================================
// Logging Tests
// ============================================================================

TEST(LoggingTest, LevelNames) {
    using devflow::logging::levelFromString;
    using devflow::logging::levelToString;

    EXPECT_EQ(levelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("err"), spdlog::level::err);
    EXPECT_EQ(levelFromString("bogus"), spdlog::level::info);
    EXPECT_EQ(levelToString(spdlog::level::err), "error");
    EXPECT_EQ(levelToString(levelFromString("trace")), "trace");
}

TEST(LoggingTest, InitializeInstallsDefaultLogger) {
    const auto logFile = fs::temp_directory_path() /
                         ("devflow-log-" + std::to_string(::getpid())) /
                         "devflow.log";
    devflow::logging::LoggingConfig config;
    config.level = "debug";
    config.enableConsole = false;
    config.enableFile = true;
    config.filePath = logFile.string();

    auto logger = devflow::logging::initializeLogging(config);
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(spdlog::default_logger(), logger);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
    EXPECT_EQ(logger->sinks().size(), 1u);

    spdlog::info("Logging: test message");
    logger->flush();
    EXPECT_GT(fs::file_size(logFile), 0u);

    devflow::logging::LoggingConfig console;
    console.enableFile = false;
    devflow::logging::initializeLogging(console);
    fs::remove_all(logFile.parent_path());
}

TEST(LoggingTest, ConsoleSinkWritesToStderr) {
    devflow::logging::LoggingConfig config;
    config.enableFile = false;

    config.consoleColor = true;
    auto colored = devflow::logging::initializeLogging(config);
    ASSERT_EQ(colored->sinks().size(), 1u);
    EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(
                  colored->sinks().front()),
              nullptr);

    config.consoleColor = false;
    auto plain = devflow::logging::initializeLogging(config);
    ASSERT_EQ(plain->sinks().size(), 1u);
    EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stderr_sink_mt>(
                  plain->sinks().front()),
              nullptr);
}
