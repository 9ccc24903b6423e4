/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace devflow::logging {

namespace {

void ensureDirectoryExists(const std::string& filePath) {
    const auto parent = std::filesystem::path(filePath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

auto createConsoleSink(bool color) -> spdlog::sink_ptr {
    if (color) {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    return std::make_shared<spdlog::sinks::stderr_sink_mt>();
}

auto createFileSink(const std::string& filePath) -> spdlog::sink_ptr {
    try {
        ensureDirectoryExists(filePath);
        return std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create file sink '{}': {}", filePath,
                      e.what());
        return nullptr;
    }
}

}  // namespace

auto LoggingConfig::toJson() const -> nlohmann::json {
    return {{"level", level},
            {"pattern", pattern},
            {"enableConsole", enableConsole},
            {"consoleColor", consoleColor},
            {"enableFile", enableFile},
            {"filePath", filePath}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig cfg;
    cfg.level = j.value("level", cfg.level);
    cfg.pattern = j.value("pattern", cfg.pattern);
    cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
    cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);
    cfg.enableFile = j.value("enableFile", cfg.enableFile);
    cfg.filePath = j.value("filePath", cfg.filePath);
    return cfg;
}

auto levelFromString(std::string_view name) -> spdlog::level::level_enum {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error" || name == "err") return spdlog::level::err;
    if (name == "critical" || name == "fatal") return spdlog::level::critical;
    if (name == "off" || name == "none") return spdlog::level::off;
    return spdlog::level::info;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: break;
    }
    return "info";
}

auto initializeLogging(const LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enableConsole) {
        sinks.push_back(createConsoleSink(config.consoleColor));
    }
    if (config.enableFile) {
        if (auto sink = createFileSink(config.filePath)) {
            sinks.push_back(std::move(sink));
        }
    }

    auto logger =
        std::make_shared<spdlog::logger>("devflow", sinks.begin(), sinks.end());
    const auto level = levelFromString(config.level);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    if (!config.pattern.empty()) {
        logger->set_pattern(config.pattern);
    }
    spdlog::set_default_logger(logger);

    spdlog::debug("Logging: initialized at level {} with {} sink(s)",
                  levelToString(level), sinks.size());
    return logger;
}

}  // namespace devflow::logging
