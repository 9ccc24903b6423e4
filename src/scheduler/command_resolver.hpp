/*
 * command_resolver.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file command_resolver.hpp
 * @brief Maps workflow actions to concrete command lines
 * @date 2025-03-02
 * @version 1.0.0
 */

#ifndef DEVFLOW_SCHEDULER_COMMAND_RESOLVER_HPP
#define DEVFLOW_SCHEDULER_COMMAND_RESOLVER_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "process/process_runner.hpp"
#include "process/types.hpp"

namespace devflow::scheduler {

/**
 * @brief Tools used by the built-in actions
 */
struct ResolverConfig {
    std::string nxCommand{"yarn nx"};  ///< Whitespace-separated prefix
    std::string gitCommand{"git"};
    std::optional<std::filesystem::path> workingDirectory;
    std::optional<std::chrono::milliseconds> defaultTimeout;
};

/**
 * @brief Everything a ProcessRunner needs for one queued command
 */
struct ResolvedCommand {
    process::CommandLine commandLine;
    process::RunOptions runOptions;
};

/**
 * @brief Turns (action, project, options) into a program and argv
 *
 * Default mappings:
 * - aiDebug, nxTest: `<nx> test <project> --verbose`
 * - gitDiff: `<git> diff`
 * - prepareToPush, lint: `<nx> lint <project>`
 * - format: `<nx> format:check [--projects=<project>]`
 * - custom: `options.program` with `options.args`
 *
 * When `options.program` is set for a built-in action it replaces the tool,
 * receiving the project and the workflow flags (`--quick`, `--focus=...`)
 * as arguments. `options.args` is always appended last.
 */
class CommandResolver {
public:
    explicit CommandResolver(ResolverConfig config = {});

    /**
     * @brief Resolves a queued command.
     * @throws ValidationError when the project or program is missing or
     * malformed
     */
    [[nodiscard]] auto resolve(const QueuedCommand& command) const
        -> ResolvedCommand;

    /**
     * @brief True when the action needs a project name
     */
    [[nodiscard]] static auto requiresProject(CommandAction action) noexcept
        -> bool;

    [[nodiscard]] auto config() const -> const ResolverConfig& {
        return config_;
    }

private:
    [[nodiscard]] auto nx(std::vector<std::string> args) const
        -> process::CommandLine;
    [[nodiscard]] static auto workflowFlags(const QueuedCommand& command)
        -> std::vector<std::string>;

    ResolverConfig config_;
    std::vector<std::string> nx_prefix_;
};

}  // namespace devflow::scheduler

#endif  // DEVFLOW_SCHEDULER_COMMAND_RESOLVER_HPP
