/*
 * command_resolver.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_resolver.hpp"

#include <iterator>
#include <sstream>

#include <spdlog/spdlog.h>

#include "core/exception.hpp"
#include "process/progress.hpp"

namespace devflow::scheduler {

namespace {

auto splitWords(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

}  // namespace

CommandResolver::CommandResolver(ResolverConfig config)
    : config_(std::move(config)), nx_prefix_(splitWords(config_.nxCommand)) {
    if (nx_prefix_.empty()) {
        THROW_VALIDATION_ERROR("nxCommand", "nx command must not be empty");
    }
    if (config_.gitCommand.empty()) {
        THROW_VALIDATION_ERROR("gitCommand", "git command must not be empty");
    }
}

auto CommandResolver::requiresProject(CommandAction action) noexcept -> bool {
    switch (action) {
        case CommandAction::AiDebug:
        case CommandAction::NxTest:
        case CommandAction::PrepareToPush:
        case CommandAction::Lint:
            return true;
        case CommandAction::GitDiff:
        case CommandAction::Format:
        case CommandAction::Custom:
            return false;
    }
    return false;
}

auto CommandResolver::resolve(const QueuedCommand& command) const
    -> ResolvedCommand {
    const auto& options = command.options;

    if (requiresProject(command.action) && command.project.empty()) {
        THROW_VALIDATION_ERROR(
            "project", fmt::format("{} requires a project name",
                                   actionToString(command.action)));
    }
    if (!command.project.empty() && command.project.front() == '-') {
        THROW_VALIDATION_ERROR(
            "project",
            fmt::format("invalid project name '{}'", command.project));
    }
    if (options.program && options.program->empty()) {
        THROW_VALIDATION_ERROR("program", "program must not be empty");
    }

    ResolvedCommand resolved;
    auto& line = resolved.commandLine;

    if (command.action == CommandAction::Custom) {
        if (!options.program) {
            THROW_VALIDATION_ERROR("program",
                                   "custom commands require a program");
        }
        line.program = *options.program;
    } else if (options.program) {
        line.program = *options.program;
        if (!command.project.empty()) {
            line.args.push_back(command.project);
        }
        auto flags = workflowFlags(command);
        line.args.insert(line.args.end(), flags.begin(), flags.end());
    } else {
        switch (command.action) {
            case CommandAction::AiDebug:
            case CommandAction::NxTest:
                line = nx({"test", command.project, "--verbose"});
                break;
            case CommandAction::GitDiff:
                line.program = config_.gitCommand;
                line.args = {"diff"};
                break;
            case CommandAction::PrepareToPush:
            case CommandAction::Lint:
                line = nx({"lint", command.project});
                break;
            case CommandAction::Format:
                line = command.project.empty()
                           ? nx({"format:check"})
                           : nx({"format:check",
                                 "--projects=" + command.project});
                break;
            case CommandAction::Custom:
                break;
        }
    }
    line.args.insert(line.args.end(), options.args.begin(),
                     options.args.end());

    auto& run = resolved.runOptions;
    run.executionId = command.id;
    run.cwd = options.cwd ? options.cwd : config_.workingDirectory;
    run.environment = options.environment;
    run.timeout = options.timeout ? options.timeout : config_.defaultTimeout;
    run.progressSteps = process::progressStepsFor(command.action);

    spdlog::debug("CommandResolver: {} -> {}", command.id, line.toString());
    return resolved;
}

auto CommandResolver::nx(std::vector<std::string> args) const
    -> process::CommandLine {
    process::CommandLine line;
    line.program = nx_prefix_.front();
    line.args.assign(nx_prefix_.begin() + 1, nx_prefix_.end());
    line.args.insert(line.args.end(), std::make_move_iterator(args.begin()),
                     std::make_move_iterator(args.end()));
    return line;
}

auto CommandResolver::workflowFlags(const QueuedCommand& command)
    -> std::vector<std::string> {
    const auto& options = command.options;
    std::vector<std::string> flags;
    switch (command.action) {
        case CommandAction::AiDebug:
            if (options.quick) flags.emplace_back("--quick");
            if (options.fullContext) flags.emplace_back("--full-context");
            if (options.noDiff) flags.emplace_back("--no-diff");
            if (options.focus) flags.push_back("--focus=" + *options.focus);
            break;
        case CommandAction::NxTest:
            if (options.useExpected) flags.emplace_back("--use-expected");
            if (options.fullOutput) flags.emplace_back("--full-output");
            break;
        default:
            break;
    }
    return flags;
}

}  // namespace devflow::scheduler
