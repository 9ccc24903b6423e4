/**
 * @file main.cpp
 * @brief Command-line entry point for devflow
 *
 * Runs one developer workflow command through the scheduler, streams its
 * output to the terminal and prints a JSON summary of the result.
 */

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "app/eventloop.hpp"
#include "batch/batch_coordinator.hpp"
#include "config/config.hpp"
#include "core/exception.hpp"
#include "events/event_bus.hpp"
#include "logging/logging.hpp"
#include "process/launcher.hpp"
#include "scheduler/command_resolver.hpp"
#include "scheduler/command_scheduler.hpp"

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signalHandler(int /*signal*/) { g_interrupted = 1; }

constexpr int kUsageExitCode = 2;
constexpr int kInterruptedExitCode = 130;

struct CliOptions {
    std::optional<std::string> configPath;
    std::optional<std::string> project;
    std::optional<std::string> priority;
    std::optional<long long> timeoutMs;
    std::optional<int> maxConcurrent;
    std::optional<std::string> logLevel;
    bool save{false};
    std::string action;
    std::vector<std::string> args;
};

void printUsage(const char* argv0) {
    std::cout
        << "Usage: " << argv0 << " [options] <action> [-- args...]\n"
        << "Actions:\n"
        << "  aiDebug, nxTest, gitDiff, prepareToPush, lint, format, custom\n"
        << "  (custom takes the program as the first argument after --)\n"
        << "Options:\n"
        << "  --config <file>         JSON configuration file\n"
        << "  --project <name>        Project the action applies to\n"
        << "  --priority <level>      high, normal or low (default: normal)\n"
        << "  --timeout <ms>          Kill the command after this many ms\n"
        << "  --max-concurrent <n>    Concurrent commands (1-10)\n"
        << "  --log-level <level>     trace, debug, info, warn, error\n"
        << "  --save                  Store the output in the output directory\n"
        << "  --help, -h              Show this help message\n";
}

auto parseArguments(int argc, char* argv[]) -> CliOptions {
    CliOptions cli;
    auto requireValue = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            THROW_VALIDATION_ERROR(flag, flag + " requires a value");
        }
        return argv[++i];
    };
    auto toNumber = [](const std::string& flag,
                       const std::string& value) -> long long {
        try {
            std::size_t used = 0;
            const auto number = std::stoll(value, &used);
            if (used != value.size()) {
                THROW_VALIDATION_ERROR(flag, flag + " expects a number");
            }
            return number;
        } catch (const std::logic_error&) {
            THROW_VALIDATION_ERROR(flag, flag + " expects a number");
        }
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--") {
            for (++i; i < argc; i++) {
                cli.args.emplace_back(argv[i]);
            }
            break;
        }
        if (arg == "--config") {
            cli.configPath = requireValue(i, arg);
        } else if (arg == "--project") {
            cli.project = requireValue(i, arg);
        } else if (arg == "--priority") {
            cli.priority = requireValue(i, arg);
        } else if (arg == "--timeout") {
            cli.timeoutMs = toNumber(arg, requireValue(i, arg));
        } else if (arg == "--max-concurrent") {
            cli.maxConcurrent =
                static_cast<int>(toNumber(arg, requireValue(i, arg)));
        } else if (arg == "--log-level") {
            cli.logLevel = requireValue(i, arg);
        } else if (arg == "--save") {
            cli.save = true;
        } else if (arg.starts_with("-")) {
            THROW_VALIDATION_ERROR(arg, "unknown option " + arg);
        } else if (cli.action.empty()) {
            cli.action = arg;
        } else {
            THROW_VALIDATION_ERROR(arg, "unexpected argument " + arg);
        }
    }
    if (cli.action.empty()) {
        THROW_VALIDATION_ERROR("action", "no action given");
    }
    return cli;
}

auto buildCommand(const CliOptions& cli) -> devflow::QueuedCommand {
    devflow::QueuedCommand command;
    auto action = devflow::actionFromString(cli.action);
    if (!action) {
        THROW_VALIDATION_ERROR("action", "unknown action " + cli.action);
    }
    command.action = *action;
    command.project = cli.project.value_or("");

    if (cli.priority) {
        auto priority = devflow::priorityFromString(*cli.priority);
        if (!priority) {
            THROW_VALIDATION_ERROR("priority",
                                   "unknown priority " + *cli.priority);
        }
        command.priority = *priority;
    }

    auto args = cli.args;
    if (command.action == devflow::CommandAction::Custom && !args.empty()) {
        command.options.program = args.front();
        args.erase(args.begin());
    }
    command.options.args = std::move(args);
    if (cli.timeoutMs && *cli.timeoutMs > 0) {
        command.options.timeout = std::chrono::milliseconds(*cli.timeoutMs);
    }
    return command;
}

auto exitCodeFor(const devflow::ProcessResult& result) -> int {
    if (result.success) {
        return 0;
    }
    switch (result.reason) {
        case devflow::ErrorKind::Validation:
            return kUsageExitCode;
        case devflow::ErrorKind::Cancellation:
            return kInterruptedExitCode;
        default:
            break;
    }
    if (result.exitCode > 0 && result.exitCode < 256) {
        return result.exitCode;
    }
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--") {
            break;
        }
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }

    CliOptions cli;
    devflow::config::DevflowConfig config;
    devflow::QueuedCommand command;
    try {
        cli = parseArguments(argc, argv);
        if (cli.configPath) {
            config = devflow::config::loadConfig(*cli.configPath);
        }
        devflow::config::applyEnvironmentOverrides(config);
        if (cli.maxConcurrent) {
            config.scheduler.maxConcurrent = *cli.maxConcurrent;
        }
        if (cli.logLevel) {
            config.logging.level = *cli.logLevel;
        }
        command = buildCommand(cli);
    } catch (const devflow::DevflowException& e) {
        std::cerr << "devflow: " << e.what() << "\n"
                  << "Try '" << argv[0] << " --help' for more information.\n";
        return kUsageExitCode;
    }

    devflow::logging::initializeLogging(config.logging);

    try {
        devflow::app::EventLoop loop;
        auto bus = devflow::events::EventBus::create();
        devflow::scheduler::CommandScheduler scheduler(
            loop, bus, devflow::process::createDefaultLauncher(),
            devflow::scheduler::CommandResolver(config.resolverConfig()),
            config.schedulerConfig());

        std::optional<devflow::ProcessResult> processResult;
        std::optional<devflow::CommandResult> record;
        scheduler.setResultHandler(
            [&record](const devflow::CommandResult& result) {
                record = result;
            });

        const auto id = scheduler.submit(command);
        auto subscription = bus->subscribeTo(
            id, [&processResult](const devflow::events::ExecutionEvent& event) {
                switch (event.kind) {
                    case devflow::events::EventKind::Output:
                        std::cout << event.text << std::flush;
                        break;
                    case devflow::events::EventKind::Error:
                        std::cerr << event.text << std::flush;
                        break;
                    case devflow::events::EventKind::Status:
                        spdlog::info("{}", event.text);
                        break;
                    case devflow::events::EventKind::Progress:
                        spdlog::debug("Progress: {}%", event.progress);
                        break;
                    case devflow::events::EventKind::Complete:
                        processResult = event.result;
                        break;
                }
            });

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        auto interruptTimer = loop.setInterval(
            [&scheduler] {
                if (g_interrupted != 0) {
                    g_interrupted = 0;
                    spdlog::warn("Interrupted, cancelling running commands");
                    scheduler.cancelAll();
                }
            },
            std::chrono::milliseconds(50));

        scheduler.waitForIdle();
        loop.cancelTimer(interruptTimer);
        subscription.unsubscribe();

        nlohmann::json summary{{"id", id}};
        if (record) {
            summary["result"] = record->toJson();
        }
        if (processResult) {
            summary["exitCode"] = processResult->exitCode;
            if (processResult->signal) {
                summary["signal"] = *processResult->signal;
            }
        }

        if (cli.save && processResult && processResult->success) {
            const auto outputs =
                devflow::batch::BatchCoordinator::expectedOutputs(
                    command.action);
            if (outputs.empty()) {
                spdlog::warn("{} produces no output files, nothing saved",
                             devflow::actionToString(command.action));
            } else {
                auto store =
                    std::make_shared<devflow::batch::FileSystemOutputStore>(
                        config.batch.outputDirectory);
                devflow::batch::BatchCoordinator coordinator(
                    store, bus,
                    std::chrono::milliseconds(config.batch.retryDelayMs));
                auto batch = coordinator.executeBatch(
                    std::string(devflow::actionToString(command.action)),
                    {{outputs.front(), processResult->output}},
                    config.batch.batchOptions());
                summary["batch"] = batch.toJson();
            }
        }

        std::cout << summary.dump(2) << std::endl;

        if (!processResult) {
            if (record && record->status == devflow::ExecutionStatus::Cancelled) {
                return kInterruptedExitCode;
            }
            spdlog::error("No result received for {}", id);
            return 1;
        }
        return exitCodeFor(*processResult);
    } catch (const std::exception& e) {
        spdlog::critical("devflow: {}", e.what());
        return 1;
    }
}
