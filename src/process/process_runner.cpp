/*
 * process_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "process_runner.hpp"

#include <spdlog/spdlog.h>

#include <signal.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace devflow::process {

namespace {
constexpr std::size_t kReadChunkSize = 4096;
}  // namespace

ProcessRunner::ProcessRunner(app::EventLoop& loop,
                             std::shared_ptr<events::EventBus> bus,
                             std::shared_ptr<IProcessLauncher> launcher,
                             RunnerConfig config)
    : loop_(loop),
      bus_(std::move(bus)),
      launcher_(std::move(launcher)),
      config_(config) {
    if (!bus_) {
        bus_ = events::EventBus::create();
    }
    if (!launcher_) {
        launcher_ = createDefaultLauncher();
    }
}

ProcessRunner::~ProcessRunner() {
    if (state_ == RunnerState::Running) {
        spdlog::warn("ProcessRunner: destroyed while '{}' is running",
                     execution_id_);
    }
    teardown();
}

auto ProcessRunner::execute(const CommandLine& command, RunOptions options,
                            CompletionHandler onComplete) -> Result<void> {
    if (state_ != RunnerState::Idle) {
        spdlog::warn("ProcessRunner: rejecting '{}', '{}' is still running",
                     command.program, execution_id_);
        return std::unexpected(Error{RunnerError::AlreadyRunning,
                                     "A command is already running"});
    }
    if (command.program.empty()) {
        return std::unexpected(
            Error{RunnerError::InvalidCommand, "program must not be empty"});
    }

    ++generation_;
    output_.clear();
    error_.clear();
    run_stdout_.clear();
    run_stderr_.clear();
    termination_.reset();
    sigkill_sent_ = false;
    timeout_ = options.timeout;
    on_complete_ = std::move(onComplete);
    execution_id_ = options.executionId.empty()
                        ? fmt::format("run-{}", ++run_counter_)
                        : options.executionId;
    estimator_ =
        makeProgressEstimator(options.progressSteps, config_.expectedDuration);
    estimator_->start();
    started_ = app::EventLoop::Clock::now();
    state_ = RunnerState::Running;

    spdlog::info("ProcessRunner: [{}] executing {}", execution_id_,
                 command.toString());
    bus_->publish(events::ExecutionEvent::status(
        execution_id_, "Starting command execution..."));

    LaunchOptions launchOptions;
    launchOptions.cwd = std::move(options.cwd);
    launchOptions.environment = std::move(options.environment);

    auto launched = launcher_->launch(command, launchOptions);
    if (!launched) {
        // Resolved on the next loop round so callers see a uniform async path
        auto message = launched.error().describe();
        spdlog::error("ProcessRunner: [{}] {}", execution_id_, message);
        loop_.post([this, alive = std::weak_ptr<bool>(alive_),
                    generation = generation_,
                    message = std::move(message)]() mutable {
            if (alive.expired() || generation != generation_) {
                return;
            }
            finishWithSpawnError(std::move(message));
        });
        return {};
    }

    child_ = std::move(*launched);
    watchChild();
    return {};
}

auto ProcessRunner::runSync(const CommandLine& command, RunOptions options)
    -> Result<ProcessResult> {
    auto slot = std::make_shared<std::optional<ProcessResult>>();
    auto started = execute(command, std::move(options),
                           [slot](const ProcessResult& result) {
                               *slot = result;
                           });
    if (!started) {
        return std::unexpected(started.error());
    }

    loop_.runUntil([&slot] { return slot->has_value(); });
    if (!slot->has_value()) {
        return std::unexpected(Error{
            RunnerError::UnknownError,
            "event loop stopped before the command finished"});
    }
    return std::move(**slot);
}

void ProcessRunner::watchChild() {
    const int outFd = child_->stdoutFd();
    const int errFd = child_->stderrFd();
    if (!loop_.watchFd(outFd, [this](std::uint32_t) { drain(Stream::Stdout); }) ||
        !loop_.watchFd(errFd, [this](std::uint32_t) { drain(Stream::Stderr); })) {
        spdlog::error("ProcessRunner: [{}] cannot watch output pipes",
                      execution_id_);
    }

    const int exitFd = child_->exitFd();
    if (exitFd == -1 || !loop_.watchFd(exitFd, [this](std::uint32_t) {
            onExitReady();
        })) {
        reap_timer_ = loop_.setInterval([this] { onExitReady(); },
                                        config_.reapPollInterval);
    }

    tick_timer_ =
        loop_.setInterval([this] { onTick(); }, config_.progressTick);

    if (timeout_ && timeout_->count() > 0) {
        timeout_timer_ =
            loop_.setTimeout([this] { onTimeout(); }, *timeout_);
    }
}

void ProcessRunner::drain(Stream stream) {
    if (!child_) {
        return;
    }
    const int fd =
        stream == Stream::Stdout ? child_->stdoutFd() : child_->stderrFd();
    if (fd == -1) {
        return;
    }

    std::array<char, kReadChunkSize> buffer{};
    while (true) {
        const ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            handleChunk(stream, std::string(buffer.data(),
                                            static_cast<std::size_t>(n)));
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n == -1) {
            spdlog::warn("ProcessRunner: [{}] read error on {}: {}",
                         execution_id_,
                         stream == Stream::Stdout ? "stdout" : "stderr",
                         std::strerror(errno));
        }
        // EOF or unrecoverable read error
        loop_.unwatchFd(fd);
        if (stream == Stream::Stdout) {
            child_->closeStdout();
        } else {
            child_->closeStderr();
        }
        return;
    }
}

void ProcessRunner::handleChunk(Stream stream, std::string chunk) {
    output_ += chunk;
    if (stream == Stream::Stderr) {
        run_stderr_ += chunk;
        error_ += chunk;
        bus_->publish(events::ExecutionEvent::error(execution_id_,
                                                    std::move(chunk)));
        return;
    }

    run_stdout_ += chunk;
    std::optional<ProgressUpdate> update;
    if (estimator_) {
        update = estimator_->onOutput(chunk);
    }
    bus_->publish(
        events::ExecutionEvent::output(execution_id_, std::move(chunk)));
    if (update) {
        publishProgress(*update);
    }
}

void ProcessRunner::onExitReady() {
    if (!child_ || state_ != RunnerState::Running) {
        return;
    }
    auto status = child_->tryReap();
    if (!status) {
        return;
    }

    // Pick up whatever the child wrote right before exiting
    drain(Stream::Stdout);
    drain(Stream::Stderr);
    finish(*status);
}

void ProcessRunner::onTick() {
    if (state_ != RunnerState::Running || !estimator_) {
        return;
    }
    if (auto update = estimator_->onTick(elapsed())) {
        publishProgress(*update);
    }
}

void ProcessRunner::onTimeout() {
    timeout_timer_ = app::EventLoop::kInvalidTimer;
    if (state_ != RunnerState::Running) {
        return;
    }
    spdlog::warn("ProcessRunner: [{}] timed out after {}ms", execution_id_,
                 timeout_ ? timeout_->count() : 0);
    bus_->publish(events::ExecutionEvent::status(
        execution_id_, "Command timed out, terminating..."));
    requestTermination(ErrorKind::Timeout);
}

void ProcessRunner::cancel() {
    if (state_ != RunnerState::Running || !child_) {
        return;
    }
    spdlog::info("ProcessRunner: [{}] cancelling", execution_id_);
    bus_->publish(
        events::ExecutionEvent::status(execution_id_, "Cancelling command..."));
    requestTermination(ErrorKind::Cancellation);
}

void ProcessRunner::requestTermination(ErrorKind reason) {
    if (!termination_) {
        termination_ = reason;
    }
    if (timeout_timer_ != app::EventLoop::kInvalidTimer) {
        loop_.cancelTimer(timeout_timer_);
        timeout_timer_ = app::EventLoop::kInvalidTimer;
    }
    if (sigkill_sent_) {
        return;
    }

    if (auto sent = child_->kill(SIGTERM); !sent) {
        spdlog::debug("ProcessRunner: [{}] SIGTERM not delivered: {}",
                      execution_id_, sent.error().describe());
    }

    if (kill_timer_ != app::EventLoop::kInvalidTimer) {
        loop_.cancelTimer(kill_timer_);
    }
    kill_timer_ =
        loop_.setTimeout([this] { forceKill(); }, config_.killGracePeriod);
}

void ProcessRunner::forceKill() {
    kill_timer_ = app::EventLoop::kInvalidTimer;
    if (state_ != RunnerState::Running || !child_ || child_->hasExited() ||
        sigkill_sent_) {
        return;
    }

    spdlog::warn("ProcessRunner: [{}] still alive after {}ms, sending SIGKILL",
                 execution_id_, config_.killGracePeriod.count());
    sigkill_sent_ = true;
    bus_->publish(
        events::ExecutionEvent::status(execution_id_, "Force killing command..."));
    if (auto sent = child_->kill(SIGKILL); !sent) {
        spdlog::error("ProcessRunner: [{}] SIGKILL failed: {}", execution_id_,
                      sent.error().describe());
    }
}

void ProcessRunner::finish(const ExitStatus& status) {
    if (state_ != RunnerState::Running) {
        return;
    }

    ProcessResult result;
    result.exitCode = status.exitCode;
    result.signal = status.signal;
    result.output = run_stdout_;
    result.duration = elapsed();

    const auto withStderr = [this](std::string text) {
        if (!run_stderr_.empty()) {
            text += '\n';
            text += run_stderr_;
        }
        return text;
    };

    if (termination_ == ErrorKind::Cancellation) {
        result.success = false;
        result.reason = ErrorKind::Cancellation;
        result.error = withStderr("Command cancelled");
    } else if (termination_ == ErrorKind::Timeout) {
        result.success = false;
        result.reason = ErrorKind::Timeout;
        result.error = withStderr(fmt::format(
            "Command timed out after {}ms", timeout_ ? timeout_->count() : 0));
    } else {
        result.success = status.exitCode == 0 && !status.signal;
        result.reason = result.success ? ErrorKind::None : ErrorKind::Runtime;
        if (!run_stderr_.empty()) {
            result.error = run_stderr_;
        }
    }

    spdlog::info("ProcessRunner: [{}] finished with exit code {} in {}ms ({})",
                 execution_id_, result.exitCode, result.duration.count(),
                 errorKindToString(result.reason));
    resolve(std::move(result));
}

void ProcessRunner::finishWithSpawnError(std::string message) {
    if (state_ != RunnerState::Running) {
        return;
    }

    ProcessResult result;
    result.success = false;
    result.exitCode = 1;
    result.output = run_stdout_;
    result.error = message;
    result.duration = elapsed();
    result.reason = ErrorKind::Spawn;
    error_ += message;
    bus_->publish(
        events::ExecutionEvent::error(execution_id_, std::move(message)));
    resolve(std::move(result));
}

void ProcessRunner::resolve(ProcessResult result) {
    teardown();
    state_ = RunnerState::Idle;

    // The handler may start the next execution on this runner
    auto handler = std::move(on_complete_);
    on_complete_ = nullptr;
    const auto id = execution_id_;

    bus_->publish(events::ExecutionEvent::complete(id, result));
    if (handler) {
        handler(result);
    }
}

void ProcessRunner::teardown() {
    for (auto* timer : {&tick_timer_, &timeout_timer_, &kill_timer_,
                        &reap_timer_}) {
        if (*timer != app::EventLoop::kInvalidTimer) {
            loop_.cancelTimer(*timer);
            *timer = app::EventLoop::kInvalidTimer;
        }
    }

    if (child_) {
        for (int fd : {child_->stdoutFd(), child_->stderrFd(),
                       child_->exitFd()}) {
            if (fd != -1) {
                loop_.unwatchFd(fd);
            }
        }
        child_.reset();
    }
}

void ProcessRunner::publishProgress(const ProgressUpdate& update) {
    bus_->publish(
        events::ExecutionEvent::progressUpdate(execution_id_, update.percent));
    if (update.status) {
        bus_->publish(
            events::ExecutionEvent::status(execution_id_, *update.status));
    }
}

auto ProcessRunner::elapsed() const -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        app::EventLoop::Clock::now() - started_);
}

auto ProcessRunner::pid() const -> std::optional<int> {
    if (!child_) {
        return std::nullopt;
    }
    return child_->pid();
}

auto ProcessRunner::progress() const -> int {
    return estimator_ ? estimator_->current() : 0;
}

void ProcessRunner::clearOutput() {
    output_.clear();
    error_.clear();
}

}  // namespace devflow::process
