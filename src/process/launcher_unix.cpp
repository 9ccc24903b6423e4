/*
 * launcher_unix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef _WIN32

#include "launcher.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string_view>
#include <vector>

extern char** environ;

namespace devflow::process {

namespace {

void closeFd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

/**
 * @brief Pipe whose ends are closed on scope exit unless released
 */
struct Pipe {
    int readEnd{-1};
    int writeEnd{-1};

    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() {
        closeFd(readEnd);
        closeFd(writeEnd);
    }

    auto open() -> bool {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) == -1) {
            return false;
        }
        readEnd = fds[0];
        writeEnd = fds[1];
        return true;
    }

    auto releaseRead() -> int {
        int fd = readEnd;
        readEnd = -1;
        return fd;
    }
};

/// Written by the child to the status pipe when it cannot exec
struct ChildFailure {
    int stage;  ///< 1 = chdir, 2 = exec
    int error;
};

[[noreturn]] void reportChildFailure(int fd, int stage) {
    ChildFailure failure{stage, errno};
    [[maybe_unused]] auto written = ::write(fd, &failure, sizeof(failure));
    ::_exit(127);
}

auto setNonBlocking(int fd) -> bool {
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags != -1 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

auto decodeStatus(int status) -> ExitStatus {
    if (WIFEXITED(status)) {
        return ExitStatus{WEXITSTATUS(status), std::nullopt};
    }
    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        return ExitStatus{128 + sig, sig};
    }
    return ExitStatus{1, std::nullopt};
}

auto openPidFd(pid_t pid) -> int {
#ifdef SYS_pidfd_open
    int fd = static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
    if (fd == -1) {
        spdlog::debug("Launcher: pidfd_open unavailable (errno {}), polling",
                      errno);
    }
    return fd;
#else
    return -1;
#endif
}

class PosixChildProcess : public IChildProcess {
public:
    PosixChildProcess(pid_t pid, int stdoutFd, int stderrFd, int exitFd,
                      bool groupLeader)
        : pid_(pid),
          stdout_(stdoutFd),
          stderr_(stderrFd),
          exit_(exitFd),
          group_leader_(groupLeader) {}

    ~PosixChildProcess() override {
        if (!exited_) {
            spdlog::debug("Launcher: killing unreaped child {}", pid_);
            signalChild(SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
            }
        }
        closeFd(stdout_);
        closeFd(stderr_);
        closeFd(exit_);
    }

    PosixChildProcess(const PosixChildProcess&) = delete;
    PosixChildProcess& operator=(const PosixChildProcess&) = delete;

    [[nodiscard]] auto pid() const noexcept -> int override { return pid_; }
    [[nodiscard]] auto stdoutFd() const noexcept -> int override {
        return stdout_;
    }
    [[nodiscard]] auto stderrFd() const noexcept -> int override {
        return stderr_;
    }
    [[nodiscard]] auto exitFd() const noexcept -> int override {
        return exit_;
    }

    void closeStdout() override { closeFd(stdout_); }
    void closeStderr() override { closeFd(stderr_); }

    auto kill(int signal) -> Result<void> override {
        if (exited_) {
            return std::unexpected(
                Error{RunnerError::NotRunning, "process already exited"});
        }
        if (!signalChild(signal)) {
            return std::unexpected(
                Error{RunnerError::SignalFailed,
                      fmt::format("kill({}, {}) failed: {}", pid_, signal,
                                  std::strerror(errno))});
        }
        return {};
    }

    auto tryReap() -> std::optional<ExitStatus> override {
        if (exited_) {
            return status_;
        }

        int status = 0;
        pid_t result = ::waitpid(pid_, &status, WNOHANG);
        while (result == -1 && errno == EINTR) {
            result = ::waitpid(pid_, &status, WNOHANG);
        }

        if (result == pid_) {
            exited_ = true;
            status_ = decodeStatus(status);
            return status_;
        }
        if (result == -1) {
            spdlog::warn("Launcher: waitpid({}) failed: {}", pid_,
                         std::strerror(errno));
            exited_ = true;
            status_ = ExitStatus{1, std::nullopt};
            return status_;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto hasExited() const noexcept -> bool override {
        return exited_;
    }

private:
    auto signalChild(int signal) -> bool {
        if (group_leader_ && ::kill(-pid_, signal) == 0) {
            return true;
        }
        return ::kill(pid_, signal) == 0;
    }

    pid_t pid_;
    int stdout_;
    int stderr_;
    int exit_;
    bool group_leader_;
    bool exited_{false};
    ExitStatus status_{};
};

}  // namespace

auto PosixProcessLauncher::launch(const CommandLine& command,
                                  const LaunchOptions& options)
    -> Result<std::unique_ptr<IChildProcess>> {
    if (command.program.empty()) {
        return std::unexpected(
            Error{RunnerError::InvalidCommand, "program must not be empty"});
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> argvStore;
    argvStore.reserve(command.args.size() + 1);
    argvStore.push_back(command.program);
    argvStore.insert(argvStore.end(), command.args.begin(),
                     command.args.end());
    std::vector<char*> argv;
    argv.reserve(argvStore.size() + 1);
    for (auto& arg : argvStore) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStore;
    if (options.inheritEnvironment) {
        for (char** entry = environ; entry != nullptr && *entry != nullptr;
             ++entry) {
            std::string_view text(*entry);
            auto key = std::string(text.substr(0, text.find('=')));
            if (!options.environment.contains(key)) {
                envStore.emplace_back(text);
            }
        }
    }
    for (const auto& [key, value] : options.environment) {
        envStore.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(envStore.size() + 1);
    for (auto& entry : envStore) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string cwd = options.cwd ? options.cwd->string() : std::string{};

    Pipe out;
    Pipe err;
    Pipe status;
    if (!out.open() || !err.open() || !status.open()) {
        return std::unexpected(
            Error{RunnerError::PipeCreationFailed,
                  fmt::format("pipe2 failed: {}", std::strerror(errno))});
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        spdlog::error("Launcher: fork failed for {}", command.program);
        return std::unexpected(
            Error{RunnerError::ProcessSpawnFailed,
                  fmt::format("spawn {} failed: {}", command.program,
                              std::strerror(errno))});
    }

    if (pid == 0) {
        // Child process: async-signal-safe calls only
        if (options.newProcessGroup) {
            ::setpgid(0, 0);
        }
        ::signal(SIGPIPE, SIG_DFL);

        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull > STDIN_FILENO) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(out.writeEnd, STDOUT_FILENO);
        ::dup2(err.writeEnd, STDERR_FILENO);

        if (!cwd.empty() && ::chdir(cwd.c_str()) == -1) {
            reportChildFailure(status.writeEnd, 1);
        }

        ::execvpe(argv[0], argv.data(), envp.data());
        reportChildFailure(status.writeEnd, 2);
    }

    // Parent process
    if (options.newProcessGroup) {
        ::setpgid(pid, pid);
    }
    closeFd(out.writeEnd);
    closeFd(err.writeEnd);
    closeFd(status.writeEnd);

    ChildFailure failure{};
    ssize_t received = 0;
    do {
        received = ::read(status.readEnd, &failure, sizeof(failure));
    } while (received == -1 && errno == EINTR);

    if (received == static_cast<ssize_t>(sizeof(failure))) {
        int waitStatus = 0;
        while (::waitpid(pid, &waitStatus, 0) == -1 && errno == EINTR) {
        }
        std::string message =
            failure.stage == 1
                ? fmt::format("spawn {} failed: cannot change directory to {}: "
                              "{}",
                              command.program, cwd,
                              std::strerror(failure.error))
                : fmt::format("spawn {} failed: {}", command.program,
                              std::strerror(failure.error));
        spdlog::warn("Launcher: {}", message);
        return std::unexpected(
            Error{RunnerError::ProcessSpawnFailed, std::move(message)});
    }

    if (!setNonBlocking(out.readEnd) || !setNonBlocking(err.readEnd)) {
        spdlog::warn("Launcher: failed to make pipes of {} non-blocking", pid);
    }

    int exitFd = openPidFd(pid);
    spdlog::debug("Launcher: spawned {} with PID {}", command.toString(), pid);
    return std::make_unique<PosixChildProcess>(pid, out.releaseRead(),
                                               err.releaseRead(), exitFd,
                                               options.newProcessGroup);
}

auto createDefaultLauncher() -> std::shared_ptr<IProcessLauncher> {
    return std::make_shared<PosixProcessLauncher>();
}

}  // namespace devflow::process

#endif  // !_WIN32
