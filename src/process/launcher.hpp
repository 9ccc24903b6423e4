/*
 * launcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file launcher.hpp
 * @brief Process spawning primitive used by ProcessRunner
 * @date 2025-03-02
 * @version 1.0.0
 */

#ifndef DEVFLOW_PROCESS_LAUNCHER_HPP
#define DEVFLOW_PROCESS_LAUNCHER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace devflow::process {

/**
 * @brief How a child process ended
 */
struct ExitStatus {
    int exitCode{0};            ///< Exit code, or 128 + signal when signalled
    std::optional<int> signal;  ///< Terminating signal, if any
};

/**
 * @brief Options applied when launching a child
 */
struct LaunchOptions {
    std::optional<std::filesystem::path> cwd;
    std::unordered_map<std::string, std::string> environment;  ///< Overrides
    bool inheritEnvironment{true};
    bool newProcessGroup{true};  ///< Child leads its own process group
};

/**
 * @brief Handle to one launched child process
 *
 * Descriptors are owned by the handle and are non-blocking. Destroying a
 * handle whose child is still alive kills the child and reaps it.
 */
class IChildProcess {
public:
    virtual ~IChildProcess() = default;

    [[nodiscard]] virtual auto pid() const noexcept -> int = 0;

    /// Read end of the child's stdout, or -1 once closed
    [[nodiscard]] virtual auto stdoutFd() const noexcept -> int = 0;

    /// Read end of the child's stderr, or -1 once closed
    [[nodiscard]] virtual auto stderrFd() const noexcept -> int = 0;

    /**
     * @brief Descriptor that becomes readable when the child exits.
     * @return -1 when the platform offers none; callers then poll tryReap()
     */
    [[nodiscard]] virtual auto exitFd() const noexcept -> int = 0;

    virtual void closeStdout() = 0;
    virtual void closeStderr() = 0;

    /**
     * @brief Sends a signal to the child (its whole group when it leads one)
     */
    virtual auto kill(int signal) -> Result<void> = 0;

    /**
     * @brief Non-blocking reap.
     * @return The exit status once the child has exited
     */
    virtual auto tryReap() -> std::optional<ExitStatus> = 0;

    [[nodiscard]] virtual auto hasExited() const noexcept -> bool = 0;
};

/**
 * @brief Abstract process launcher
 */
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    /**
     * @brief Starts a child with piped stdout/stderr and stdin from /dev/null
     * @return Child handle, or a ProcessSpawnFailed error carrying the reason
     */
    [[nodiscard]] virtual auto launch(const CommandLine& command,
                                      const LaunchOptions& options)
        -> Result<std::unique_ptr<IChildProcess>> = 0;
};

/**
 * @brief fork/exec based launcher for POSIX systems
 */
class PosixProcessLauncher : public IProcessLauncher {
public:
    [[nodiscard]] auto launch(const CommandLine& command,
                              const LaunchOptions& options)
        -> Result<std::unique_ptr<IChildProcess>> override;
};

/**
 * @brief Creates the default launcher for this platform
 */
[[nodiscard]] auto createDefaultLauncher() -> std::shared_ptr<IProcessLauncher>;

}  // namespace devflow::process

#endif  // DEVFLOW_PROCESS_LAUNCHER_HPP
