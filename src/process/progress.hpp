/*
 * progress.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file progress.hpp
 * @brief Heuristic progress estimation for external processes
 * @date 2025-03-02
 * @version 1.0.0
 *
 * External commands report no progress, so the runner asks an estimator.
 * Estimates are monotonically non-decreasing and capped below 100; only the
 * terminal result reports completion.
 */

#ifndef DEVFLOW_PROCESS_PROGRESS_HPP
#define DEVFLOW_PROCESS_PROGRESS_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"

namespace devflow::process {

/**
 * @brief A new estimate, optionally with a status line
 */
struct ProgressUpdate {
    int percent{0};
    std::optional<std::string> status;
};

/**
 * @brief Narrow interface the runner drives while a process is running
 */
class IProgressEstimator {
public:
    virtual ~IProgressEstimator() = default;

    /**
     * @brief Resets the estimate for a new execution
     */
    virtual void start() = 0;

    /**
     * @brief Called on every progress tick
     * @param elapsed Time since the execution started
     * @return An update when the estimate increased
     */
    virtual auto onTick(std::chrono::milliseconds elapsed)
        -> std::optional<ProgressUpdate> = 0;

    /**
     * @brief Called with every stdout chunk
     * @return An update when the estimate increased
     */
    virtual auto onOutput(std::string_view chunk)
        -> std::optional<ProgressUpdate> = 0;

    [[nodiscard]] virtual auto current() const -> int = 0;
};

inline constexpr int kDefaultProgressCap = 90;
inline constexpr std::chrono::milliseconds kDefaultExpectedDuration{30000};

/**
 * @brief Linear estimate over an expected duration
 */
class TimeBasedProgressEstimator : public IProgressEstimator {
public:
    explicit TimeBasedProgressEstimator(
        std::chrono::milliseconds expectedDuration = kDefaultExpectedDuration,
        int cap = kDefaultProgressCap);

    void start() override;
    auto onTick(std::chrono::milliseconds elapsed)
        -> std::optional<ProgressUpdate> override;
    auto onOutput(std::string_view chunk)
        -> std::optional<ProgressUpdate> override;
    [[nodiscard]] auto current() const -> int override { return current_; }

private:
    std::chrono::milliseconds expected_;
    int cap_;
    int current_{0};
};

/**
 * @brief Advances through an ordered list of output markers
 *
 * Markers are matched case-insensitively, in order; a chunk may skip ahead
 * to a later marker but never move backwards.
 */
class MilestoneProgressEstimator : public IProgressEstimator {
public:
    explicit MilestoneProgressEstimator(std::vector<std::string> steps,
                                        int cap = kDefaultProgressCap);

    void start() override;
    auto onTick(std::chrono::milliseconds elapsed)
        -> std::optional<ProgressUpdate> override;
    auto onOutput(std::string_view chunk)
        -> std::optional<ProgressUpdate> override;
    [[nodiscard]] auto current() const -> int override { return current_; }

    [[nodiscard]] auto currentStep() const noexcept -> std::size_t {
        return step_;
    }

private:
    std::vector<std::string> steps_;  ///< Lower-cased markers
    int cap_;
    std::size_t step_{0};
    int current_{0};
};

/**
 * @brief Milestones when output markers match, elapsed time otherwise
 */
class HybridProgressEstimator : public IProgressEstimator {
public:
    HybridProgressEstimator(std::vector<std::string> steps,
                            std::chrono::milliseconds expectedDuration,
                            int cap = kDefaultProgressCap);

    void start() override;
    auto onTick(std::chrono::milliseconds elapsed)
        -> std::optional<ProgressUpdate> override;
    auto onOutput(std::string_view chunk)
        -> std::optional<ProgressUpdate> override;
    [[nodiscard]] auto current() const -> int override { return current_; }

private:
    auto merge(std::optional<ProgressUpdate> update)
        -> std::optional<ProgressUpdate>;

    MilestoneProgressEstimator milestones_;
    TimeBasedProgressEstimator timer_;
    int current_{0};
};

/**
 * @brief Output markers emitted by the tools behind each action
 */
[[nodiscard]] auto progressStepsFor(CommandAction action)
    -> std::vector<std::string>;

/**
 * @brief Builds the estimator for a run: hybrid when steps are given
 */
[[nodiscard]] auto makeProgressEstimator(
    const std::vector<std::string>& steps,
    std::chrono::milliseconds expectedDuration = kDefaultExpectedDuration)
    -> std::unique_ptr<IProgressEstimator>;

}  // namespace devflow::process

#endif  // DEVFLOW_PROCESS_PROGRESS_HPP
