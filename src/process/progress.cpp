/*
 * progress.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "progress.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <spdlog/spdlog.h>

namespace devflow::process {

namespace {

auto toLower(std::string_view text) -> std::string {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lowered;
}

}  // namespace

// ============================================================================
// TimeBasedProgressEstimator
// ============================================================================

TimeBasedProgressEstimator::TimeBasedProgressEstimator(
    std::chrono::milliseconds expectedDuration, int cap)
    : expected_(std::max(expectedDuration, std::chrono::milliseconds(1))),
      cap_(std::clamp(cap, 0, 100)) {}

void TimeBasedProgressEstimator::start() { current_ = 0; }

auto TimeBasedProgressEstimator::onTick(std::chrono::milliseconds elapsed)
    -> std::optional<ProgressUpdate> {
    const auto ratio = static_cast<double>(elapsed.count()) /
                       static_cast<double>(expected_.count());
    const int estimate =
        std::min(cap_, static_cast<int>(std::floor(ratio * 100.0)));
    if (estimate <= current_) {
        return std::nullopt;
    }
    current_ = estimate;
    return ProgressUpdate{current_, std::nullopt};
}

auto TimeBasedProgressEstimator::onOutput(std::string_view)
    -> std::optional<ProgressUpdate> {
    return std::nullopt;
}

// ============================================================================
// MilestoneProgressEstimator
// ============================================================================

MilestoneProgressEstimator::MilestoneProgressEstimator(
    std::vector<std::string> steps, int cap)
    : cap_(std::clamp(cap, 0, 100)) {
    steps_.reserve(steps.size());
    for (const auto& step : steps) {
        steps_.push_back(toLower(step));
    }
}

void MilestoneProgressEstimator::start() {
    step_ = 0;
    current_ = 0;
}

auto MilestoneProgressEstimator::onTick(std::chrono::milliseconds)
    -> std::optional<ProgressUpdate> {
    return std::nullopt;
}

auto MilestoneProgressEstimator::onOutput(std::string_view chunk)
    -> std::optional<ProgressUpdate> {
    if (steps_.empty() || step_ >= steps_.size()) {
        return std::nullopt;
    }

    const auto lowered = toLower(chunk);
    for (std::size_t i = step_; i < steps_.size(); ++i) {
        if (lowered.find(steps_[i]) == std::string::npos) {
            continue;
        }
        step_ = i + 1;
        const int estimate = std::min(
            cap_, static_cast<int>(std::lround(
                      100.0 * static_cast<double>(step_) /
                      static_cast<double>(steps_.size()))));
        current_ = std::max(current_, estimate);
        spdlog::trace("Progress: milestone {}/{} '{}'", step_, steps_.size(),
                      steps_[i]);
        return ProgressUpdate{current_,
                              fmt::format("Step {}/{}: {}", step_,
                                          steps_.size(), steps_[i])};
    }
    return std::nullopt;
}

// ============================================================================
// HybridProgressEstimator
// ============================================================================

HybridProgressEstimator::HybridProgressEstimator(
    std::vector<std::string> steps, std::chrono::milliseconds expectedDuration,
    int cap)
    : milestones_(std::move(steps), cap), timer_(expectedDuration, cap) {}

void HybridProgressEstimator::start() {
    milestones_.start();
    timer_.start();
    current_ = 0;
}

auto HybridProgressEstimator::onTick(std::chrono::milliseconds elapsed)
    -> std::optional<ProgressUpdate> {
    return merge(timer_.onTick(elapsed));
}

auto HybridProgressEstimator::onOutput(std::string_view chunk)
    -> std::optional<ProgressUpdate> {
    return merge(milestones_.onOutput(chunk));
}

auto HybridProgressEstimator::merge(std::optional<ProgressUpdate> update)
    -> std::optional<ProgressUpdate> {
    if (!update) {
        return std::nullopt;
    }
    if (update->percent <= current_) {
        // A status line is still worth reporting at the same percentage
        if (update->status) {
            return ProgressUpdate{current_, std::move(update->status)};
        }
        return std::nullopt;
    }
    current_ = update->percent;
    return update;
}

// ============================================================================
// Presets
// ============================================================================

auto progressStepsFor(CommandAction action) -> std::vector<std::string> {
    switch (action) {
        case CommandAction::AiDebug:
            return {"initializing workspace analysis", "analyzing test files",
                    "running test suite",             "collecting coverage data",
                    "generating git diff",            "creating ai context",
                    "finalizing output"};
        case CommandAction::NxTest:
            return {"determining test suites to run", "found test suites",
                    "running tests",                  "test suites completed",
                    "collecting coverage",            "test results"};
        case CommandAction::GitDiff:
            return {"analyzing repository", "computing diff",
                    "processing changes"};
        case CommandAction::PrepareToPush:
            return {"checking workspace status", "running eslint",
                    "running prettier",          "checking typescript",
                    "validating build",          "preparing summary"};
        case CommandAction::Lint:
        case CommandAction::Format:
            return {"loading configuration", "scanning files",
                    "running lint rules", "generating report"};
        case CommandAction::Custom:
            break;
    }
    return {};
}

auto makeProgressEstimator(const std::vector<std::string>& steps,
                           std::chrono::milliseconds expectedDuration)
    -> std::unique_ptr<IProgressEstimator> {
    if (steps.empty()) {
        return std::make_unique<TimeBasedProgressEstimator>(expectedDuration);
    }
    return std::make_unique<HybridProgressEstimator>(steps, expectedDuration);
}

}  // namespace devflow::process
