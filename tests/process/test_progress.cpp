/*
 * test_progress.cpp - Tests for progress estimation
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "process/progress.hpp"

using namespace devflow;
using namespace devflow::process;
using namespace std::chrono_literals;

TEST(TimeBasedProgressTest, GrowsWithElapsedTimeUpToCap) {
    TimeBasedProgressEstimator estimator(1000ms);
    estimator.start();

    auto update = estimator.onTick(250ms);
    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->percent, 25);

    EXPECT_FALSE(estimator.onTick(250ms).has_value());
    EXPECT_EQ(estimator.onTick(5000ms)->percent, kDefaultProgressCap);
    EXPECT_FALSE(estimator.onTick(9000ms).has_value());
    EXPECT_EQ(estimator.current(), kDefaultProgressCap);
}

TEST(TimeBasedProgressTest, IgnoresOutput) {
    TimeBasedProgressEstimator estimator;
    EXPECT_FALSE(estimator.onOutput("Running tests").has_value());
}

TEST(MilestoneProgressTest, AdvancesThroughMarkersInOrder) {
    MilestoneProgressEstimator estimator({"alpha", "beta", "gamma", "delta"},
                                         100);
    estimator.start();

    auto first = estimator.onOutput("ALPHA started\n");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->percent, 25);
    EXPECT_EQ(first->status.value_or(""), "Step 1/4: alpha");

    // Skipping ahead is allowed
    auto third = estimator.onOutput("now gamma\n");
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->percent, 75);
    EXPECT_EQ(estimator.currentStep(), 3u);

    // Earlier markers never move it back
    EXPECT_FALSE(estimator.onOutput("alpha again\n").has_value());
    EXPECT_EQ(estimator.current(), 75);
}

TEST(MilestoneProgressTest, RespectsCap) {
    MilestoneProgressEstimator estimator({"only"});
    estimator.start();
    EXPECT_EQ(estimator.onOutput("only step")->percent, kDefaultProgressCap);
}

TEST(HybridProgressTest, NeverDecreases) {
    HybridProgressEstimator estimator({"one", "two"}, 1000ms);
    estimator.start();

    EXPECT_EQ(estimator.onTick(600ms)->percent, 60);

    // Milestone at 50% still reports its status without lowering progress
    auto update = estimator.onOutput("one\n");
    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->percent, 60);
    EXPECT_TRUE(update->status.has_value());

    EXPECT_EQ(estimator.onOutput("two\n")->percent, kDefaultProgressCap);
    EXPECT_EQ(estimator.current(), kDefaultProgressCap);
}

TEST(ProgressPresetTest, StepsPerAction) {
    EXPECT_EQ(progressStepsFor(CommandAction::AiDebug).size(), 7u);
    EXPECT_EQ(progressStepsFor(CommandAction::NxTest).size(), 6u);
    EXPECT_EQ(progressStepsFor(CommandAction::GitDiff).size(), 3u);
    EXPECT_TRUE(progressStepsFor(CommandAction::Custom).empty());
}

TEST(ProgressPresetTest, FactoryPicksEstimator) {
    auto timeBased = makeProgressEstimator({}, 1000ms);
    timeBased->start();
    EXPECT_FALSE(timeBased->onOutput("running tests").has_value());

    auto hybrid = makeProgressEstimator({"running tests"}, 1000ms);
    hybrid->start();
    EXPECT_TRUE(hybrid->onOutput("Running tests").has_value());
}
