/*
 * test_batch_coordinator.cpp - Tests for output file batches
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "batch/batch_coordinator.hpp"
#include "batch/output_store.hpp"
#include "core/exception.hpp"
#include "events/event_bus.hpp"

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <thread>

using namespace devflow;
using namespace devflow::batch;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

/**
 * Filesystem store that fails a configurable number of writes per type.
 */
class FlakyOutputStore : public FileSystemOutputStore {
public:
    using FileSystemOutputStore::FileSystemOutputStore;

    auto write(OutputType type, std::string_view content) -> fs::path override {
        ++attempts[type];
        auto it = failures.find(type);
        if (it != failures.end() && it->second != 0) {
            if (it->second > 0) {
                --it->second;
            }
            THROW_BATCH_ERROR("disk full");
        }
        return FileSystemOutputStore::write(type, content);
    }

    /// Remaining failures per type; negative fails forever
    std::map<OutputType, int> failures;
    std::map<OutputType, int> attempts;
};

constexpr const char* kJest = "PASS src/app.spec.ts\nTests: 3 passed\n";
constexpr const char* kDiff = "diff --git a/x b/x\n@@ -1 +1 @@\n";

}  // namespace

class BatchCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("devflow-batch-" + std::to_string(::getpid()) + "-" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        store_ = std::make_shared<FlakyOutputStore>(root_ / "context");
        bus_ = events::EventBus::create();
        coordinator_ = std::make_unique<BatchCoordinator>(store_, bus_, 1ms);
    }

    void TearDown() override { fs::remove_all(root_); }

    fs::path root_;
    std::shared_ptr<FlakyOutputStore> store_;
    std::shared_ptr<events::EventBus> bus_;
    std::unique_ptr<BatchCoordinator> coordinator_;
};

// ============================================================================
// executeBatch Tests
// ============================================================================

TEST_F(BatchCoordinatorTest, WritesEveryFile) {
    auto result = coordinator_->executeBatch(
        "nxTest", {{OutputType::JestOutput, kJest}, {OutputType::Diff, kDiff}});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.filesProcessed, 2u);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.batchId.rfind("nxTest-", 0), 0u);
    ASSERT_EQ(result.outputPaths.size(), 2u);
    EXPECT_EQ(store_->read(OutputType::JestOutput), kJest);
    EXPECT_EQ(result.outputPaths.at(OutputType::Diff).string(),
              (root_ / "context" / "diff.txt").string());
}

TEST_F(BatchCoordinatorTest, OneFailureDoesNotBlockOthers) {
    store_->failures[OutputType::Diff] = -1;
    std::vector<std::string> errors;
    auto sub = bus_->subscribe(events::EventKind::Error,
                               [&](const events::ExecutionEvent& event) {
                                   errors.push_back(event.text);
                               });

    auto result = coordinator_->executeBatch(
        "aiDebug", {{OutputType::JestOutput, kJest},
                    {OutputType::Diff, kDiff},
                    {OutputType::AiDebugContext, "AI DEBUG CONTEXT\n"}});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.filesProcessed, 2u);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "Failed to save diff: disk full");
    EXPECT_EQ(result.outputPaths.size(), 2u);
    EXPECT_FALSE(result.outputPaths.contains(OutputType::Diff));
    EXPECT_EQ(store_->attempts[OutputType::Diff], 1);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors.front(), result.errors.front());
}

TEST_F(BatchCoordinatorTest, RetriesTransientFailures) {
    store_->failures[OutputType::Diff] = 2;
    BatchOptions options;
    options.maxRetries = 2;

    auto result = coordinator_->executeBatch(
        "gitDiff", {{OutputType::Diff, kDiff}}, options);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.filesProcessed, 1u);
    EXPECT_EQ(store_->attempts[OutputType::Diff], 3);
}

TEST_F(BatchCoordinatorTest, GivesUpAfterMaxRetries) {
    store_->failures[OutputType::Diff] = -1;
    BatchOptions options;
    options.maxRetries = 2;

    auto result = coordinator_->executeBatch(
        "gitDiff", {{OutputType::Diff, kDiff}}, options);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.filesProcessed, 0u);
    EXPECT_EQ(store_->attempts[OutputType::Diff], 3);
}

TEST_F(BatchCoordinatorTest, ContentValidationRejectsWithoutRetry) {
    BatchOptions options;
    options.validateContent = true;
    options.maxRetries = 3;

    auto result = coordinator_->executeBatch(
        "nxTest", {{OutputType::JestOutput, "nothing useful"}}, options);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.filesProcessed, 0u);
    EXPECT_EQ(store_->attempts[OutputType::JestOutput], 0);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors.front().find("jest-output"), std::string::npos);
}

TEST_F(BatchCoordinatorTest, BackupCopiesExistingFiles) {
    coordinator_->executeBatch("gitDiff", {{OutputType::Diff, kDiff}});

    BatchOptions options;
    options.createBackup = true;
    auto result = coordinator_->executeBatch(
        "gitDiff", {{OutputType::Diff, "No changes detected"}}, options);
    EXPECT_TRUE(result.success);

    std::size_t backups = 0;
    for (const auto& entry : fs::directory_iterator(root_ / "backups")) {
        ++backups;
        EXPECT_TRUE(fs::exists(entry.path() / "diff.txt"));
        EXPECT_TRUE(fs::exists(entry.path() / "backup-metadata.json"));
    }
    EXPECT_EQ(backups, 1u);
    EXPECT_EQ(store_->read(OutputType::Diff), "No changes detected");
}

TEST_F(BatchCoordinatorTest, NotifiesOutcome) {
    std::vector<std::pair<NotificationLevel, std::string>> notes;
    coordinator_->setNotificationHandler(
        [&](NotificationLevel level, const std::string& message) {
            notes.emplace_back(level, message);
        });
    store_->failures[OutputType::Diff] = -1;

    BatchOptions options;
    options.notifyUser = true;
    coordinator_->executeBatch("nxTest", {{OutputType::JestOutput, kJest}},
                               options);
    coordinator_->executeBatch("gitDiff", {{OutputType::Diff, kDiff}},
                               options);

    ASSERT_EQ(notes.size(), 2u);
    EXPECT_EQ(notes[0].first, NotificationLevel::Info);
    EXPECT_EQ(notes[0].second, "nxTest: Successfully processed 1 files");
    EXPECT_EQ(notes[1].first, NotificationLevel::Warning);
    EXPECT_EQ(notes[1].second, "gitDiff: Processed 0 files with 1 errors");
}

// ============================================================================
// History Tests
// ============================================================================

TEST_F(BatchCoordinatorTest, TracksAndCleansUpBatches) {
    BatchOptions options;
    options.trackHistory = true;
    auto first = coordinator_->executeBatch(
        "gitDiff", {{OutputType::Diff, kDiff}}, options);
    auto second = coordinator_->executeBatch(
        "gitDiff", {{OutputType::Diff, kDiff}}, options);

    EXPECT_NE(first.batchId, second.batchId);
    auto record = coordinator_->getBatch(first.batchId);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->command, "gitDiff");
    EXPECT_TRUE(record->success);
    EXPECT_EQ(coordinator_->getActiveBatches().size(), 2u);

    EXPECT_EQ(coordinator_->cleanupCompletedBatches(1h), 0u);
    std::this_thread::sleep_for(2ms);
    EXPECT_EQ(coordinator_->cleanupCompletedBatches(0ms), 2u);
    EXPECT_TRUE(coordinator_->getActiveBatches().empty());
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(BatchCoordinatorTest, ClassifiesCommandOutputs) {
    coordinator_->executeBatch(
        "aiDebug", {{OutputType::JestOutput, kJest}, {OutputType::Diff, "   \n"}});

    auto validation = coordinator_->validateCommandOutputs(
        BatchCoordinator::expectedOutputs(CommandAction::AiDebug));
    EXPECT_EQ(validation.valid, std::vector<OutputType>{OutputType::JestOutput});
    EXPECT_EQ(validation.corrupt, std::vector<OutputType>{OutputType::Diff});
    EXPECT_EQ(validation.missing,
              std::vector<OutputType>{OutputType::AiDebugContext});
    EXPECT_FALSE(validation.allValid());
}

TEST(BatchContentTest, TypeSpecificMarkers) {
    EXPECT_TRUE(BatchCoordinator::isContentValid(OutputType::JestOutput, "FAIL x"));
    EXPECT_FALSE(BatchCoordinator::isContentValid(OutputType::JestOutput, "hello"));
    EXPECT_TRUE(BatchCoordinator::isContentValid(OutputType::Diff, ""));
    EXPECT_TRUE(BatchCoordinator::isContentValid(OutputType::Diff, "@@ -1 +1 @@"));
    EXPECT_FALSE(BatchCoordinator::isContentValid(OutputType::Diff, "random"));
    EXPECT_TRUE(BatchCoordinator::isContentValid(OutputType::AiDebugContext,
                                                 std::string(101, 'x')));
    EXPECT_FALSE(BatchCoordinator::isContentValid(OutputType::AiDebugContext,
                                                  "short"));
    EXPECT_TRUE(BatchCoordinator::isContentValid(OutputType::PrDescription,
                                                 "## Problem\n..."));
}

TEST(BatchContentTest, ExpectedOutputsPerAction) {
    EXPECT_EQ(BatchCoordinator::expectedOutputs(CommandAction::AiDebug).size(), 3u);
    EXPECT_EQ(BatchCoordinator::expectedOutputs(CommandAction::NxTest),
              std::vector<OutputType>{OutputType::JestOutput});
    EXPECT_TRUE(BatchCoordinator::expectedOutputs(CommandAction::Lint).empty());
}

// ============================================================================
// Summary Tests
// ============================================================================

TEST_F(BatchCoordinatorTest, SummaryListsFilesErrorsAndContext) {
    store_->failures[OutputType::Diff] = -1;
    auto result = coordinator_->executeBatch(
        "aiDebug", {{OutputType::JestOutput, kJest}, {OutputType::Diff, kDiff}});

    auto summary = coordinator_->createOperationSummary(
        "aiDebug", result, {{"project", "app"}});
    EXPECT_NE(summary.find("FILE OPERATION SUMMARY - AIDEBUG"), std::string::npos);
    EXPECT_NE(summary.find("jest-output: 0KB (3 lines)"), std::string::npos);
    EXPECT_NE(summary.find("1. Failed to save diff: disk full"),
              std::string::npos);
    EXPECT_NE(summary.find("project: \"app\""), std::string::npos);
    EXPECT_NE(summary.find("Some operations failed"), std::string::npos);
}

TEST_F(BatchCoordinatorTest, PrepareCreatesDirectory) {
    auto paths = coordinator_->prepareCommandOutputs(
        {OutputType::Diff, OutputType::PrDescription});
    EXPECT_TRUE(fs::is_directory(root_ / "context"));
    EXPECT_EQ(paths.at(OutputType::PrDescription).string(),
              (root_ / "context" / "pr-description.txt").string());
}

TEST(BatchCoordinatorConstructionTest, RequiresStore) {
    EXPECT_THROW(BatchCoordinator(nullptr), BatchError);
}
