/*
 * batch_coordinator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file batch_coordinator.hpp
 * @brief Writes the output files of one command as a single batch
 * @date 2025-03-02
 * @version 1.0.0
 *
 * Each file is retried independently; a file that keeps failing is recorded
 * as an error and the batch moves on, so one bad file never prevents the
 * others from being written.
 */

#ifndef DEVFLOW_BATCH_BATCH_COORDINATOR_HPP
#define DEVFLOW_BATCH_BATCH_COORDINATOR_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/types.hpp"
#include "events/event_bus.hpp"
#include "output_store.hpp"

namespace devflow::batch {

inline constexpr std::chrono::milliseconds kDefaultRetryDelay{100};
inline constexpr std::chrono::milliseconds kDefaultBatchMaxAge{
    std::chrono::hours(1)};

/**
 * @brief One file to write
 */
struct BatchFile {
    OutputType type{OutputType::Diff};
    std::string content;
};

/**
 * @brief Per-batch behaviour
 */
struct BatchOptions {
    bool createBackup{false};     ///< Best-effort backup before writing
    bool validateContent{false};  ///< Reject content failing the type rules
    bool notifyUser{false};       ///< Report the outcome to the notifier
    bool trackHistory{false};     ///< Keep a BatchRecord for this batch
    int maxRetries{0};            ///< Extra attempts per file
};

/**
 * @brief Aggregate outcome of executeBatch()
 */
struct BatchOperationResult {
    std::string batchId;
    bool success{false};              ///< No errors at all
    std::size_t filesProcessed{0};    ///< Files actually written
    std::vector<std::string> errors;  ///< Every failure, including backup
    std::chrono::milliseconds duration{0};
    std::map<OutputType, std::filesystem::path> outputPaths;  ///< Written only

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief History entry kept when trackHistory is set
 */
struct BatchRecord {
    std::string batchId;
    std::string command;
    TimePoint timestamp{SystemClock::now()};
    std::vector<OutputType> files;
    bool success{false};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Classification of expected output files
 */
struct OutputValidation {
    std::vector<OutputType> valid;
    std::vector<OutputType> missing;
    std::vector<OutputType> corrupt;

    [[nodiscard]] auto allValid() const noexcept -> bool {
        return missing.empty() && corrupt.empty();
    }
    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

enum class NotificationLevel { Info, Warning };

using NotificationHandler =
    std::function<void(NotificationLevel, const std::string&)>;

class BatchCoordinator {
public:
    /**
     * @param store File primitive
     * @param bus Receives per-file progress and error events; optional
     * @param retryDelay Fixed wait between attempts of one file
     */
    explicit BatchCoordinator(
        std::shared_ptr<IOutputStore> store,
        std::shared_ptr<events::EventBus> bus = nullptr,
        std::chrono::milliseconds retryDelay = kDefaultRetryDelay);

    /**
     * @brief Writes every file, retrying each up to maxRetries extra times.
     *
     * Blocks the calling thread for the retry delays.
     */
    auto executeBatch(const std::string& command,
                      const std::vector<BatchFile>& files,
                      const BatchOptions& options = {})
        -> BatchOperationResult;

    /**
     * @brief Sorts expected outputs into valid, missing and corrupt
     */
    [[nodiscard]] auto validateCommandOutputs(
        const std::vector<OutputType>& expectedTypes) const
        -> OutputValidation;

    /**
     * @brief Drops batch records older than @p maxAge
     * @return Number of records removed
     */
    auto cleanupCompletedBatches(
        std::chrono::milliseconds maxAge = kDefaultBatchMaxAge) -> std::size_t;

    [[nodiscard]] auto getBatch(const std::string& batchId) const
        -> std::optional<BatchRecord>;
    [[nodiscard]] auto getActiveBatches() const -> std::vector<BatchRecord>;

    /**
     * @brief Creates the output directory and returns the target paths
     * @throws BatchError when the directory cannot be created
     */
    auto prepareCommandOutputs(const std::vector<OutputType>& types)
        -> std::map<OutputType, std::filesystem::path>;

    /**
     * @brief Plain-text report of a batch result
     */
    [[nodiscard]] auto createOperationSummary(
        const std::string& command, const BatchOperationResult& result,
        const nlohmann::json& additionalContext = nlohmann::json::object())
        const -> std::string;

    void setNotificationHandler(NotificationHandler handler);
    void setRetryDelay(std::chrono::milliseconds delay) { retry_delay_ = delay; }

    [[nodiscard]] auto store() const -> const std::shared_ptr<IOutputStore>& {
        return store_;
    }

    /**
     * @brief Files a workflow action is expected to produce
     */
    [[nodiscard]] static auto expectedOutputs(CommandAction action)
        -> std::vector<OutputType>;

    /**
     * @brief Type-specific content markers
     */
    [[nodiscard]] static auto isContentValid(OutputType type,
                                             std::string_view content) -> bool;

private:
    auto makeBatchId(const std::string& command) -> std::string;
    void publishProgress(const std::string& batchId, std::size_t done,
                         std::size_t total, const std::string& text);
    void publishError(const std::string& batchId, const std::string& text);
    void notify(NotificationLevel level, const std::string& message);

    std::shared_ptr<IOutputStore> store_;
    std::shared_ptr<events::EventBus> bus_;
    std::chrono::milliseconds retry_delay_;
    NotificationHandler notifier_;
    std::unordered_map<std::string, BatchRecord> batches_;
};

}  // namespace devflow::batch

#endif  // DEVFLOW_BATCH_BATCH_COORDINATOR_HPP
