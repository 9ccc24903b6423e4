/*
 * batch_coordinator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "batch_coordinator.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <thread>

#include <spdlog/spdlog.h>

#include "core/exception.hpp"

namespace devflow::batch {

namespace {

auto isBlank(std::string_view text) -> bool {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

auto contains(std::string_view text, std::string_view marker) -> bool {
    return text.find(marker) != std::string_view::npos;
}

auto typesToJson(const std::vector<OutputType>& types) -> nlohmann::json {
    auto array = nlohmann::json::array();
    for (auto type : types) {
        array.push_back(std::string(outputTypeToString(type)));
    }
    return array;
}

auto toUpper(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return text;
}

auto formatSize(std::uintmax_t bytes) -> std::string {
    return fmt::format("{}KB", (bytes + 512) / 1024);
}

constexpr std::string_view kRule =
    "=================================================================";

}  // namespace

// ============================================================================
// Result types
// ============================================================================

auto BatchOperationResult::toJson() const -> nlohmann::json {
    nlohmann::json paths = nlohmann::json::object();
    for (const auto& [type, path] : outputPaths) {
        paths[std::string(outputTypeToString(type))] = path.string();
    }
    return {{"batchId", batchId},
            {"success", success},
            {"filesProcessed", filesProcessed},
            {"errors", errors},
            {"duration", duration.count()},
            {"outputPaths", paths}};
}

auto BatchRecord::toJson() const -> nlohmann::json {
    return {{"batchId", batchId},
            {"command", command},
            {"timestamp", formatTimestamp(timestamp)},
            {"files", typesToJson(files)},
            {"success", success}};
}

auto OutputValidation::toJson() const -> nlohmann::json {
    return {{"valid", typesToJson(valid)},
            {"missing", typesToJson(missing)},
            {"corrupt", typesToJson(corrupt)}};
}

// ============================================================================
// BatchCoordinator
// ============================================================================

BatchCoordinator::BatchCoordinator(std::shared_ptr<IOutputStore> store,
                                   std::shared_ptr<events::EventBus> bus,
                                   std::chrono::milliseconds retryDelay)
    : store_(std::move(store)),
      bus_(std::move(bus)),
      retry_delay_(retryDelay),
      notifier_([](NotificationLevel level, const std::string& message) {
          if (level == NotificationLevel::Warning) {
              spdlog::warn("{}", message);
          } else {
              spdlog::info("{}", message);
          }
      }) {
    if (!store_) {
        THROW_BATCH_ERROR("BatchCoordinator requires an output store");
    }
}

auto BatchCoordinator::executeBatch(const std::string& command,
                                    const std::vector<BatchFile>& files,
                                    const BatchOptions& options)
    -> BatchOperationResult {
    const auto started = std::chrono::steady_clock::now();

    BatchOperationResult result;
    result.batchId = makeBatchId(command);
    spdlog::info("BatchCoordinator: [{}] writing {} file(s)", result.batchId,
                 files.size());

    if (options.createBackup) {
        try {
            store_->createBackup(command + "-auto");
        } catch (const std::exception& e) {
            auto message = fmt::format("Backup failed: {}", e.what());
            spdlog::warn("BatchCoordinator: [{}] {}", result.batchId, message);
            result.errors.push_back(message);
            publishError(result.batchId, message);
        }
    }

    const int attempts = std::max(options.maxRetries, 0) + 1;
    std::size_t handled = 0;
    for (const auto& file : files) {
        const auto typeName = std::string(outputTypeToString(file.type));
        ++handled;

        if (options.validateContent && !isContentValid(file.type, file.content)) {
            auto message = fmt::format(
                "Failed to save {}: content failed validation", typeName);
            spdlog::warn("BatchCoordinator: [{}] {}", result.batchId, message);
            result.errors.push_back(message);
            publishError(result.batchId, message);
            publishProgress(result.batchId, handled, files.size(),
                            typeName + " rejected");
            continue;
        }

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            try {
                auto path = store_->write(file.type, file.content);
                result.outputPaths[file.type] = std::move(path);
                ++result.filesProcessed;
                publishProgress(result.batchId, handled, files.size(),
                                typeName + " written");
                break;
            } catch (const std::exception& e) {
                if (attempt < attempts) {
                    spdlog::debug(
                        "BatchCoordinator: [{}] {} attempt {}/{} failed: {}",
                        result.batchId, typeName, attempt, attempts, e.what());
                    std::this_thread::sleep_for(retry_delay_);
                    continue;
                }
                auto message =
                    fmt::format("Failed to save {}: {}", typeName, e.what());
                spdlog::error("BatchCoordinator: [{}] {}", result.batchId,
                              message);
                result.errors.push_back(message);
                publishError(result.batchId, message);
                publishProgress(result.batchId, handled, files.size(),
                                typeName + " failed");
            }
        }
    }

    result.success = result.errors.empty();

    if (options.trackHistory) {
        BatchRecord record;
        record.batchId = result.batchId;
        record.command = command;
        record.timestamp = SystemClock::now();
        record.success = result.success;
        for (const auto& file : files) {
            record.files.push_back(file.type);
        }
        batches_.insert_or_assign(result.batchId, std::move(record));
    }

    if (options.notifyUser) {
        if (result.success) {
            notify(NotificationLevel::Info,
                   fmt::format("{}: Successfully processed {} files", command,
                               result.filesProcessed));
        } else {
            notify(NotificationLevel::Warning,
                   fmt::format("{}: Processed {} files with {} errors", command,
                               result.filesProcessed, result.errors.size()));
        }
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("BatchCoordinator: [{}] {} written, {} error(s) in {}ms",
                 result.batchId, result.filesProcessed, result.errors.size(),
                 result.duration.count());
    return result;
}

auto BatchCoordinator::validateCommandOutputs(
    const std::vector<OutputType>& expectedTypes) const -> OutputValidation {
    OutputValidation validation;
    for (auto type : expectedTypes) {
        if (!store_->exists(type)) {
            validation.missing.push_back(type);
            continue;
        }
        try {
            const auto content = store_->read(type);
            if (isBlank(content) || !isContentValid(type, content)) {
                validation.corrupt.push_back(type);
            } else {
                validation.valid.push_back(type);
            }
        } catch (const std::exception& e) {
            spdlog::warn("BatchCoordinator: cannot read {}: {}",
                         outputTypeToString(type), e.what());
            validation.corrupt.push_back(type);
        }
    }
    return validation;
}

auto BatchCoordinator::cleanupCompletedBatches(std::chrono::milliseconds maxAge)
    -> std::size_t {
    const auto now = SystemClock::now();
    const auto removed = std::erase_if(batches_, [&](const auto& entry) {
        return now - entry.second.timestamp > maxAge;
    });
    if (removed > 0) {
        spdlog::debug("BatchCoordinator: cleaned up {} batch record(s)",
                      removed);
    }
    return removed;
}

auto BatchCoordinator::getBatch(const std::string& batchId) const
    -> std::optional<BatchRecord> {
    auto it = batches_.find(batchId);
    if (it == batches_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto BatchCoordinator::getActiveBatches() const -> std::vector<BatchRecord> {
    std::vector<BatchRecord> records;
    records.reserve(batches_.size());
    for (const auto& [id, record] : batches_) {
        records.push_back(record);
    }
    std::sort(records.begin(), records.end(),
              [](const BatchRecord& a, const BatchRecord& b) {
                  return a.timestamp < b.timestamp;
              });
    return records;
}

auto BatchCoordinator::prepareCommandOutputs(
    const std::vector<OutputType>& types)
    -> std::map<OutputType, std::filesystem::path> {
    store_->ensureDirectory();
    std::map<OutputType, std::filesystem::path> paths;
    for (auto type : types) {
        paths[type] = store_->pathFor(type);
    }
    return paths;
}

auto BatchCoordinator::createOperationSummary(
    const std::string& command, const BatchOperationResult& result,
    const nlohmann::json& additionalContext) const -> std::string {
    std::ostringstream out;
    out << kRule << '\n'
        << "FILE OPERATION SUMMARY - " << toUpper(command) << '\n'
        << kRule << '\n'
        << "Timestamp: " << formatTimestamp(SystemClock::now()) << '\n'
        << "Duration: " << result.duration.count() << "ms\n"
        << "Batch ID: " << result.batchId << '\n'
        << "Success: " << (result.success ? "Yes" : "No") << '\n'
        << "Files Processed: " << result.filesProcessed << '\n'
        << "Errors: " << result.errors.size() << '\n'
        << '\n'
        << kRule << '\n'
        << "FILE DETAILS\n"
        << kRule << '\n';
    for (const auto& [type, path] : result.outputPaths) {
        const auto stats = store_->stats(type);
        out << outputTypeToString(type) << ": " << formatSize(stats.sizeBytes)
            << " (" << stats.lines << " lines)\n";
    }

    if (!result.errors.empty()) {
        out << '\n' << kRule << '\n' << "ERRORS ENCOUNTERED\n" << kRule << '\n';
        for (std::size_t i = 0; i < result.errors.size(); ++i) {
            out << i + 1 << ". " << result.errors[i] << '\n';
        }
    }

    if (additionalContext.is_object() && !additionalContext.empty()) {
        out << '\n' << kRule << '\n' << "ADDITIONAL CONTEXT\n" << kRule << '\n';
        for (const auto& [key, value] : additionalContext.items()) {
            out << key << ": " << value.dump(2) << '\n';
        }
    }

    out << '\n' << kRule << '\n' << "RECOMMENDATIONS\n" << kRule << '\n';
    if (result.success) {
        out << "All files processed successfully\n"
            << "- Files are ready for AI analysis\n"
            << "- Review file content for accuracy\n";
    } else {
        out << "Some operations failed\n"
            << "- Review error messages above\n"
            << "- Check file permissions and disk space\n"
            << "- Consider retrying failed operations\n";
    }
    return out.str();
}

void BatchCoordinator::setNotificationHandler(NotificationHandler handler) {
    if (handler) {
        notifier_ = std::move(handler);
    }
}

auto BatchCoordinator::expectedOutputs(CommandAction action)
    -> std::vector<OutputType> {
    switch (action) {
        case CommandAction::AiDebug:
            return {OutputType::AiDebugContext, OutputType::JestOutput,
                    OutputType::Diff};
        case CommandAction::NxTest:
            return {OutputType::JestOutput};
        case CommandAction::GitDiff:
            return {OutputType::Diff};
        case CommandAction::PrepareToPush:
        case CommandAction::Lint:
        case CommandAction::Format:
        case CommandAction::Custom:
            break;
    }
    return {};
}

auto BatchCoordinator::isContentValid(OutputType type,
                                      std::string_view content) -> bool {
    switch (type) {
        case OutputType::JestOutput:
            return contains(content, "Test") || contains(content, "PASS") ||
                   contains(content, "FAIL") || contains(content, "SKIP");
        case OutputType::Diff:
            return isBlank(content) || contains(content, "diff --git") ||
                   contains(content, "@@") ||
                   contains(content, "No changes detected");
        case OutputType::AiDebugContext:
            return contains(content, "AI DEBUG CONTEXT") || content.size() > 100;
        case OutputType::PrDescription:
            return contains(content, "PR DESCRIPTION") ||
                   contains(content, "Problem") ||
                   contains(content, "Solution");
    }
    return !content.empty();
}

auto BatchCoordinator::makeBatchId(const std::string& command) -> std::string {
    auto id = fmt::format("{}-{}", command, epochMillis(SystemClock::now()));
    if (!batches_.contains(id)) {
        return id;
    }
    for (int suffix = 2;; ++suffix) {
        auto candidate = fmt::format("{}-{}", id, suffix);
        if (!batches_.contains(candidate)) {
            return candidate;
        }
    }
}

void BatchCoordinator::publishProgress(const std::string& batchId,
                                       std::size_t done, std::size_t total,
                                       const std::string& text) {
    if (!bus_ || total == 0) {
        return;
    }
    const auto percent = static_cast<int>(done * 100 / total);
    bus_->publish(events::ExecutionEvent::progressUpdate(batchId, percent));
    bus_->publish(events::ExecutionEvent::status(batchId, text));
}

void BatchCoordinator::publishError(const std::string& batchId,
                                    const std::string& text) {
    if (bus_) {
        bus_->publish(events::ExecutionEvent::error(batchId, text));
    }
}

void BatchCoordinator::notify(NotificationLevel level,
                              const std::string& message) {
    try {
        notifier_(level, message);
    } catch (const std::exception& e) {
        spdlog::error("BatchCoordinator: notification handler threw: {}",
                      e.what());
    }
}

}  // namespace devflow::batch
