/*
 * output_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file output_store.hpp
 * @brief Storage for generated command output files
 * @date 2025-03-02
 * @version 1.0.0
 */

#ifndef DEVFLOW_BATCH_OUTPUT_STORE_HPP
#define DEVFLOW_BATCH_OUTPUT_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/types.hpp"

namespace devflow::batch {

inline constexpr std::string_view kDefaultOutputDirectory =
    ".github/instructions/ai_utilities_context";

/**
 * @brief Size and line count of a stored file
 */
struct FileStats {
    std::uintmax_t sizeBytes{0};
    std::size_t lines{0};
};

/**
 * @brief One text file per OutputType
 *
 * Failing operations throw BatchError; the batch coordinator catches it per
 * file.
 */
class IOutputStore {
public:
    virtual ~IOutputStore() = default;

    /**
     * @brief Replaces the file for @p type
     * @return Path written
     * @throws BatchError
     */
    virtual auto write(OutputType type, std::string_view content)
        -> std::filesystem::path = 0;

    /**
     * @throws BatchError when the file is missing or unreadable
     */
    [[nodiscard]] virtual auto read(OutputType type) const -> std::string = 0;

    [[nodiscard]] virtual auto exists(OutputType type) const -> bool = 0;
    [[nodiscard]] virtual auto pathFor(OutputType type) const
        -> std::filesystem::path = 0;

    /**
     * @brief Copies every existing output file into a fresh backup directory
     * @return The backup directory
     * @throws BatchError
     */
    virtual auto createBackup(const std::string& label)
        -> std::filesystem::path = 0;

    /**
     * @throws BatchError when the directory cannot be created
     */
    virtual void ensureDirectory() = 0;

    [[nodiscard]] virtual auto stats(OutputType type) const -> FileStats = 0;
};

/**
 * @brief Stores outputs as `<directory>/<type>.txt`
 *
 * Backups go to `<directory>/../backups/backup-<label>-<timestamp>/`
 * together with a `backup-metadata.json` file.
 */
class FileSystemOutputStore : public IOutputStore {
public:
    explicit FileSystemOutputStore(
        std::filesystem::path directory =
            std::filesystem::path(kDefaultOutputDirectory));

    auto write(OutputType type, std::string_view content)
        -> std::filesystem::path override;
    [[nodiscard]] auto read(OutputType type) const -> std::string override;
    [[nodiscard]] auto exists(OutputType type) const -> bool override;
    [[nodiscard]] auto pathFor(OutputType type) const
        -> std::filesystem::path override;
    auto createBackup(const std::string& label)
        -> std::filesystem::path override;
    void ensureDirectory() override;
    [[nodiscard]] auto stats(OutputType type) const -> FileStats override;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& {
        return directory_;
    }

    /**
     * @brief File name used for an output type
     */
    [[nodiscard]] static auto fileName(OutputType type) -> std::string;

private:
    std::filesystem::path directory_;
};

}  // namespace devflow::batch

#endif  // DEVFLOW_BATCH_OUTPUT_STORE_HPP
