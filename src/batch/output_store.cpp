/*
 * output_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "output_store.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/exception.hpp"

namespace devflow::batch {

namespace fs = std::filesystem;

namespace {

constexpr std::array<OutputType, 4> kAllTypes{
    OutputType::AiDebugContext, OutputType::JestOutput, OutputType::Diff,
    OutputType::PrDescription};

auto backupTimestamp() -> std::string {
    auto stamp = formatTimestamp(SystemClock::now());
    std::replace(stamp.begin(), stamp.end(), ':', '-');
    std::replace(stamp.begin(), stamp.end(), '.', '-');
    return stamp;
}

}  // namespace

FileSystemOutputStore::FileSystemOutputStore(fs::path directory)
    : directory_(std::move(directory)) {}

auto FileSystemOutputStore::fileName(OutputType type) -> std::string {
    return std::string(outputTypeToString(type)) + ".txt";
}

auto FileSystemOutputStore::pathFor(OutputType type) const -> fs::path {
    return directory_ / fileName(type);
}

void FileSystemOutputStore::ensureDirectory() {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        THROW_BATCH_ERROR(fmt::format("cannot create {}: {}",
                                      directory_.string(), ec.message()));
    }
}

auto FileSystemOutputStore::write(OutputType type, std::string_view content)
    -> fs::path {
    ensureDirectory();

    const auto target = pathFor(type);
    auto staging = target;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            THROW_BATCH_ERROR(
                fmt::format("cannot open {} for writing", staging.string()));
        }
        out.write(content.data(),
                  static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            THROW_BATCH_ERROR(fmt::format("write to {} failed",
                                          staging.string()));
        }
    }

    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        fs::remove(staging, ec);
        THROW_BATCH_ERROR(
            fmt::format("cannot replace {}: {}", target.string(), ec.message()));
    }

    spdlog::debug("OutputStore: wrote {} ({} bytes)", target.string(),
                  content.size());
    return target;
}

auto FileSystemOutputStore::read(OutputType type) const -> std::string {
    const auto path = pathFor(type);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        THROW_BATCH_ERROR(fmt::format("cannot read {}", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        THROW_BATCH_ERROR(fmt::format("read of {} failed", path.string()));
    }
    return buffer.str();
}

auto FileSystemOutputStore::exists(OutputType type) const -> bool {
    std::error_code ec;
    return fs::is_regular_file(pathFor(type), ec);
}

auto FileSystemOutputStore::createBackup(const std::string& label)
    -> fs::path {
    const auto backupDir =
        directory_.parent_path() / "backups" /
        fmt::format("backup-{}-{}", label.empty() ? "manual" : label,
                    backupTimestamp());

    std::error_code ec;
    fs::create_directories(backupDir, ec);
    if (ec) {
        THROW_BATCH_ERROR(fmt::format("cannot create backup directory {}: {}",
                                      backupDir.string(), ec.message()));
    }

    std::size_t copied = 0;
    for (auto type : kAllTypes) {
        if (!exists(type)) {
            continue;
        }
        fs::copy_file(pathFor(type), backupDir / fileName(type),
                      fs::copy_options::overwrite_existing, ec);
        if (ec) {
            spdlog::warn("OutputStore: failed to back up {}: {}",
                         pathFor(type).string(), ec.message());
            continue;
        }
        ++copied;
    }

    nlohmann::json metadata{{"timestamp", formatTimestamp(SystemClock::now())},
                            {"label", label.empty() ? "manual" : label},
                            {"files", copied},
                            {"originalPath", directory_.string()}};
    std::ofstream meta(backupDir / "backup-metadata.json");
    meta << metadata.dump(2);
    if (!meta) {
        THROW_BATCH_ERROR(fmt::format("cannot write backup metadata in {}",
                                      backupDir.string()));
    }

    spdlog::info("OutputStore: backed up {} file(s) to {}", copied,
                 backupDir.string());
    return backupDir;
}

auto FileSystemOutputStore::stats(OutputType type) const -> FileStats {
    FileStats result;
    std::error_code ec;
    const auto path = pathFor(type);
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return result;
    }
    result.sizeBytes = size;

    std::ifstream in(path, std::ios::binary);
    if (in) {
        const auto newlines = std::count(std::istreambuf_iterator<char>(in),
                                         std::istreambuf_iterator<char>(), '\n');
        result.lines = static_cast<std::size_t>(newlines) + 1;
    }
    return result;
}

}  // namespace devflow::batch
