/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "m4brew/job.hpp"
#include "m4brew/types.hpp"

namespace m4brew {

// One completed run. Written once, never modified.
struct HistoryEntry {
    std::string timestamp;
    JobId jobId;
    JobStatus status = JobStatus::Finished;
    JobMode mode = JobMode::Convert;
    bool dryRun = true;
    JobParameters parameters;
    std::optional<int> exitCode;
    std::optional<nlohmann::json> summary;
    std::string output;

    [[nodiscard]] nlohmann::json toJson() const;
    // Throws when j is not a history record.
    [[nodiscard]] static HistoryEntry fromJson(const nlohmann::json& j);

    [[nodiscard]] static HistoryEntry fromJob(const JobRecord& job, std::string output);
};

// Capped JSON-lines log of completed runs, oldest first on disk.
class HistoryLedger {
public:
    HistoryLedger(const std::filesystem::path& path, std::size_t maxEntries) noexcept;

    HistoryLedger(const HistoryLedger&) = delete;
    HistoryLedger& operator=(const HistoryLedger&) = delete;

    bool append(const HistoryEntry& entry) noexcept;
    // Oldest first. Malformed lines are skipped.
    [[nodiscard]] std::vector<HistoryEntry> readAll() const noexcept;
    // Newest first, at most limit entries (0 means all).
    [[nodiscard]] std::vector<HistoryEntry> recent(std::size_t limit) const noexcept;
    bool clear() noexcept;

    [[nodiscard]] std::size_t maxEntries() const noexcept { return maxEntries_; }

private:
    [[nodiscard]] std::vector<std::string> readLines() const noexcept;

    std::filesystem::path path_;
    std::size_t maxEntries_;
    mutable std::mutex mutex_;
};

}
