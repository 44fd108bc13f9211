/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "m4brew/store.hpp"
#include "m4brew/types.hpp"

namespace m4brew {

// Mode parameters handed to the task. The orchestrator only checks that a
// root folder is present.
struct JobParameters {
    std::string rootFolder;
    std::string audioMode = "match";
    int bitrate = 64;

    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] static JobParameters fromJson(const nlohmann::json& j) noexcept;
};

struct JobRecord {
    JobId id;
    JobStatus status = JobStatus::None;
    bool cancelRequested = false;
    std::string started;
    std::string updated;
    JobMode mode = JobMode::Convert;
    bool dryRun = true;
    JobParameters parameters;

    long current = 0;
    long total = 0;
    std::string currentLabel;
    std::string currentPath;

    // Process group of the attached task, only while one is attached
    std::optional<int> pid;
    std::optional<int> exitCode;
    std::optional<long> runtimeSeconds;
    std::optional<nlohmann::json> summary;

    [[nodiscard]] nlohmann::json toJson() const;
    // Missing or mistyped fields fall back to their defaults.
    [[nodiscard]] static JobRecord fromJson(const nlohmann::json& j) noexcept;
};

// What observers get back from a status read. The derived fields are
// computed on the read path and never persisted.
struct JobView {
    std::optional<JobRecord> job;
    std::optional<long> elapsedSeconds;
    bool stale = false;

    [[nodiscard]] JobStatus status() const noexcept { return job ? job->status : JobStatus::None; }
    [[nodiscard]] nlohmann::json toJson() const;
};

// Typed access to job.json. The "updated" stamp does not count as a change.
class JobStore {
public:
    explicit JobStore(const std::filesystem::path& path) noexcept;

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    [[nodiscard]] std::optional<JobRecord> load() const noexcept;
    // Stamps job.updated before writing.
    [[nodiscard]] SaveResult save(JobRecord& job) noexcept;
    [[nodiscard]] SaveResult saveForced(JobRecord& job) noexcept;
    bool remove() noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return store_.path(); }

private:
    DocumentStore store_;
};

// Local time as "YYYY-MM-DDTHH:MM:SS".
[[nodiscard]] std::string nowTimestamp();
// Seconds since a timestamp produced by nowTimestamp, if it parses.
[[nodiscard]] std::optional<long> secondsSince(const std::string& timestamp) noexcept;
[[nodiscard]] JobId generateJobId();

}
