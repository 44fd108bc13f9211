/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "m4brew/config.hpp"
#include "m4brew/history.hpp"
#include "m4brew/job.hpp"
#include "m4brew/process.hpp"
#include "m4brew/reaper.hpp"
#include "m4brew/supervisor.hpp"
#include "m4brew/types.hpp"

namespace m4brew {

enum class StartError : uint8_t {
    None = 0,
    AlreadyRunning,
    MissingRoot,
    IoError
};

struct StartResult {
    bool ok = false;
    JobRecord job;
    StartError error = StartError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

enum class ClearError : uint8_t {
    None = 0,
    Active,
    IoError
};

struct ClearResult {
    bool ok = false;
    ClearError error = ClearError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Owns the single job: starts the task on a background thread, tracks it in
// job.json, cancels it and records finished runs in the history ledger.
// config must outlive the orchestrator.
class Orchestrator final {
public:
    Orchestrator(const Config& config, std::shared_ptr<ProcessControl> control,
                 std::shared_ptr<SubResourceReaper> reaper);
    // PosixProcessControl and a DockerReaper built from config
    explicit Orchestrator(const Config& config);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    [[nodiscard]] StartResult start(JobMode mode, bool dryRun, const JobParameters& parameters);
    [[nodiscard]] JobView status() const noexcept;
    // False when there is nothing to cancel.
    bool requestCancel() noexcept;
    [[nodiscard]] ClearResult clear() noexcept;

    [[nodiscard]] std::vector<HistoryEntry> history(std::size_t limit) const noexcept;
    bool historyClear() noexcept;

    // Contents of the output capture of the current or last run.
    [[nodiscard]] std::string output() const noexcept;

    // Blocks until the background execution of this instance is done.
    // False on timeout.
    bool wait(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());
    [[nodiscard]] bool isAttached() const noexcept { return attached_.load(); }

private:
    void runJob(JobRecord job);
    void finalize(JobRecord& job, const RunOutcome& outcome, long runtimeSeconds) noexcept;
    void finalizeOrphan(JobRecord& job) noexcept;
    void persistProgress(JobRecord& job) noexcept;
    [[nodiscard]] bool persistedCancelRequested() const noexcept;
    [[nodiscard]] bool groupAlive(const JobRecord& job) const noexcept;
    [[nodiscard]] bool writeOutputHeader(const JobRecord& job) const noexcept;
    void appendOutput(const std::string& text) const noexcept;
    [[nodiscard]] SpawnOptions spawnOptions(const JobRecord& job) const;
    void joinWorker() noexcept;

    const Config& config_;
    std::shared_ptr<ProcessControl> control_;
    std::shared_ptr<SubResourceReaper> reaper_;

    JobStore jobs_;
    HistoryLedger history_;
    Supervisor supervisor_;

    // Serializes start/cancel/clear and the background writes to job.json
    mutable std::mutex jobMutex_;

    std::atomic<bool> attached_{false};
    std::atomic<bool> cancelFlag_{false};
    std::thread worker_;
    std::mutex workerMutex_;
    std::condition_variable workerDone_;
};

}
