/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/orchestrator.hpp"
#include "m4brew/logger.hpp"
#include "m4brew/parser.hpp"
#include "m4brew/scanner.hpp"
#include <fstream>
#include <sstream>
#include <system_error>

namespace m4brew {

namespace {
std::shared_ptr<ProcessControl> orDefault(std::shared_ptr<ProcessControl> control) {
    return control ? std::move(control) : std::make_shared<PosixProcessControl>();
}

std::shared_ptr<SubResourceReaper> orDefault(std::shared_ptr<SubResourceReaper> reaper) {
    return reaper ? std::move(reaper) : std::make_shared<NullReaper>();
}

nlohmann::json canceledSummary(const std::optional<nlohmann::json>& parsed) {
    nlohmann::json summary = (parsed && parsed->is_object()) ? *parsed : nlohmann::json::object();
    summary["success"] = false;
    summary["reason"] = "canceled";
    return summary;
}
}

Orchestrator::Orchestrator(const Config& config, std::shared_ptr<ProcessControl> control,
                           std::shared_ptr<SubResourceReaper> reaper)
    : config_(config),
      control_(orDefault(std::move(control))),
      reaper_(orDefault(std::move(reaper))),
      jobs_(config.jobFile()),
      history_(config.historyFile(), config.historyMax),
      supervisor_(config, *control_, *reaper_) {
    LOG_DEBUG("Orchestrator created - data: " + config_.dataDir.string() +
              ", history max: " + std::to_string(history_.maxEntries()));
}

Orchestrator::Orchestrator(const Config& config)
    : Orchestrator(config, std::make_shared<PosixProcessControl>(), std::make_shared<DockerReaper>(config)) {
}

Orchestrator::~Orchestrator() {
    if (attached_.load()) {
        LOG_WARN("Orchestrator going away with a job attached, canceling it");
        cancelFlag_.store(true);
    }
    joinWorker();
}

StartResult Orchestrator::start(JobMode mode, bool dryRun, const JobParameters& parameters) {
    StartResult result;
    std::lock_guard<std::mutex> lock(jobMutex_);

    // Latest persisted state decides, another controller may own the job
    auto existing = jobs_.load();
    if (attached_.load() || (existing && isActive(existing->status) && groupAlive(*existing))) {
        result.job = existing.value_or(JobRecord{});
        result.error = StartError::AlreadyRunning;
        result.message = "A job is already running: " + result.job.id;
        LOG_WARN("Start rejected, job " + result.job.id + " is " + toString(result.job.status));
        return result;
    }

    if (parameters.rootFolder.empty()) {
        result.error = StartError::MissingRoot;
        result.message = "Root folder is not set";
        LOG_WARN("Start rejected, no root folder");
        return result;
    }

    if (existing && isActive(existing->status)) {
        LOG_WARN("Replacing stale job " + existing->id + " whose process group is gone");
    }

    // Previous execution has finished, collect its thread
    joinWorker();

    JobRecord job;
    job.id = generateJobId();
    job.status = JobStatus::Running;
    job.started = nowTimestamp();
    job.mode = mode;
    job.dryRun = dryRun;
    job.parameters = parameters;
    job.total = Scanner(parameters.rootFolder).estimate(mode);

    if (jobs_.saveForced(job) == SaveResult::Failed) {
        result.error = StartError::IoError;
        result.message = "Could not write " + jobs_.path().string();
        return result;
    }

    LOG_INFO("Starting job " + job.id + " mode=" + toString(mode) + " dry_run=" + (dryRun ? "true" : "false") +
             " root=" + parameters.rootFolder + " total=" + std::to_string(job.total));

    try {
        std::lock_guard<std::mutex> workerLock(workerMutex_);
        cancelFlag_.store(false);
        attached_.store(true);
        worker_ = std::thread(&Orchestrator::runJob, this, job);
    } catch (const std::system_error& e) {
        attached_.store(false);
        LOG_ERROR("Failed to start job thread: " + std::string(e.what()));
        job.status = JobStatus::Failed;
        (void)jobs_.saveForced(job);
        result.job = job;
        result.error = StartError::IoError;
        result.message = e.what();
        return result;
    }

    result.ok = true;
    result.job = std::move(job);
    return result;
}

void Orchestrator::runJob(JobRecord job) {
    setThreadName("Job");
    auto startTime = std::chrono::steady_clock::now();

    RunOutcome outcome;
    std::string diagnostic;
    try {
        if (!writeOutputHeader(job)) {
            LOG_WARN("Output capture unavailable for job " + job.id);
        }
        std::ofstream capture(config_.outputFile(), std::ios::app);
        ProgressParser parser;

        auto lastCheck = std::chrono::steady_clock::now();
        RunCallbacks callbacks;
        callbacks.onSpawn = [this, &job](int pgid) {
            job.pid = pgid;
            persistProgress(job);
        };
        callbacks.onProgress = [this, &job](const ProgressParser& p, LineKind kind) {
            if (kind == LineKind::Other) {
                return;
            }
            job.current = p.current();
            job.currentLabel = p.currentLabel();
            job.currentPath = p.currentPath();
            persistProgress(job);
        };
        callbacks.cancelRequested = [this, &lastCheck] {
            if (cancelFlag_.load()) {
                return true;
            }
            // Another controller may have written the flag
            auto now = std::chrono::steady_clock::now();
            if (now - lastCheck >= config_.cancelCheckInterval) {
                lastCheck = now;
                if (persistedCancelRequested()) {
                    cancelFlag_.store(true);
                    return true;
                }
            }
            return false;
        };

        outcome = supervisor_.run(job.id, spawnOptions(job), parser, capture, callbacks);
        if (!outcome.spawned) {
            diagnostic = "ERROR: could not start task: " + outcome.error;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Job " + job.id + " execution error: " + std::string(e.what()));
        outcome.exitCode.reset();
        outcome.summary.reset();
        diagnostic = "ERROR: " + std::string(e.what());
    }

    if (!diagnostic.empty()) {
        appendOutput(diagnostic + "\n");
    }

    auto runtime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime);
    finalize(job, outcome, static_cast<long>(runtime.count()));

    {
        std::lock_guard<std::mutex> lock(workerMutex_);
        attached_.store(false);
    }
    workerDone_.notify_all();
}

void Orchestrator::finalize(JobRecord& job, const RunOutcome& outcome, long runtimeSeconds) noexcept {
    try {
        std::lock_guard<std::mutex> lock(jobMutex_);

        // Another controller may already have finalized this job as an orphan
        auto persisted = jobs_.load();
        if (persisted && persisted->id == job.id && isTerminal(persisted->status)) {
            job = std::move(*persisted);
            LOG_INFO("Job " + job.id + " already finalized as " + toString(job.status) + " elsewhere");
            return;
        }

        if (outcome.canceled || cancelFlag_.load() || (persisted && persisted->cancelRequested)) {
            job.cancelRequested = true;
            job.status = JobStatus::Canceled;
            job.exitCode = kCanceledExitCode;
            job.summary = canceledSummary(outcome.summary);
        } else {
            job.exitCode = outcome.exitCode;
            job.status = (outcome.exitCode && *outcome.exitCode == 0) ? JobStatus::Finished : JobStatus::Failed;
            job.summary = outcome.summary;
            if (job.total > 0) {
                job.current = job.total;
            }
        }

        job.runtimeSeconds = runtimeSeconds;
        if (job.summary && job.summary->is_object()) {
            (*job.summary)["runtime_s"] = runtimeSeconds;
        }
        job.pid.reset();

        if (jobs_.saveForced(job) == SaveResult::Failed) {
            LOG_ERROR("Could not persist final state of job " + job.id);
        }
        if (!history_.append(HistoryEntry::fromJob(job, output()))) {
            LOG_ERROR("Could not record job " + job.id + " in history");
        }

        std::string code = job.exitCode ? std::to_string(*job.exitCode) : "none";
        LOG_INFO("Job " + job.id + " " + toString(job.status) + " (exit " + code + ", " +
                 std::to_string(runtimeSeconds) + "s)");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finalize job " + job.id + ": " + e.what());
    }
}

void Orchestrator::finalizeOrphan(JobRecord& job) noexcept {
    try {
        job.cancelRequested = true;
        job.status = JobStatus::Canceled;
        job.exitCode = kCanceledExitCode;
        job.summary = canceledSummary(job.summary);
        job.runtimeSeconds = secondsSince(job.started);
        if (job.runtimeSeconds) {
            (*job.summary)["runtime_s"] = *job.runtimeSeconds;
        }
        job.pid.reset();

        if (jobs_.saveForced(job) == SaveResult::Failed) {
            LOG_ERROR("Could not persist canceled orphan job " + job.id);
        }
        if (!history_.append(HistoryEntry::fromJob(job, output()))) {
            LOG_ERROR("Could not record job " + job.id + " in history");
        }
        LOG_INFO("Orphaned job " + job.id + " marked canceled");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finalize orphaned job " + job.id + ": " + e.what());
    }
}

void Orchestrator::persistProgress(JobRecord& job) noexcept {
    try {
        std::lock_guard<std::mutex> lock(jobMutex_);
        // Never overwrite a cancel written since our last look
        auto persisted = jobs_.load();
        if (persisted && persisted->id == job.id && isTerminal(persisted->status)) {
            return;
        }
        if (persisted && persisted->id == job.id && persisted->cancelRequested) {
            job.cancelRequested = true;
            job.status = JobStatus::Canceling;
        }
        if (jobs_.save(job) == SaveResult::Failed) {
            LOG_WARN("Could not persist progress of job " + job.id);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Progress update for job " + job.id + " failed: " + e.what());
    }
}

bool Orchestrator::persistedCancelRequested() const noexcept {
    auto persisted = jobs_.load();
    return persisted && persisted->cancelRequested;
}

bool Orchestrator::groupAlive(const JobRecord& job) const noexcept {
    return job.pid && *job.pid > 0 && control_->isGroupAlive(*job.pid);
}

JobView Orchestrator::status() const noexcept {
    JobView view;
    try {
        auto job = jobs_.load();
        if (!job) {
            return view;
        }

        if (isActive(job->status) && !attached_.load() && !groupAlive(*job)) {
            // Nobody supervises it anymore; report what it must have become
            view.stale = true;
            if (job->status == JobStatus::Canceling) {
                job->status = JobStatus::Canceled;
            } else {
                job->status = (job->exitCode && *job->exitCode == 0) ? JobStatus::Finished : JobStatus::Failed;
            }
            job->pid.reset();
            LOG_DEBUG("Job " + job->id + " has no live process group, reporting " + toString(job->status));
        }

        if (isActive(job->status)) {
            view.elapsedSeconds = secondsSince(job->started);
        }
        view.job = std::move(job);
    } catch (const std::exception& e) {
        LOG_ERROR("Status read failed: " + std::string(e.what()));
        view = JobView{};
    }
    return view;
}

bool Orchestrator::requestCancel() noexcept {
    try {
        JobRecord job;
        bool owned = false;
        {
            std::lock_guard<std::mutex> lock(jobMutex_);
            auto current = jobs_.load();
            if (!current || !isActive(current->status)) {
                LOG_INFO("Cancel ignored, no active job");
                return false;
            }
            job = *current;
            job.cancelRequested = true;
            job.status = JobStatus::Canceling;
            if (jobs_.saveForced(job) == SaveResult::Failed) {
                LOG_ERROR("Could not persist cancel request for job " + job.id);
            }
            owned = attached_.load();
            if (owned) {
                cancelFlag_.store(true);
            }
        }

        LOG_INFO("Cancel requested for job " + job.id);
        const int pgid = job.pid.value_or(0);
        const bool wasAlive = groupAlive(job);
        supervisor_.terminate(job.id, pgid, [this, pgid] { return control_->isGroupAlive(pgid); });

        if (!owned && !wasAlive) {
            std::lock_guard<std::mutex> lock(jobMutex_);
            auto latest = jobs_.load();
            if (latest && latest->id == job.id && isActive(latest->status)) {
                finalizeOrphan(*latest);
            }
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Cancel failed: " + std::string(e.what()));
        return false;
    }
}

ClearResult Orchestrator::clear() noexcept {
    ClearResult result;
    try {
        std::lock_guard<std::mutex> lock(jobMutex_);
        auto job = jobs_.load();
        if (attached_.load() || (job && isActive(job->status) && groupAlive(*job))) {
            result.error = ClearError::Active;
            result.message = "Job is still running, cancel it first";
            LOG_WARN("Clear rejected, job " + (job ? job->id : std::string("?")) + " is active");
            return result;
        }

        if (!jobs_.remove()) {
            result.error = ClearError::IoError;
            result.message = "Could not remove " + jobs_.path().string();
            return result;
        }
        std::error_code ec;
        std::filesystem::remove(config_.outputFile(), ec);
        if (ec) {
            LOG_WARN("Could not remove output capture: " + ec.message());
        }

        LOG_INFO("Job record cleared");
        result.ok = true;
    } catch (const std::exception& e) {
        result.error = ClearError::IoError;
        result.message = e.what();
        LOG_ERROR("Clear failed: " + result.message);
    }
    return result;
}

std::vector<HistoryEntry> Orchestrator::history(std::size_t limit) const noexcept {
    return history_.recent(limit);
}

bool Orchestrator::historyClear() noexcept {
    LOG_INFO("Clearing history");
    return history_.clear();
}

std::string Orchestrator::output() const noexcept {
    try {
        std::ifstream file(config_.outputFile(), std::ios::binary);
        if (!file) {
            return "";
        }
        std::ostringstream content;
        content << file.rdbuf();
        return content.str();
    } catch (const std::exception& e) {
        LOG_WARN("Could not read output capture: " + std::string(e.what()));
        return "";
    }
}

bool Orchestrator::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(workerMutex_);
    auto done = [this] { return !attached_.load(); };
    if (timeout > std::chrono::milliseconds::zero()) {
        if (!workerDone_.wait_for(lock, timeout, done)) {
            return false;
        }
    } else {
        workerDone_.wait(lock, done);
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    return true;
}

void Orchestrator::joinWorker() noexcept {
    try {
        (void)wait();
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to join job thread: " + std::string(e.what()));
    }
}

bool Orchestrator::writeOutputHeader(const JobRecord& job) const noexcept {
    try {
        auto path = config_.outputFile();
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            return false;
        }
        file << "[" << nowTimestamp() << "] Running MODE=" << toString(job.mode)
             << " DRY_RUN=" << (job.dryRun ? "true" : "false") << "\n"
             << "ROOT_FOLDER=" << job.parameters.rootFolder << "\n"
             << "AUDIO_MODE=" << job.parameters.audioMode << "\n"
             << "BITRATE=" << job.parameters.bitrate << "\n\n";
        return static_cast<bool>(file);
    } catch (const std::exception& e) {
        LOG_WARN("Could not write output header: " + std::string(e.what()));
        return false;
    }
}

void Orchestrator::appendOutput(const std::string& text) const noexcept {
    try {
        std::ofstream file(config_.outputFile(), std::ios::app);
        file << text;
    } catch (const std::exception& e) {
        LOG_WARN("Could not append to output capture: " + std::string(e.what()));
    }
}

SpawnOptions Orchestrator::spawnOptions(const JobRecord& job) const {
    SpawnOptions options;
    options.argv = config_.taskCommand;
    options.env = {
        {"MODE", toString(job.mode)},
        {"DRY_RUN", job.dryRun ? "true" : "false"},
        {"ROOT_FOLDER", job.parameters.rootFolder},
        {"AUDIO_MODE", job.parameters.audioMode},
        {"BITRATE", std::to_string(job.parameters.bitrate)},
        {"M4BREW_JOB_ID", job.id},
    };
    return options;
}

}
