/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/supervisor.hpp"
#include "m4brew/logger.hpp"
#include <algorithm>
#include <csignal>
#include <thread>

namespace m4brew {

Supervisor::Supervisor(const Config& config, ProcessControl& control, SubResourceReaper& reaper) noexcept
    : config_(config), control_(control), reaper_(reaper) {
}

RunOutcome Supervisor::run(const JobId& jobId, const SpawnOptions& options, ProgressParser& parser,
                           std::ostream& capture, const RunCallbacks& callbacks) {
    RunOutcome outcome;
    ChildProcess child;

    std::string error;
    if (!child.spawn(options, error)) {
        LOG_ERROR("Failed to start task for job " + jobId + ": " + error);
        outcome.error = error;
        return outcome;
    }
    outcome.spawned = true;

    const int pgid = child.pid();
    LOG_INFO("Task for job " + jobId + " running as process group " + std::to_string(pgid));
    if (callbacks.onSpawn) {
        callbacks.onSpawn(pgid);
    }

    // The leader may be gone while descendants still hold the group
    auto alive = [this, &child, pgid] { return !child.tryReap() || control_.isGroupAlive(pgid); };

    std::optional<std::chrono::steady_clock::time_point> drainDeadline;
    std::string line;
    for (;;) {
        if (!outcome.canceled && callbacks.cancelRequested && callbacks.cancelRequested()) {
            LOG_INFO("Cancellation observed for job " + jobId);
            outcome.canceled = true;
            terminate(jobId, pgid, alive);
            drainDeadline = std::chrono::steady_clock::now() + config_.exitWait;
        }
        if (drainDeadline && std::chrono::steady_clock::now() >= *drainDeadline) {
            LOG_WARN("Output of job " + jobId + " still open after termination, not draining further");
            break;
        }

        auto status = child.readLine(line, config_.pollInterval);
        if (status == ReadStatus::Eof) {
            break;
        }
        if (status == ReadStatus::Timeout) {
            continue;
        }

        capture << line << '\n';
        capture.flush();
        outcome.output += line;
        outcome.output += '\n';

        LineKind kind = parser.feed(line);
        if (callbacks.onProgress) {
            callbacks.onProgress(parser, kind);
        }
    }

    auto code = child.wait(config_.exitWait);
    if (!code) {
        LOG_WARN("Task of job " + jobId + " did not exit in time, killing process group");
        control_.signalGroup(pgid, SIGKILL);
        code = child.wait(config_.exitWait);
    }
    if (!code) {
        LOG_ERROR("Task of job " + jobId + " could not be reaped");
    }
    outcome.exitCode = code;

    if (!outcome.canceled && callbacks.cancelRequested && callbacks.cancelRequested()) {
        LOG_INFO("Cancellation for job " + jobId + " arrived as the task exited");
        outcome.canceled = true;
    }
    if (outcome.canceled && control_.isGroupAlive(pgid)) {
        control_.signalGroup(pgid, SIGKILL);
    }

    outcome.summary = extractSummary(outcome.output, parser.config().summaryMarker);
    return outcome;
}

void Supervisor::terminate(const JobId& jobId, int pgid, const std::function<bool()>& alive) noexcept {
    LOG_INFO("Terminating job " + jobId + " (process group " + std::to_string(pgid) + ")");

    reaper_.reap(jobId);

    if (pgid <= 0 || !alive()) {
        LOG_DEBUG("Process group of job " + jobId + " already gone");
        return;
    }

    if (!control_.signalGroup(pgid, SIGINT)) {
        LOG_DEBUG("SIGINT to process group " + std::to_string(pgid) + " failed");
    }
    if (waitUntilGone(alive, config_.interruptGrace)) {
        LOG_DEBUG("Job " + jobId + " stopped after SIGINT");
        return;
    }

    LOG_WARN("Job " + jobId + " ignored SIGINT, sending SIGTERM");
    if (!control_.signalGroup(pgid, SIGTERM)) {
        LOG_DEBUG("SIGTERM to process group " + std::to_string(pgid) + " failed");
    }
    if (waitUntilGone(alive, config_.terminateGrace)) {
        LOG_DEBUG("Job " + jobId + " stopped after SIGTERM");
        return;
    }

    LOG_WARN("Job " + jobId + " ignored SIGTERM, sending SIGKILL");
    if (!control_.signalGroup(pgid, SIGKILL)) {
        LOG_DEBUG("SIGKILL to process group " + std::to_string(pgid) + " failed");
    }
}

bool Supervisor::waitUntilGone(const std::function<bool()>& alive,
                               std::chrono::milliseconds grace) const noexcept {
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (alive()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto step = std::min<std::chrono::steady_clock::duration>(std::chrono::milliseconds(50), deadline - now);
        std::this_thread::sleep_for(step);
    }
    return true;
}

}
