/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/reaper.hpp"
#include "m4brew/logger.hpp"
#include "m4brew/process.hpp"
#include <algorithm>

namespace m4brew {

DockerReaper::DockerReaper(const Config& config)
    : binary_(config.dockerBinary), label_(config.jobLabel), timeout_(config.reaperTimeout) {
}

void DockerReaper::reap(const JobId& jobId) noexcept {
    if (binary_.empty() || jobId.empty()) {
        return;
    }

    try {
        std::vector<std::string> ids;
        if (!run({binary_, "ps", "-aq", "--filter", "label=" + label_ + "=" + jobId}, ids)) {
            LOG_WARN("Could not list containers for job " + jobId);
            return;
        }
        if (ids.empty()) {
            LOG_DEBUG("No containers labeled with job " + jobId);
            return;
        }

        std::vector<std::string> argv = {binary_, "rm", "-f"};
        argv.insert(argv.end(), ids.begin(), ids.end());
        std::vector<std::string> removed;
        if (run(argv, removed)) {
            LOG_INFO("Removed " + std::to_string(ids.size()) + " container(s) of job " + jobId);
        } else {
            LOG_WARN("Could not remove containers of job " + jobId);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Container cleanup for job " + jobId + " failed: " + e.what());
    }
}

bool DockerReaper::run(const std::vector<std::string>& argv, std::vector<std::string>& lines) const {
    ChildProcess child;
    std::string error;
    if (!child.spawn({argv, {}}, error)) {
        LOG_DEBUG("Could not run " + argv.front() + ": " + error);
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    std::string line;
    for (;;) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LOG_WARN(argv.front() + " " + argv[1] + " timed out");
            return false;  // child destructor kills the group
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto status = child.readLine(line, left);
        if (status == ReadStatus::Eof) {
            break;
        }
        if (status == ReadStatus::Line && !line.empty()) {
            lines.push_back(line);
        }
    }

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    auto code = child.wait(std::max(left, std::chrono::milliseconds(100)));
    return code && *code == 0;
}

}
