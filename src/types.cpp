/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/types.hpp"

namespace m4brew {

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Running:   return "running";
        case JobStatus::Canceling: return "canceling";
        case JobStatus::Canceled:  return "canceled";
        case JobStatus::Finished:  return "finished";
        case JobStatus::Failed:    return "failed";
        default: return "none";
    }
}

const char* toString(JobMode mode) noexcept {
    switch (mode) {
        case JobMode::Correct: return "correct";
        case JobMode::Cleanup: return "cleanup";
        default: return "convert";
    }
}

std::optional<JobStatus> parseStatus(const std::string& value) noexcept {
    if (value == "running") return JobStatus::Running;
    if (value == "canceling") return JobStatus::Canceling;
    if (value == "canceled") return JobStatus::Canceled;
    if (value == "finished") return JobStatus::Finished;
    if (value == "failed") return JobStatus::Failed;
    if (value == "none") return JobStatus::None;
    return std::nullopt;
}

std::optional<JobMode> parseMode(const std::string& value) noexcept {
    if (value == "convert") return JobMode::Convert;
    if (value == "correct") return JobMode::Correct;
    if (value == "cleanup") return JobMode::Cleanup;
    return std::nullopt;
}

}
