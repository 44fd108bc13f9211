/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/job.hpp"
#include "m4brew/logger.hpp"
#include "json_fields.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace m4brew {

namespace {
constexpr const char* kTimestampFormat = "%Y-%m-%dT%H:%M:%S";
}

nlohmann::json JobParameters::toJson() const {
    return {
        {"root_folder", rootFolder},
        {"audio_mode", audioMode},
        {"bitrate", bitrate},
    };
}

JobParameters JobParameters::fromJson(const nlohmann::json& j) noexcept {
    JobParameters p;
    p.rootFolder = field<std::string>(j, "root_folder", p.rootFolder);
    p.audioMode = field<std::string>(j, "audio_mode", p.audioMode);
    p.bitrate = field<int>(j, "bitrate", p.bitrate);
    return p;
}

nlohmann::json JobRecord::toJson() const {
    nlohmann::json j = {
        {"id", id},
        {"status", toString(status)},
        {"cancel_requested", cancelRequested},
        {"started", started},
        {"updated", updated},
        {"mode", toString(mode)},
        {"dry_run", dryRun},
        {"settings", parameters.toJson()},
        {"current", current},
        {"total", total},
        {"current_book", currentLabel},
        {"current_path", currentPath},
        {"pid", nullptr},
        {"exit_code", nullptr},
        {"runtime_s", nullptr},
        {"summary", nullptr},
    };
    if (pid) j["pid"] = *pid;
    if (exitCode) j["exit_code"] = *exitCode;
    if (runtimeSeconds) j["runtime_s"] = *runtimeSeconds;
    if (summary) j["summary"] = *summary;
    return j;
}

JobRecord JobRecord::fromJson(const nlohmann::json& j) noexcept {
    JobRecord job;
    job.id = field<std::string>(j, "id", "");
    job.status = parseStatus(field<std::string>(j, "status", "")).value_or(JobStatus::None);
    job.cancelRequested = field<bool>(j, "cancel_requested", false);
    job.started = field<std::string>(j, "started", "");
    job.updated = field<std::string>(j, "updated", "");
    job.mode = parseMode(field<std::string>(j, "mode", "")).value_or(JobMode::Convert);
    job.dryRun = field<bool>(j, "dry_run", true);
    if (j.is_object() && j.contains("settings")) {
        job.parameters = JobParameters::fromJson(j["settings"]);
    }
    job.current = field<long>(j, "current", 0);
    job.total = field<long>(j, "total", 0);
    job.currentLabel = field<std::string>(j, "current_book", "");
    job.currentPath = field<std::string>(j, "current_path", "");
    job.pid = optionalField<int>(j, "pid");
    job.exitCode = optionalField<int>(j, "exit_code");
    job.runtimeSeconds = optionalField<long>(j, "runtime_s");
    if (j.is_object() && j.contains("summary") && !j["summary"].is_null()) {
        job.summary = j["summary"];
    }
    return job;
}

nlohmann::json JobView::toJson() const {
    if (!job) {
        return {{"status", "none"}};
    }
    nlohmann::json j = job->toJson();
    j["elapsed_s"] = elapsedSeconds ? nlohmann::json(*elapsedSeconds) : nlohmann::json(nullptr);
    j["stale"] = stale;
    return j;
}

JobStore::JobStore(const std::filesystem::path& path) noexcept
    : store_(path, "updated") {
}

std::optional<JobRecord> JobStore::load() const noexcept {
    auto document = store_.load();
    if (!document || !document->is_object()) {
        return std::nullopt;
    }
    JobRecord job = JobRecord::fromJson(*document);
    if (job.id.empty() || job.status == JobStatus::None) {
        LOG_WARN("Ignoring job document without id or status: " + store_.path().string());
        return std::nullopt;
    }
    return job;
}

SaveResult JobStore::save(JobRecord& job) noexcept {
    try {
        job.updated = nowTimestamp();
        return store_.save(job.toJson());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to serialize job " + job.id + ": " + e.what());
        return SaveResult::Failed;
    }
}

SaveResult JobStore::saveForced(JobRecord& job) noexcept {
    try {
        job.updated = nowTimestamp();
        return store_.saveForced(job.toJson());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to serialize job " + job.id + ": " + e.what());
        return SaveResult::Failed;
    }
}

bool JobStore::remove() noexcept {
    return store_.remove();
}

std::string nowTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, kTimestampFormat);
    return ss.str();
}

std::optional<long> secondsSince(const std::string& timestamp) noexcept {
    try {
        if (timestamp.empty()) {
            return std::nullopt;
        }
        std::tm parsed{};
        std::istringstream in(timestamp);
        in >> std::get_time(&parsed, kTimestampFormat);
        if (in.fail()) {
            return std::nullopt;
        }
        parsed.tm_isdst = -1;
        std::time_t then = std::mktime(&parsed);
        if (then == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        long elapsed = static_cast<long>(std::difftime(now, then));
        return elapsed < 0 ? 0 : elapsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

JobId generateJobId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

}
