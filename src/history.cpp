/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/history.hpp"
#include "m4brew/logger.hpp"
#include "m4brew/store.hpp"
#include "json_fields.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace m4brew {

nlohmann::json HistoryEntry::toJson() const {
    nlohmann::json j = {
        {"timestamp", timestamp},
        {"job_id", jobId},
        {"status", toString(status)},
        {"mode", toString(mode)},
        {"dry_run", dryRun},
        {"settings", parameters.toJson()},
        {"exit_code", nullptr},
        {"summary", nullptr},
        {"output", output},
    };
    if (exitCode) j["exit_code"] = *exitCode;
    if (summary) j["summary"] = *summary;
    return j;
}

HistoryEntry HistoryEntry::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("history record is not an object");
    }
    HistoryEntry entry;
    entry.timestamp = j.at("timestamp").get<std::string>();
    auto mode = parseMode(j.at("mode").get<std::string>());
    if (!mode) {
        throw std::invalid_argument("unknown mode in history record");
    }
    entry.mode = *mode;
    entry.jobId = field<std::string>(j, "job_id", "");
    entry.status = parseStatus(field<std::string>(j, "status", "")).value_or(JobStatus::Finished);
    entry.dryRun = field<bool>(j, "dry_run", true);
    if (j.contains("settings")) {
        entry.parameters = JobParameters::fromJson(j["settings"]);
    }
    entry.exitCode = optionalField<int>(j, "exit_code");
    if (j.contains("summary") && !j["summary"].is_null()) {
        entry.summary = j["summary"];
    }
    entry.output = field<std::string>(j, "output", "");
    return entry;
}

HistoryEntry HistoryEntry::fromJob(const JobRecord& job, std::string output) {
    HistoryEntry entry;
    entry.timestamp = nowTimestamp();
    entry.jobId = job.id;
    entry.status = job.status;
    entry.mode = job.mode;
    entry.dryRun = job.dryRun;
    entry.parameters = job.parameters;
    entry.exitCode = job.exitCode;
    entry.summary = job.summary;
    entry.output = std::move(output);
    return entry;
}

HistoryLedger::HistoryLedger(const std::filesystem::path& path, std::size_t maxEntries) noexcept
    : path_(path), maxEntries_(std::max<std::size_t>(maxEntries, 1)) {
}

bool HistoryLedger::append(const HistoryEntry& entry) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        // Malformed lines are dropped on rewrite
        std::vector<std::string> kept;
        for (const auto& line : readLines()) {
            try {
                (void)HistoryEntry::fromJson(nlohmann::json::parse(line));
                kept.push_back(line);
            } catch (const std::exception&) {
                LOG_WARN("Dropping malformed history line from " + path_.string());
            }
        }

        kept.push_back(entry.toJson().dump());
        if (kept.size() > maxEntries_) {
            kept.erase(kept.begin(), kept.end() - static_cast<std::ptrdiff_t>(maxEntries_));
        }

        std::string content;
        for (const auto& line : kept) {
            content += line;
            content += '\n';
        }
        if (!atomicWriteFile(path_, content)) {
            LOG_ERROR("Failed to write history: " + path_.string());
            return false;
        }
        LOG_DEBUG("History entry appended for job " + entry.jobId + " (" + std::to_string(kept.size()) + " kept)");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to append history: " + std::string(e.what()));
        return false;
    }
}

std::vector<HistoryEntry> HistoryLedger::readAll() const noexcept {
    std::vector<HistoryEntry> entries;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t skipped = 0;
        for (const auto& line : readLines()) {
            try {
                entries.push_back(HistoryEntry::fromJson(nlohmann::json::parse(line)));
            } catch (const std::exception&) {
                ++skipped;
            }
        }
        if (skipped > 0) {
            LOG_WARN("Skipped " + std::to_string(skipped) + " malformed history line(s) in " + path_.string());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read history: " + std::string(e.what()));
    }
    return entries;
}

std::vector<HistoryEntry> HistoryLedger::recent(std::size_t limit) const noexcept {
    std::vector<HistoryEntry> entries = readAll();
    std::reverse(entries.begin(), entries.end());
    if (limit > 0 && entries.size() > limit) {
        entries.resize(limit);
    }
    return entries;
}

bool HistoryLedger::clear() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        LOG_ERROR("Failed to clear history: " + ec.message());
        return false;
    }
    LOG_INFO("History cleared");
    return true;
}

std::vector<std::string> HistoryLedger::readLines() const noexcept {
    std::vector<std::string> lines;
    try {
        std::ifstream file(path_);
        if (!file) {
            return lines;
        }
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                lines.push_back(std::move(line));
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read " + path_.string() + ": " + e.what());
    }
    return lines;
}

}
