/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/store.hpp"
#include "m4brew/logger.hpp"
#include <atomic>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace m4brew {

namespace {
std::filesystem::path tempPathFor(const std::filesystem::path& path) {
    static std::atomic<uint64_t> counter{0};
    std::stringstream ss;
    ss << "." << path.filename().string() << ".tmp." << getpid() << "_" << counter.fetch_add(1);
    return path.parent_path() / ss.str();
}
}

bool atomicWriteFile(const std::filesystem::path& path, const std::string& content) noexcept {
    std::filesystem::path tempPath;
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        tempPath = tempPathFor(path);
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                LOG_ERROR("Failed to open temporary file: " + tempPath.string());
                return false;
            }
            file << content;
            file.flush();
            if (!file.good()) {
                LOG_ERROR("Failed to write temporary file: " + tempPath.string());
                file.close();
                std::error_code ec;
                std::filesystem::remove(tempPath, ec);
                return false;
            }
        }

        // rename(2) replaces the target atomically on the same filesystem
        std::filesystem::rename(tempPath, path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Atomic write of " + path.string() + " failed: " + e.what());
        if (!tempPath.empty()) {
            std::error_code ec;
            std::filesystem::remove(tempPath, ec);
        }
        return false;
    }
}

DocumentStore::DocumentStore(std::filesystem::path path, std::string freshnessKey) noexcept
    : path_(std::move(path)), freshnessKey_(std::move(freshnessKey)) {
}

std::optional<nlohmann::json> DocumentStore::load() const noexcept {
    try {
        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        if (content.empty()) {
            return std::nullopt;
        }
        auto document = nlohmann::json::parse(content, nullptr, false);
        if (document.is_discarded()) {
            LOG_WARN("Ignoring corrupt document: " + path_.string());
            return std::nullopt;
        }
        return document;
    } catch (const std::exception& e) {
        LOG_WARN("Failed to read " + path_.string() + ": " + e.what());
        return std::nullopt;
    }
}

SaveResult DocumentStore::save(const nlohmann::json& document) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string print = fingerprint(document);
        if (lastFingerprint_ && *lastFingerprint_ == print && std::filesystem::exists(path_)) {
            LOG_TRACE("Skipping unchanged write: " + path_.string());
            return SaveResult::Unchanged;
        }
        if (!writeAtomic(document.dump(2))) {
            return SaveResult::Failed;
        }
        lastFingerprint_ = std::move(print);
        return SaveResult::Written;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save " + path_.string() + ": " + e.what());
        return SaveResult::Failed;
    }
}

SaveResult DocumentStore::saveForced(const nlohmann::json& document) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!writeAtomic(document.dump(2))) {
            return SaveResult::Failed;
        }
        lastFingerprint_ = fingerprint(document);
        return SaveResult::Written;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save " + path_.string() + ": " + e.what());
        return SaveResult::Failed;
    }
}

bool DocumentStore::remove() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    lastFingerprint_.reset();
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        LOG_ERROR("Failed to remove " + path_.string() + ": " + ec.message());
        return false;
    }
    return true;
}

bool DocumentStore::exists() const noexcept {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

std::string DocumentStore::fingerprint(const nlohmann::json& document) const {
    if (freshnessKey_.empty() || !document.is_object() || !document.contains(freshnessKey_)) {
        return document.dump();
    }
    nlohmann::json copy = document;
    copy.erase(freshnessKey_);
    return copy.dump();
}

bool DocumentStore::writeAtomic(const std::string& content) const noexcept {
    return atomicWriteFile(path_, content + "\n");
}

}
