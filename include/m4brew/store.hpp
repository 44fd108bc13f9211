/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace m4brew {

enum class SaveResult : uint8_t {
    Written,
    Unchanged,
    Failed
};

// One JSON document on disk. Writes go to a sibling temporary file that is
// renamed over the target, so readers see either the old or the new
// document, never a partial one.
class DocumentStore {
public:
    // Keys named by freshnessKey are ignored when deciding whether a save
    // would change anything.
    explicit DocumentStore(std::filesystem::path path, std::string freshnessKey = "") noexcept;

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;
    DocumentStore(DocumentStore&&) = delete;
    DocumentStore& operator=(DocumentStore&&) = delete;

    // Missing, unreadable or corrupt documents read as nullopt.
    [[nodiscard]] std::optional<nlohmann::json> load() const noexcept;
    [[nodiscard]] SaveResult save(const nlohmann::json& document) noexcept;
    // Writes even when the content is unchanged.
    [[nodiscard]] SaveResult saveForced(const nlohmann::json& document) noexcept;
    bool remove() noexcept;

    [[nodiscard]] bool exists() const noexcept;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    [[nodiscard]] std::string fingerprint(const nlohmann::json& document) const;
    [[nodiscard]] bool writeAtomic(const std::string& content) const noexcept;

    std::filesystem::path path_;
    std::string freshnessKey_;

    mutable std::mutex mutex_;
    std::optional<std::string> lastFingerprint_;
};

// Writes content to path through a temporary file and rename.
[[nodiscard]] bool atomicWriteFile(const std::filesystem::path& path, const std::string& content) noexcept;

}
