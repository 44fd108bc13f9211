/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "m4brew/job.hpp"
#include "m4brew/store.hpp"
#include "m4brew/types.hpp"

namespace m4brew {

struct Settings {
    std::string rootFolder;
    std::string audioMode = "match";
    int bitrate = 64;
    JobMode lastMode = JobMode::Convert;
    bool lastDryRun = true;

    [[nodiscard]] JobParameters parameters() const;

    [[nodiscard]] nlohmann::json toJson() const;
    // Values outside the accepted sets fall back to the defaults.
    [[nodiscard]] static Settings fromJson(const nlohmann::json& j) noexcept;

    [[nodiscard]] static bool isValidAudioMode(const std::string& mode) noexcept;
    [[nodiscard]] static bool isValidBitrate(int kbps) noexcept;
    [[nodiscard]] static bool isValidRoot(const std::string& root) noexcept;
};

class SettingsStore {
public:
    explicit SettingsStore(const std::filesystem::path& path) noexcept;

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    // Creates the document with defaults when it does not exist yet.
    [[nodiscard]] Settings load() noexcept;
    [[nodiscard]] bool save(const Settings& settings) noexcept;

private:
    DocumentStore store_;
};

}
