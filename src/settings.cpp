/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/settings.hpp"
#include "m4brew/logger.hpp"
#include "json_fields.hpp"
#include <algorithm>
#include <array>

namespace m4brew {

namespace {
constexpr std::array<int, 6> kBitrates = {32, 64, 96, 128, 160, 192};
constexpr std::array<const char*, 3> kAudioModes = {"match", "mono", "stereo"};
}

JobParameters Settings::parameters() const {
    JobParameters p;
    p.rootFolder = rootFolder;
    p.audioMode = audioMode;
    p.bitrate = bitrate;
    return p;
}

nlohmann::json Settings::toJson() const {
    return {
        {"root_folder", rootFolder},
        {"audio_mode", audioMode},
        {"bitrate", bitrate},
        {"last_mode", toString(lastMode)},
        {"last_dry_run", lastDryRun},
    };
}

Settings Settings::fromJson(const nlohmann::json& j) noexcept {
    Settings defaults;
    Settings s;

    std::string root = field<std::string>(j, "root_folder", defaults.rootFolder);
    s.rootFolder = isValidRoot(root) ? root : defaults.rootFolder;

    std::string audioMode = field<std::string>(j, "audio_mode", defaults.audioMode);
    s.audioMode = isValidAudioMode(audioMode) ? audioMode : defaults.audioMode;

    int bitrate = field<int>(j, "bitrate", defaults.bitrate);
    s.bitrate = isValidBitrate(bitrate) ? bitrate : defaults.bitrate;

    s.lastMode = parseMode(field<std::string>(j, "last_mode", "")).value_or(defaults.lastMode);
    s.lastDryRun = field<bool>(j, "last_dry_run", defaults.lastDryRun);
    return s;
}

bool Settings::isValidAudioMode(const std::string& mode) noexcept {
    return std::any_of(kAudioModes.begin(), kAudioModes.end(),
        [&](const char* allowed) { return mode == allowed; });
}

bool Settings::isValidBitrate(int kbps) noexcept {
    return std::find(kBitrates.begin(), kBitrates.end(), kbps) != kBitrates.end();
}

bool Settings::isValidRoot(const std::string& root) noexcept {
    // Empty means "not configured yet"
    return root.empty() || root.front() == '/';
}

SettingsStore::SettingsStore(const std::filesystem::path& path) noexcept
    : store_(path) {
}

Settings SettingsStore::load() noexcept {
    auto document = store_.load();
    if (!document) {
        Settings defaults;
        if (!store_.exists()) {
            LOG_DEBUG("Creating default settings: " + store_.path().string());
            if (!save(defaults)) {
                LOG_WARN("Could not write default settings");
            }
        }
        return defaults;
    }
    return Settings::fromJson(*document);
}

bool SettingsStore::save(const Settings& settings) noexcept {
    try {
        return store_.save(settings.toJson()) != SaveResult::Failed;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save settings: " + std::string(e.what()));
        return false;
    }
}

}
