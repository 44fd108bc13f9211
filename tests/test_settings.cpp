/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "m4brew/config.hpp"
#include "m4brew/settings.hpp"
#include "test_helpers.hpp"

namespace m4brew {
namespace {

using test::TempDir;
using test::writeFile;

TEST(SettingsStoreTest, MissingDocumentIsCreatedWithDefaults) {
    TempDir dir;
    auto path = dir.path() / "settings.json";
    SettingsStore store(path);

    Settings settings = store.load();
    EXPECT_TRUE(settings.rootFolder.empty());
    EXPECT_EQ(settings.audioMode, "match");
    EXPECT_EQ(settings.bitrate, 64);
    EXPECT_EQ(settings.lastMode, JobMode::Convert);
    EXPECT_TRUE(settings.lastDryRun);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(SettingsStoreTest, SavedValuesAreLoaded) {
    TempDir dir;
    SettingsStore store(dir.path() / "settings.json");

    Settings settings;
    settings.rootFolder = "/audiobooks";
    settings.audioMode = "mono";
    settings.bitrate = 128;
    settings.lastMode = JobMode::Cleanup;
    settings.lastDryRun = false;
    ASSERT_TRUE(store.save(settings));

    SettingsStore reopened(dir.path() / "settings.json");
    Settings loaded = reopened.load();
    EXPECT_EQ(loaded.rootFolder, "/audiobooks");
    EXPECT_EQ(loaded.audioMode, "mono");
    EXPECT_EQ(loaded.bitrate, 128);
    EXPECT_EQ(loaded.lastMode, JobMode::Cleanup);
    EXPECT_FALSE(loaded.lastDryRun);

    JobParameters params = loaded.parameters();
    EXPECT_EQ(params.rootFolder, "/audiobooks");
    EXPECT_EQ(params.bitrate, 128);
}

TEST(SettingsStoreTest, OutOfRangeValuesDegradeToDefaults) {
    TempDir dir;
    auto path = dir.path() / "settings.json";
    writeFile(path, R"({"root_folder": "relative/path", "audio_mode": "surround",
                        "bitrate": 100, "last_mode": "explode", "last_dry_run": "yes"})");

    Settings settings = SettingsStore(path).load();
    EXPECT_TRUE(settings.rootFolder.empty());
    EXPECT_EQ(settings.audioMode, "match");
    EXPECT_EQ(settings.bitrate, 64);
    EXPECT_EQ(settings.lastMode, JobMode::Convert);
    EXPECT_TRUE(settings.lastDryRun);
}

TEST(SettingsStoreTest, CorruptDocumentReadsAsDefaults) {
    TempDir dir;
    auto path = dir.path() / "settings.json";
    writeFile(path, "{{{");

    Settings settings = SettingsStore(path).load();
    EXPECT_EQ(settings.bitrate, 64);
    EXPECT_EQ(settings.audioMode, "match");
}

TEST(SettingsTest, Validation) {
    EXPECT_TRUE(Settings::isValidAudioMode("stereo"));
    EXPECT_FALSE(Settings::isValidAudioMode("Stereo"));
    EXPECT_TRUE(Settings::isValidBitrate(192));
    EXPECT_FALSE(Settings::isValidBitrate(0));
    EXPECT_TRUE(Settings::isValidRoot("/data"));
    EXPECT_TRUE(Settings::isValidRoot(""));
    EXPECT_FALSE(Settings::isValidRoot("data"));
}

TEST(ConfigTest, SplitCommandOnWhitespace) {
    auto argv = splitCommand("  /bin/sh   /scripts/task.sh\t--flag ");
    ASSERT_EQ(argv.size(), 3u);
    EXPECT_EQ(argv[0], "/bin/sh");
    EXPECT_EQ(argv[1], "/scripts/task.sh");
    EXPECT_EQ(argv[2], "--flag");
    EXPECT_TRUE(splitCommand("   ").empty());
}

TEST(ConfigTest, EnvironmentOverridesDefaults) {
    ::setenv("M4BREW_DATA_DIR", "/tmp/m4brew-config-test", 1);
    ::setenv("M4BREW_HISTORY_MAX", "7", 1);
    ::setenv("M4BREW_TASK", "/bin/sh /opt/task.sh", 1);
    ::setenv("M4BREW_DOCKER", "", 1);

    Config config = Config::fromEnvironment();
    EXPECT_EQ(config.dataDir, "/tmp/m4brew-config-test");
    EXPECT_EQ(config.jobFile(), "/tmp/m4brew-config-test/job.json");
    EXPECT_EQ(config.historyMax, 7u);
    ASSERT_EQ(config.taskCommand.size(), 2u);
    EXPECT_EQ(config.taskCommand[1], "/opt/task.sh");
    EXPECT_TRUE(config.dockerBinary.empty());

    ::setenv("M4BREW_HISTORY_MAX", "lots", 1);
    EXPECT_EQ(Config::fromEnvironment().historyMax, 100u);

    ::unsetenv("M4BREW_DATA_DIR");
    ::unsetenv("M4BREW_HISTORY_MAX");
    ::unsetenv("M4BREW_TASK");
    ::unsetenv("M4BREW_DOCKER");
    Config defaults = Config::fromEnvironment();
    EXPECT_EQ(defaults.dataDir, "/config");
    EXPECT_EQ(defaults.dockerBinary, "docker");
}

}
}
