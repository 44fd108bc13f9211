/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace m4brew {

// Built once at process start and handed to every component by reference.
struct Config {
    std::filesystem::path dataDir = "/config";

    // Executable followed by its arguments
    std::vector<std::string> taskCommand = {"/bin/bash", "/scripts/m4brew.sh"};

    std::size_t historyMax = 100;

    // Bounded waits of the background execution
    std::chrono::milliseconds pollInterval{200};
    std::chrono::milliseconds cancelCheckInterval{250};
    std::chrono::milliseconds interruptGrace{2000};
    std::chrono::milliseconds terminateGrace{2000};
    std::chrono::milliseconds exitWait{3000};

    // Container engine used to tear down helper containers labeled with the
    // job id. Empty disables the cleanup.
    std::string dockerBinary = "docker";
    std::string jobLabel = "m4brew.job";
    std::chrono::milliseconds reaperTimeout{10000};

    [[nodiscard]] std::filesystem::path jobFile() const { return dataDir / "job.json"; }
    [[nodiscard]] std::filesystem::path settingsFile() const { return dataDir / "settings.json"; }
    [[nodiscard]] std::filesystem::path historyFile() const { return dataDir / "history.jsonl"; }
    [[nodiscard]] std::filesystem::path outputFile() const { return dataDir / "job_output.log"; }

    // Defaults overridden by M4BREW_DATA_DIR, M4BREW_TASK, M4BREW_HISTORY_MAX
    // and M4BREW_DOCKER.
    [[nodiscard]] static Config fromEnvironment();
};

// Splits a command line on whitespace. Quotes are not interpreted.
[[nodiscard]] std::vector<std::string> splitCommand(const std::string& command);

}
