/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/config.hpp"
#include "m4brew/logger.hpp"
#include <cstdlib>
#include <sstream>
#include <string>

namespace m4brew {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}
}

Config Config::fromEnvironment() {
    Config config;

    if (const char* dir = std::getenv("M4BREW_DATA_DIR"); dir && *dir) {
        config.dataDir = dir;
    }
    if (const char* task = std::getenv("M4BREW_TASK"); task && *task) {
        auto command = splitCommand(task);
        if (!command.empty()) {
            config.taskCommand = std::move(command);
        }
    }
    if (const char* docker = std::getenv("M4BREW_DOCKER")) {
        // Set but empty turns container cleanup off
        config.dockerBinary = docker;
    }
    config.historyMax = env_size("M4BREW_HISTORY_MAX", config.historyMax);

    return config;
}

std::vector<std::string> splitCommand(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream in(command);
    std::string part;
    while (in >> part) {
        parts.push_back(part);
    }
    return parts;
}

}
