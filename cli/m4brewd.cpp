/*
 * m4brew - Job controller (m4brewd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/config.hpp"
#include "m4brew/logger.hpp"
#include "m4brew/orchestrator.hpp"
#include "m4brew/settings.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace m4brew;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_interrupt_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_interrupt_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "m4brew job controller\n\n";
    std::cout << "Usage: " << progName << " [--data-dir <dir>] [--task <command>] <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  start          Run the task and wait for it (Ctrl-C cancels)\n";
    std::cout << "                   --mode convert|correct|cleanup\n";
    std::cout << "                   --dry-run | --run\n";
    std::cout << "                   --root <dir> --audio-mode match|mono|stereo --bitrate <kbps>\n";
    std::cout << "  status         Show the current job      [--json]\n";
    std::cout << "  cancel         Cancel the running job\n";
    std::cout << "  clear          Remove a finished job record\n";
    std::cout << "  history        List completed runs       [--limit <n>] [--json]\n";
    std::cout << "  history-clear  Delete the run history\n";
    std::cout << "  settings       Show or update settings   [--root <dir>] [--audio-mode <m>] [--bitrate <kbps>]\n";
    std::cout << "  output         Print the output of the current or last run\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  M4BREW_DATA_DIR     State directory (default /config)\n";
    std::cout << "  M4BREW_TASK         Task command line (default /bin/bash /scripts/m4brew.sh)\n";
    std::cout << "  M4BREW_HISTORY_MAX  History entries kept (default 100)\n";
    std::cout << "  M4BREW_DOCKER       Container CLI for cleanup, empty disables it\n";
    std::cout << "  M4BREW_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " settings --root /audiobooks\n";
    std::cout << "  " << progName << " start --mode convert --run\n";
    std::cout << "  " << progName << " history --limit 5\n";
}

const char* statusColor(JobStatus status) {
    switch (status) {
        case JobStatus::Running: return "\033[33m";
        case JobStatus::Canceling: return "\033[35m";
        case JobStatus::Finished: return "\033[32m";
        case JobStatus::Failed: return "\033[31m";
        case JobStatus::Canceled: return "\033[90m";
        default: return "\033[0m";
    }
}

// Options after the command word
struct Options {
    std::optional<std::string> mode;
    std::optional<bool> dryRun;
    std::optional<std::string> root;
    std::optional<std::string> audioMode;
    std::optional<int> bitrate;
    std::size_t limit = 0;
    bool json = false;
};

bool parseOptions(const std::vector<std::string>& args, Options& options) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size();
        if (arg == "--json") {
            options.json = true;
        } else if (arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "--run") {
            options.dryRun = false;
        } else if (arg == "--mode" && hasValue) {
            options.mode = args[++i];
        } else if (arg == "--root" && hasValue) {
            options.root = args[++i];
        } else if (arg == "--audio-mode" && hasValue) {
            options.audioMode = args[++i];
        } else if ((arg == "--bitrate" || arg == "--limit") && hasValue) {
            const std::string& value = args[++i];
            try {
                int parsed = std::stoi(value);
                if (arg == "--bitrate") {
                    options.bitrate = parsed;
                } else if (parsed >= 0) {
                    options.limit = static_cast<std::size_t>(parsed);
                } else {
                    std::cerr << "Error: Invalid limit " << value << "\n";
                    return false;
                }
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid number for " << arg << ": " << value << "\n";
                return false;
            }
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return false;
        }
    }
    return true;
}

// Applies root/audio-mode/bitrate overrides. False on an invalid value.
bool applyParameterOptions(const Options& options, Settings& settings) {
    if (options.root) {
        if (!Settings::isValidRoot(*options.root)) {
            std::cerr << "Error: Root folder must be an absolute path: " << *options.root << "\n";
            return false;
        }
        settings.rootFolder = *options.root;
    }
    if (options.audioMode) {
        if (!Settings::isValidAudioMode(*options.audioMode)) {
            std::cerr << "Error: Invalid audio mode " << *options.audioMode << " (match, mono, stereo)\n";
            return false;
        }
        settings.audioMode = *options.audioMode;
    }
    if (options.bitrate) {
        if (!Settings::isValidBitrate(*options.bitrate)) {
            std::cerr << "Error: Invalid bitrate " << *options.bitrate << " (32, 64, 96, 128, 160, 192)\n";
            return false;
        }
        settings.bitrate = *options.bitrate;
    }
    return true;
}

void printJob(const JobView& view) {
    if (!view.job) {
        std::cout << "  No job\n";
        return;
    }
    const JobRecord& job = *view.job;
    std::cout << "  " << statusColor(job.status) << toString(job.status) << "\033[0m";
    if (view.stale) {
        std::cout << "  \033[90m(process gone)\033[0m";
    }
    std::cout << "\n\n";
    std::cout << "    Job        " << job.id << "\n";
    std::cout << "    Mode       " << toString(job.mode) << (job.dryRun ? " (dry run)" : "") << "\n";
    std::cout << "    Root       " << job.parameters.rootFolder << "\n";
    std::cout << "    Started    " << job.started << "\n";
    std::cout << "    Progress   " << job.current << " / " << job.total << "\n";
    if (!job.currentLabel.empty()) {
        std::cout << "    Book       " << job.currentLabel << "\n";
    }
    if (!job.currentPath.empty()) {
        std::cout << "    Path       " << job.currentPath << "\n";
    }
    if (view.elapsedSeconds) {
        std::cout << "    Elapsed    " << *view.elapsedSeconds << "s\n";
    }
    if (job.exitCode) {
        std::cout << "    Exit code  " << *job.exitCode << "\n";
    }
    if (job.runtimeSeconds) {
        std::cout << "    Runtime    " << *job.runtimeSeconds << "s\n";
    }
    if (job.summary) {
        std::cout << "    Summary    " << job.summary->dump() << "\n";
    }
}

void printSettings(const Settings& settings) {
    std::cout << "    Root        " << (settings.rootFolder.empty() ? "(not set)" : settings.rootFolder) << "\n";
    std::cout << "    Audio mode  " << settings.audioMode << "\n";
    std::cout << "    Bitrate     " << settings.bitrate << "k\n";
    std::cout << "    Last run    " << toString(settings.lastMode) << (settings.lastDryRun ? " (dry run)" : "") << "\n";
}

int exitCodeFor(JobStatus status) {
    switch (status) {
        case JobStatus::Finished: return 0;
        case JobStatus::Canceled: return kCanceledExitCode;
        default: return 1;
    }
}

int runStart(Orchestrator& orchestrator, SettingsStore& settingsStore, const Options& options) {
    Settings settings = settingsStore.load();

    JobMode mode = settings.lastMode;
    if (options.mode) {
        auto parsed = parseMode(*options.mode);
        if (!parsed) {
            std::cerr << "Error: Invalid mode " << *options.mode << " (convert, correct, cleanup)\n";
            return 2;
        }
        mode = *parsed;
    }
    bool dryRun = options.dryRun.value_or(settings.lastDryRun);

    // Parameter overrides apply to this run only
    Settings runSettings = settings;
    if (!applyParameterOptions(options, runSettings)) {
        return 2;
    }

    settings.lastMode = mode;
    settings.lastDryRun = dryRun;
    if (!settingsStore.save(settings)) {
        LOG_WARN("Could not remember last mode in settings");
    }

    auto result = orchestrator.start(mode, dryRun, runSettings.parameters());
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return result.error == StartError::AlreadyRunning ? 1 : 2;
    }

    std::cout << "  Started " << result.job.id << "  " << toString(mode)
              << (dryRun ? " (dry run)" : "") << "\n" << std::flush;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    bool cancelSent = false;
    long lastCurrent = -1;
    while (!orchestrator.wait(std::chrono::milliseconds(200))) {
        if (g_interrupt_requested && !cancelSent) {
            cancelSent = true;
            std::cout << "\n  Canceling...\n" << std::flush;
            (void)orchestrator.requestCancel();
            continue;
        }
        auto view = orchestrator.status();
        if (view.job && view.job->current != lastCurrent) {
            lastCurrent = view.job->current;
            std::cout << "    " << view.job->current << " / " << view.job->total;
            if (!view.job->currentLabel.empty()) {
                std::cout << "  " << view.job->currentLabel;
            }
            std::cout << "\n" << std::flush;
        }
    }

    std::cout << "\n";
    auto view = orchestrator.status();
    printJob(view);
    return exitCodeFor(view.status());
}

int runHistory(Orchestrator& orchestrator, const Options& options) {
    auto entries = orchestrator.history(options.limit);
    if (options.json) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& entry : entries) {
            list.push_back(entry.toJson());
        }
        std::cout << list.dump(2) << "\n";
        return 0;
    }
    if (entries.empty()) {
        std::cout << "  No history\n";
        return 0;
    }
    for (const auto& entry : entries) {
        std::cout << "  \033[90m" << entry.timestamp << "\033[0m  " << statusColor(entry.status)
                  << toString(entry.status) << "\033[0m  " << toString(entry.mode)
                  << (entry.dryRun ? " (dry run)" : "");
        if (entry.exitCode) {
            std::cout << "  exit " << *entry.exitCode;
        }
        std::cout << "  " << entry.parameters.rootFolder << "\n";
    }
    return 0;
}

int runSettings(SettingsStore& settingsStore, const Options& options) {
    Settings settings = settingsStore.load();
    if (options.root || options.audioMode || options.bitrate) {
        if (!applyParameterOptions(options, settings)) {
            return 2;
        }
        if (!settingsStore.save(settings)) {
            std::cerr << "Error: Could not save settings\n";
            return 1;
        }
    }
    if (options.json) {
        std::cout << settings.toJson().dump(2) << "\n";
    } else {
        printSettings(settings);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    // Silence routine logs for CLI usage unless asked for
    if (std::getenv("M4BREW_LOG_LEVEL")) {
        Logger::initFromEnv();
    } else {
        Logger::setLevel(LogLevel::WARN);
    }
    setThreadName("Main");

    Config config = Config::fromEnvironment();
    std::string command;
    std::vector<std::string> rest;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (command.empty() && arg == "--data-dir" && i + 1 < argc) {
            config.dataDir = argv[++i];
        } else if (command.empty() && arg == "--task" && i + 1 < argc) {
            auto task = splitCommand(argv[++i]);
            if (task.empty()) {
                std::cerr << "Error: Empty task command\n";
                return 2;
            }
            config.taskCommand = std::move(task);
        } else if (command.empty()) {
            command = arg;
        } else {
            rest.push_back(arg);
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    Options options;
    if (!parseOptions(rest, options)) {
        return 2;
    }

    try {
        Orchestrator orchestrator(config);
        SettingsStore settingsStore(config.settingsFile());

        if (command == "start") {
            return runStart(orchestrator, settingsStore, options);
        }
        if (command == "status") {
            auto view = orchestrator.status();
            if (options.json) {
                std::cout << view.toJson().dump(2) << "\n";
            } else {
                printJob(view);
            }
            return 0;
        }
        if (command == "cancel") {
            if (!orchestrator.requestCancel()) {
                std::cout << "  No active job\n";
                return 1;
            }
            std::cout << "  Cancel requested\n";
            return 0;
        }
        if (command == "clear") {
            auto result = orchestrator.clear();
            if (!result) {
                std::cerr << "Error: " << result.message << "\n";
                return 1;
            }
            std::cout << "  Cleared\n";
            return 0;
        }
        if (command == "history") {
            return runHistory(orchestrator, options);
        }
        if (command == "history-clear") {
            if (!orchestrator.historyClear()) {
                std::cerr << "Error: Could not clear history\n";
                return 1;
            }
            std::cout << "  History cleared\n";
            return 0;
        }
        if (command == "settings") {
            return runSettings(settingsStore, options);
        }
        if (command == "output") {
            std::cout << orchestrator.output();
            return 0;
        }

        std::cerr << "Error: Unknown command " << command << "\n\n";
        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        LOG_ERROR("Controller error: " + std::string(e.what()));
        return 1;
    }
}
