/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "m4brew/config.hpp"
#include "m4brew/parser.hpp"
#include "m4brew/process.hpp"
#include "m4brew/reaper.hpp"
#include "m4brew/types.hpp"

namespace m4brew {

struct RunOutcome {
    bool spawned = false;
    bool canceled = false;
    std::optional<int> exitCode;
    std::string output;
    std::optional<nlohmann::json> summary;
    std::string error;
};

struct RunCallbacks {
    // Process group of the freshly spawned task
    std::function<void(int pgid)> onSpawn;
    // After every parsed line
    std::function<void(const ProgressParser& parser, LineKind kind)> onProgress;
    // Polled between lines and on read timeouts
    std::function<bool()> cancelRequested;
};

// Runs the task to completion: spawn, stream through the parser, tee into
// the capture stream, and terminate the group when cancellation shows up.
class Supervisor final {
public:
    Supervisor(const Config& config, ProcessControl& control, SubResourceReaper& reaper) noexcept;

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    [[nodiscard]] RunOutcome run(const JobId& jobId, const SpawnOptions& options, ProgressParser& parser,
                                 std::ostream& capture, const RunCallbacks& callbacks);

    // Reap sub-resources, then SIGINT, SIGTERM and SIGKILL the group with a
    // grace period between steps. alive() reports whether the group still
    // needs killing. Safe to call repeatedly and from several threads.
    void terminate(const JobId& jobId, int pgid, const std::function<bool()>& alive) noexcept;

private:
    [[nodiscard]] bool waitUntilGone(const std::function<bool()>& alive,
                                     std::chrono::milliseconds grace) const noexcept;

    const Config& config_;
    ProcessControl& control_;
    SubResourceReaper& reaper_;
};

}
