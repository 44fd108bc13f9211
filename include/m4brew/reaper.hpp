/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "m4brew/config.hpp"
#include "m4brew/types.hpp"

namespace m4brew {

// Tears down resources the task started on its own and labeled with the
// job id. Best effort: implementations log failures and never throw.
class SubResourceReaper {
public:
    virtual ~SubResourceReaper() = default;

    virtual void reap(const JobId& jobId) noexcept = 0;
};

class NullReaper final : public SubResourceReaper {
public:
    void reap(const JobId&) noexcept override {}
};

// Removes containers carrying <label>=<jobId> through the container CLI.
class DockerReaper final : public SubResourceReaper {
public:
    explicit DockerReaper(const Config& config);

    void reap(const JobId& jobId) noexcept override;

private:
    // Runs argv, returns its stdout lines. False on spawn failure, timeout
    // or non-zero exit.
    [[nodiscard]] bool run(const std::vector<std::string>& argv, std::vector<std::string>& lines) const;

    std::string binary_;
    std::string label_;
    std::chrono::milliseconds timeout_;
};

}
