/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace m4brew {

struct SpawnOptions {
    std::vector<std::string> argv;
    // Added on top of the controller's own environment
    std::vector<std::pair<std::string, std::string>> env;
};

enum class ReadStatus : uint8_t {
    Line,
    Timeout,
    Eof
};

// A child started as the leader of a new process group, with stdout and
// stderr merged into one pipe. The destructor kills the group and reaps the
// child if it is still around.
class ChildProcess final {
public:
    ChildProcess() noexcept = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    [[nodiscard]] bool spawn(const SpawnOptions& options, std::string& error) noexcept;

    // Next line of output without its newline. A trailing partial line is
    // returned once the pipe closes.
    [[nodiscard]] ReadStatus readLine(std::string& line, std::chrono::milliseconds timeout);

    // Exit code once the child is reaped; nullopt if it is still running
    // when the timeout expires. Signaled children report 128 + signal.
    [[nodiscard]] std::optional<int> wait(std::chrono::milliseconds timeout) noexcept;
    // Non-blocking reap. True once the child has exited.
    [[nodiscard]] bool tryReap() noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool started() const noexcept { return pid_ > 0; }
    [[nodiscard]] std::optional<int> exitCode() const noexcept { return exitCode_; }

private:
    void closePipe() noexcept;

    pid_t pid_ = -1;
    int fd_ = -1;
    bool eof_ = false;
    std::string buffer_;
    std::optional<int> exitCode_;
};

// OS process-group operations, behind an interface so tests can fake them.
class ProcessControl {
public:
    virtual ~ProcessControl() = default;

    [[nodiscard]] virtual bool isGroupAlive(int pgid) const noexcept = 0;
    virtual bool signalGroup(int pgid, int signal) noexcept = 0;
};

class PosixProcessControl final : public ProcessControl {
public:
    [[nodiscard]] bool isGroupAlive(int pgid) const noexcept override;
    bool signalGroup(int pgid, int signal) noexcept override;
};

}
