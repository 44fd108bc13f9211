/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "m4brew/process.hpp"
#include "m4brew/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace m4brew {

namespace {
int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::vector<std::string> buildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        std::string key = item.substr(0, eq);
        bool overridden = false;
        for (const auto& kv : overrides) {
            if (kv.first == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env.push_back(std::move(item));
        }
    }
    for (const auto& kv : overrides) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}
}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !exitCode_) {
        ::kill(-pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
    closePipe();
}

bool ChildProcess::spawn(const SpawnOptions& options, std::string& error) noexcept {
    if (pid_ > 0) {
        error = "process already started";
        return false;
    }
    if (options.argv.empty()) {
        error = "empty command";
        return false;
    }

    try {
        // Everything the child needs is built before fork
        std::vector<std::string> args = options.argv;
        std::vector<std::string> envStrings = buildEnvironment(options.env);
        std::vector<char*> argv;
        for (auto& arg : args) argv.push_back(arg.data());
        argv.push_back(nullptr);
        std::vector<char*> envp;
        for (auto& item : envStrings) envp.push_back(item.data());
        envp.push_back(nullptr);

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            error = std::string("pipe failed: ") + std::strerror(errno);
            return false;
        }
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

        pid_t pid = ::fork();
        if (pid < 0) {
            error = std::string("fork failed: ") + std::strerror(errno);
            ::close(fds[0]);
            ::close(fds[1]);
            if (devnull >= 0) ::close(devnull);
            return false;
        }

        if (pid == 0) {
            // Child: own process group so the whole tree can be signaled
            ::setpgid(0, 0);
            sigset_t none;
            sigemptyset(&none);
            ::sigprocmask(SIG_SETMASK, &none, nullptr);
            ::signal(SIGINT, SIG_DFL);
            ::signal(SIGTERM, SIG_DFL);
            ::signal(SIGPIPE, SIG_DFL);

            if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
            ::dup2(fds[1], STDOUT_FILENO);
            ::dup2(fds[1], STDERR_FILENO);

            ::execvpe(argv[0], argv.data(), envp.data());

            const char msg[] = "m4brew: failed to execute task\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            ::_exit(127);
        }

        // Parent sets the group too so signals work before the child runs
        if (::setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
            LOG_DEBUG("setpgid in parent failed: " + std::string(std::strerror(errno)));
        }
        ::close(fds[1]);
        if (devnull >= 0) ::close(devnull);

        fd_ = fds[0];
        pid_ = pid;
        eof_ = false;
        buffer_.clear();
        exitCode_.reset();
        LOG_DEBUG("Spawned " + args.front() + " as pid " + std::to_string(pid));
        return true;
    } catch (const std::exception& e) {
        error = std::string("spawn failed: ") + e.what();
        return false;
    }
}

ReadStatus ChildProcess::readLine(std::string& line, std::chrono::milliseconds timeout) {
    for (;;) {
        auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return ReadStatus::Line;
        }

        if (eof_ || fd_ < 0) {
            if (!buffer_.empty()) {
                line = std::move(buffer_);
                buffer_.clear();
                return ReadStatus::Line;
            }
            return ReadStatus::Eof;
        }

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("poll on task output failed: " + std::string(std::strerror(errno)));
            eof_ = true;
            closePipe();
            continue;
        }
        if (rc == 0) {
            return ReadStatus::Timeout;
        }

        char chunk[4096];
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
            eof_ = true;
            closePipe();
        } else if (errno != EINTR && errno != EAGAIN) {
            LOG_WARN("read on task output failed: " + std::string(std::strerror(errno)));
            eof_ = true;
            closePipe();
        }
    }
}

std::optional<int> ChildProcess::wait(std::chrono::milliseconds timeout) noexcept {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (tryReap()) {
            return exitCode_;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        auto step = std::min<std::chrono::steady_clock::duration>(std::chrono::milliseconds(20), deadline - now);
        std::this_thread::sleep_for(step);
    }
}

bool ChildProcess::tryReap() noexcept {
    if (exitCode_) {
        return true;
    }
    if (pid_ <= 0) {
        return false;
    }
    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == pid_) {
        exitCode_ = decodeWaitStatus(status);
        LOG_DEBUG("pid " + std::to_string(pid_) + " exited with " + std::to_string(*exitCode_));
        return true;
    }
    if (rc < 0 && errno == ECHILD) {
        LOG_WARN("pid " + std::to_string(pid_) + " was reaped elsewhere, exit status unknown");
        exitCode_ = -1;
        return true;
    }
    return false;
}

void ChildProcess::closePipe() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool PosixProcessControl::isGroupAlive(int pgid) const noexcept {
    if (pgid <= 0) {
        return false;
    }
    if (::kill(-pgid, 0) == 0) {
        return true;
    }
    // Exists but belongs to someone else
    return errno == EPERM;
}

bool PosixProcessControl::signalGroup(int pgid, int signal) noexcept {
    if (pgid <= 0) {
        return false;
    }
    return ::kill(-pgid, signal) == 0;
}

}
