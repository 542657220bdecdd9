/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/runner.hpp"
#include "frt/logger.hpp"
#include "frt/shutdown.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>

extern char** environ;

namespace frt {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(20);

class SpawnActions final {
public:
    SpawnActions() noexcept { ok_ = ::posix_spawn_file_actions_init(&actions_) == 0; }
    ~SpawnActions() {
        if (ok_) {
            ::posix_spawn_file_actions_destroy(&actions_);
        }
    }
    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    bool map(const StreamMapping& streams) noexcept {
        if (!ok_) {
            return false;
        }
        if (streams.in < 0) {
            if (::posix_spawn_file_actions_addopen(&actions_, STDIN_FILENO, "/dev/null", O_RDONLY, 0) != 0) {
                return false;
            }
        } else if (streams.in != STDIN_FILENO &&
                   ::posix_spawn_file_actions_adddup2(&actions_, streams.in, STDIN_FILENO) != 0) {
            return false;
        }
        if (streams.out != STDOUT_FILENO &&
            ::posix_spawn_file_actions_adddup2(&actions_, streams.out, STDOUT_FILENO) != 0) {
            return false;
        }
        if (streams.err != STDERR_FILENO &&
            ::posix_spawn_file_actions_adddup2(&actions_, streams.err, STDERR_FILENO) != 0) {
            return false;
        }
        return true;
    }

    posix_spawn_file_actions_t* get() noexcept { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
    bool ok_ = false;
};

class SpawnAttributes final {
public:
    SpawnAttributes() noexcept {
        initialized_ = ::posix_spawnattr_init(&attr_) == 0;
        if (!initialized_) {
            return;
        }

        // The child starts with default dispositions for the signals we catch, and nothing blocked
        sigset_t defaults;
        sigemptyset(&defaults);
        for (int sig : ShutdownHook::kSignals) {
            sigaddset(&defaults, sig);
        }
        sigset_t empty;
        sigemptyset(&empty);
        ok_ = ::posix_spawnattr_setsigdefault(&attr_, &defaults) == 0 &&
              ::posix_spawnattr_setsigmask(&attr_, &empty) == 0 &&
              ::posix_spawnattr_setflags(&attr_, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK) == 0;
    }
    ~SpawnAttributes() {
        if (initialized_) {
            ::posix_spawnattr_destroy(&attr_);
        }
    }
    SpawnAttributes(const SpawnAttributes&) = delete;
    SpawnAttributes& operator=(const SpawnAttributes&) = delete;

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    posix_spawnattr_t* get() noexcept { return &attr_; }

private:
    posix_spawnattr_t attr_;
    bool initialized_ = false;
    bool ok_ = false;
};

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

}

ProcessRunner::ProcessRunner(const ShutdownHook* hook, std::chrono::milliseconds killTimeout) noexcept
    : hook_(hook), killTimeout_(killTimeout) {
}

RunOutcome ProcessRunner::run(const std::vector<std::string>& command, const StreamMapping& streams) {
    RunOutcome outcome;
    if (command.empty()) {
        outcome.exitCode = kSpawnFailure;
        outcome.error = "empty command";
        return outcome;
    }

    SpawnActions actions;
    SpawnAttributes attributes;
    if (!actions.map(streams) || !attributes.ok()) {
        outcome.exitCode = kSpawnFailure;
        outcome.error = "failed to prepare spawn attributes";
        LOG_ERROR(outcome.error);
        return outcome;
    }

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    LOG_DEBUG("Spawning: " + formatCommand(command));

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, argv[0], actions.get(), attributes.get(), argv.data(), environ);
    if (rc != 0) {
        outcome.exitCode = kSpawnFailure;
        outcome.error = "cannot run " + command[0] + ": " + std::strerror(rc);
        LOG_ERROR(outcome.error);
        return outcome;
    }
    outcome.started = true;

    bool forwarded = false;
    bool killed = false;
    auto killAt = std::chrono::steady_clock::time_point::max();

    for (;;) {
        int status = 0;
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            outcome.exitCode = decodeStatus(status);
            // The child shares our process group and may have died of the same signal
            if (!outcome.interrupted && hook_ && hook_->requested()) {
                outcome.interrupted = true;
                outcome.signal = hook_->signal();
            }
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            outcome.exitCode = 1;
            outcome.error = std::string("waitpid failed: ") + std::strerror(errno);
            LOG_ERROR(outcome.error);
            break;
        }

        if (hook_ && hook_->requested()) {
            auto now = std::chrono::steady_clock::now();
            if (!forwarded) {
                outcome.interrupted = true;
                outcome.signal = hook_->signal();
                LOG_INFO("Received signal " + std::to_string(outcome.signal) +
                         ", terminating child " + std::to_string(pid));
                ::kill(pid, SIGTERM);
                forwarded = true;
                killAt = now + killTimeout_;
            } else if (!killed && now >= killAt) {
                LOG_WARN("Child " + std::to_string(pid) + " ignored SIGTERM, killing");
                ::kill(pid, SIGKILL);
                killed = true;
            }
        }

        std::this_thread::sleep_for(kWaitSlice);
    }

    LOG_DEBUG("Child " + std::to_string(pid) + " exited with " + std::to_string(outcome.exitCode));
    return outcome;
}

std::string formatCommand(const std::vector<std::string>& command) {
    std::string text;
    for (const auto& arg : command) {
        if (!text.empty()) text += ' ';
        text += arg;
    }
    return text;
}

}
