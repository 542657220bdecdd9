/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <unistd.h>

namespace frt {

class ShutdownHook;

// Exit status reported when the program cannot be spawned at all
constexpr int kSpawnFailure = 127;

// Descriptors the child sees as stdin/stdout/stderr; in = -1 means /dev/null
struct StreamMapping {
    int in = STDIN_FILENO;
    int out = STDOUT_FILENO;
    int err = STDERR_FILENO;
};

struct RunOutcome {
    bool started = false;
    int exitCode = -1;
    bool interrupted = false;
    int signal = 0;
    std::string error;
};

class Runner {
public:
    virtual ~Runner() = default;

    // Launches one command and blocks until it exits
    [[nodiscard]] virtual RunOutcome run(const std::vector<std::string>& command,
                                         const StreamMapping& streams) = 0;
};

class ProcessRunner final : public Runner {
public:
    explicit ProcessRunner(const ShutdownHook* hook = nullptr,
                           std::chrono::milliseconds killTimeout = std::chrono::milliseconds(5000)) noexcept;

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    [[nodiscard]] RunOutcome run(const std::vector<std::string>& command,
                                 const StreamMapping& streams) override;

private:
    const ShutdownHook* hook_;
    std::chrono::milliseconds killTimeout_;
};

[[nodiscard]] std::string formatCommand(const std::vector<std::string>& command);

}
