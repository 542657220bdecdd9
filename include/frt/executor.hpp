/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "frt/bridge.hpp"
#include "frt/runner.hpp"
#include "frt/translator.hpp"

namespace frt {

class Job;
class ShutdownHook;
struct Config;

// ssh reserves 255 for "could not connect"
constexpr int kConnectionFailure = 255;

enum class Attempt : uint8_t {
    Remote,
    Local
};

struct ExecutionResult {
    int exitCode = 0;
    Attempt attempt = Attempt::Remote;
    bool fellBack = false;
    bool interrupted = false;
    int signal = 0;
};

class Executor final {
public:
    Executor(const Job& job, const Config& config, Runner& runner, const ShutdownHook* hook = nullptr);

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Remote first; exit code 255 from the remote attempt moves on to the local one
    [[nodiscard]] ExecutionResult run(const std::vector<std::string>& args);

    [[nodiscard]] std::vector<std::string> buildCommand(Attempt attempt, const Translation& translation) const;
    [[nodiscard]] StreamMapping mapStreams() const noexcept;

    void setFilePredicate(FilePredicate predicate) { predicate_ = std::move(predicate); }
    void setBridgeKind(BridgeKind kind) noexcept { bridgeKind_ = kind; }

private:
    [[nodiscard]] RunOutcome runAttempt(Attempt attempt, const std::vector<std::string>& args);
    [[nodiscard]] std::unique_ptr<Bridge> startBridge() const;

    const Job& job_;
    const Config& config_;
    Runner& runner_;
    const ShutdownHook* hook_;
    FilePredicate predicate_;
    BridgeKind bridgeKind_;
};

// ssh invocation up to and including user@host
[[nodiscard]] std::vector<std::string> sshCommand(const Config& config);
[[nodiscard]] const char* attemptName(Attempt attempt) noexcept;

}
