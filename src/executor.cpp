/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/executor.hpp"
#include "frt/config.hpp"
#include "frt/job.hpp"
#include "frt/logger.hpp"
#include "frt/shutdown.hpp"
#include <initializer_list>
#include <utility>

namespace frt {

Executor::Executor(const Job& job, const Config& config, Runner& runner, const ShutdownHook* hook)
    : job_(job),
      config_(config),
      runner_(runner),
      hook_(hook),
      predicate_(defaultFilePredicate(config.fileMarker)),
      bridgeKind_(parseBridgeKind(config.bridge)) {
}

ExecutionResult Executor::run(const std::vector<std::string>& args) {
    ExecutionResult result;

    for (Attempt attempt : {Attempt::Remote, Attempt::Local}) {
        auto outcome = runAttempt(attempt, args);

        result.exitCode = outcome.exitCode;
        result.attempt = attempt;
        result.interrupted = outcome.interrupted;
        result.signal = outcome.signal;

        bool shuttingDown = outcome.interrupted || (hook_ && hook_->requested());
        if (attempt == Attempt::Remote && outcome.exitCode == kConnectionFailure && !shuttingDown) {
            LOG_WARN("Failed to connect to remote host");
            continue;
        }
        // A local attempt skipped for shutdown is not a fallback
        result.fellBack = attempt == Attempt::Local && (outcome.started || !outcome.interrupted);
        break;
    }

    if (result.exitCode == 0) {
        LOG_INFO(std::string(attemptName(result.attempt)) + " run finished with return code 0");
    } else {
        LOG_ERROR(std::string(attemptName(result.attempt)) + " run exited with return code " +
                  std::to_string(result.exitCode));
    }
    return result;
}

RunOutcome Executor::runAttempt(Attempt attempt, const std::vector<std::string>& args) {
    Translator translator(job_, predicate_, config_.fileMarker);
    auto translation = translator.translate(
        args, attempt == Attempt::Remote ? PathTarget::Remote : PathTarget::Local);
    auto command = buildCommand(attempt, translation);

    if (hook_ && hook_->requested()) {
        RunOutcome outcome;
        outcome.interrupted = true;
        outcome.signal = hook_->signal();
        outcome.exitCode = 128 + outcome.signal;
        LOG_INFO("Shutdown requested before the " + std::string(attemptName(attempt)) + " run started");
        return outcome;
    }

    auto bridge = startBridge();

    LOG_INFO("Running command on " + std::string(attempt == Attempt::Remote ? "remote server" : "local host"));
    LOG_INFO(formatCommand(command));

    auto outcome = runner_.run(command, mapStreams());

    bridge->finish();
    return outcome;
}

std::unique_ptr<Bridge> Executor::startBridge() const {
    auto bridge = makeBridge(bridgeKind_, job_, config_.pollInterval);
    if (bridge->start()) {
        return bridge;
    }

    if (bridge->kind() != BridgeKind::Polling) {
        LOG_WARN("Falling back to polling bridge");
        bridge = makeBridge(BridgeKind::Polling, job_, config_.pollInterval);
        if (bridge->start()) {
            return bridge;
        }
    }

    // finish() still performs the final sweep
    LOG_ERROR("Output bridge not running; outputs are linked after the command exits");
    return bridge;
}

std::vector<std::string> Executor::buildCommand(Attempt attempt, const Translation& translation) const {
    std::vector<std::string> command;
    const ToolPaths& tools = attempt == Attempt::Remote ? config_.serverTools : config_.clientTools;

    if (attempt == Attempt::Remote) {
        command = sshCommand(config_);
    }
    command.push_back(job_.tool() == ToolKind::Ffprobe ? tools.ffprobe : tools.ffmpeg);
    command.insert(command.end(), translation.args.begin(), translation.args.end());
    return command;
}

StreamMapping Executor::mapStreams() const noexcept {
    StreamMapping streams;
    // Keep stray stdout text out of a data stream the caller may be piping
    if (!job_.bypass() && !job_.introspection()) {
        streams.out = STDERR_FILENO;
    }
    return streams;
}

std::vector<std::string> sshCommand(const Config& config) {
    std::vector<std::string> command = {
        config.sshPath, "-q",
        "-o", "ConnectTimeout=1",
        "-o", "ConnectionAttempts=1",
        "-o", "StrictHostKeyChecking=no",
        "-o", "UserKnownHostsFile=/dev/null",
    };
    if (!config.identityFile.empty()) {
        command.push_back("-i");
        command.push_back(config.identityFile);
    }
    command.push_back(config.username + "@" + config.host);
    return command;
}

const char* attemptName(Attempt attempt) noexcept {
    switch (attempt) {
        case Attempt::Remote: return "remote";
        case Attempt::Local:  return "local";
        default: return "unknown";
    }
}

}
