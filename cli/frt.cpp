/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/config.hpp"
#include "frt/executor.hpp"
#include "frt/finalizer.hpp"
#include "frt/job.hpp"
#include "frt/logger.hpp"
#include "frt/runner.hpp"
#include "frt/shutdown.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace frt;

// Installed as ffmpeg and ffprobe (symlinks to this binary); every argument belongs to the tool
int main(int argc, char* argv[]) {
    std::string programName = argc > 0 ? argv[0] : "ffmpeg";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto loaded = ConfigLoader::load();
    if (!loaded) {
        LOG_ERROR(loaded.message);
        std::cerr << "frt: " << loaded.message << std::endl;
        return 1;
    }
    const Config& config = loaded.config;

    Logger::setLevel(config.logLevel);
    if (std::getenv("FRT_LOG_LEVEL")) {
        Logger::initFromEnv();
    }
    // stderr belongs to the wrapped tool; only errors go there when the log file is unusable
    if (!config.logFile.empty() && !Logger::setFile(config.logFile)) {
        Logger::setLevel(LogLevel::ERROR);
    }

    try {
        Job job = Job::create(config, programName, args);
        setThreadName("frt-" + job.id().substr(0, 6));
        LOG_INFO("Starting " + programName + " job " + job.id());

        // Installed before the working root exists so a signal cannot strand it
        ShutdownHook hook;
        if (!hook.install()) {
            LOG_WARN("Running without signal handling");
        }

        if (!Job::ensureDirectories(job.root())) {
            std::cerr << "frt: cannot create working directory " << job.root() << std::endl;
            return 1;
        }

        ProcessRunner runner(&hook, config.killTimeout);
        Executor executor(job, config, runner, &hook);
        auto result = executor.run(args);

        int status = result.exitCode;
        if (result.interrupted && status < 0) {
            status = 128 + result.signal;
        }

        // The hook stays installed so a second signal cannot cut cleanup short; the reap
        // runner ignores it. An unreachable host has nothing left to reap.
        ProcessRunner cleanupRunner(nullptr, config.killTimeout);
        Finalizer finalizer(job, config, cleanupRunner, !result.fellBack);
        finalizer.exit(status);

    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal: ") + e.what());
        std::cerr << "frt: " << e.what() << std::endl;
        return 1;
    }
}
