/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/bridge.hpp"
#include "frt/logger.hpp"
#include <algorithm>

namespace frt {

PollingBridge::PollingBridge(const Job& job, std::chrono::milliseconds interval) noexcept
    : Bridge(job), interval_(interval) {
}

PollingBridge::~PollingBridge() {
    stopWatching();
}

bool PollingBridge::start() {
    if (running_.load()) {
        LOG_WARN("Polling bridge already running");
        return false;
    }

    shutdown_.store(false);
    running_.store(true);
    try {
        pollThread_ = std::thread(&PollingBridge::pollLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start polling bridge: " + std::string(e.what()));
        running_.store(false);
        return false;
    }

    LOG_DEBUG("Polling bridge started (" + std::to_string(interval_.count()) + "ms)");
    return true;
}

void PollingBridge::stopWatching() noexcept {
    if (!running_.load()) {
        return;
    }

    shutdown_.store(true);
    if (pollThread_.joinable()) {
        pollThread_.join();
    }
    running_.store(false);
    LOG_DEBUG("Polling bridge stopped");
}

void PollingBridge::pollLoop() {
    setThreadName("Bridge");

    const auto slice = std::min(interval_, std::chrono::milliseconds(50));
    while (!shutdown_.load()) {
        (void)sweep();

        auto sleepEnd = std::chrono::steady_clock::now() + interval_;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(slice);
        }
    }
}

}
