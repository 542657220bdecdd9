/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/shutdown.hpp"
#include "frt/logger.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>

namespace frt {

namespace {

// Async-signal-safe: only set flags, no complex operations
volatile sig_atomic_t g_shutdown_signal = 0;
std::atomic<bool> g_hook_installed{false};

void handleShutdownSignal(int sig) {
    if (g_shutdown_signal == 0) {
        g_shutdown_signal = sig;
    }
}

}

ShutdownHook::~ShutdownHook() {
    uninstall();
}

bool ShutdownHook::install() noexcept {
    if (installed_) {
        return true;
    }
    if (g_hook_installed.exchange(true)) {
        LOG_ERROR("A shutdown hook is already installed");
        return false;
    }

    g_shutdown_signal = 0;

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handleShutdownSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0; // no SA_RESTART: blocking calls return EINTR

    for (std::size_t i = 0; i < kSignals.size(); ++i) {
        if (::sigaction(kSignals[i], &action, &previous_[i]) != 0) {
            LOG_ERROR("Failed to install handler for signal " + std::to_string(kSignals[i]) +
                      ": " + std::strerror(errno));
            for (std::size_t j = 0; j < i; ++j) {
                ::sigaction(kSignals[j], &previous_[j], nullptr);
            }
            g_hook_installed.store(false);
            return false;
        }
    }

    installed_ = true;
    LOG_DEBUG("Shutdown hook installed");
    return true;
}

void ShutdownHook::uninstall() noexcept {
    if (!installed_) {
        return;
    }
    for (std::size_t i = 0; i < kSignals.size(); ++i) {
        ::sigaction(kSignals[i], &previous_[i], nullptr);
    }
    installed_ = false;
    g_shutdown_signal = 0;
    g_hook_installed.store(false);
}

bool ShutdownHook::requested() const noexcept {
    return installed_ && g_shutdown_signal != 0;
}

int ShutdownHook::signal() const noexcept {
    return installed_ ? static_cast<int>(g_shutdown_signal) : 0;
}

void ShutdownHook::request(int sig) noexcept {
    if (installed_ && g_shutdown_signal == 0) {
        g_shutdown_signal = sig;
    }
}

}
