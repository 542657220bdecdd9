/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <csignal>

namespace frt {

// Registers the termination handlers once for the lifetime of the object. The handler
// only records the signal; whoever waits on the child polls requested() and winds down
// through the same path as a normal exit.
class ShutdownHook final {
public:
    ShutdownHook() noexcept = default;
    ~ShutdownHook();

    ShutdownHook(const ShutdownHook&) = delete;
    ShutdownHook& operator=(const ShutdownHook&) = delete;
    ShutdownHook(ShutdownHook&&) = delete;
    ShutdownHook& operator=(ShutdownHook&&) = delete;

    // SIGTERM, SIGINT, SIGQUIT, SIGHUP; fails if another hook is installed
    [[nodiscard]] bool install() noexcept;
    void uninstall() noexcept;

    [[nodiscard]] bool installed() const noexcept { return installed_; }
    [[nodiscard]] bool requested() const noexcept;
    [[nodiscard]] int signal() const noexcept;

    // Same effect as receiving sig, for callers that want to wind down on their own
    void request(int sig) noexcept;

    static constexpr std::array<int, 4> kSignals = {SIGTERM, SIGINT, SIGQUIT, SIGHUP};

private:
    bool installed_ = false;
    std::array<struct sigaction, 4> previous_{};
};

}
