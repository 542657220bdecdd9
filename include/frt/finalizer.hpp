/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace frt {

class Job;
class Runner;
struct Config;

struct FinalizeReport {
    bool skipped = false;
    bool reaped = false;
    std::size_t unlinked = 0;
    std::size_t promoted = 0;
    std::size_t discarded = 0;
    std::size_t removedDirectories = 0;
    std::size_t failures = 0;
};

// Tears down one job: reaps orphaned remote tools, drops forward links, moves produced
// artifacts onto their caller-visible paths and removes the working root.
class Finalizer final {
public:
    Finalizer(const Job& job, const Config& config, Runner& runner, bool reapRemote = true) noexcept;

    Finalizer(const Finalizer&) = delete;
    Finalizer& operator=(const Finalizer&) = delete;

    // Runs at most once; later calls return a report marked skipped
    [[nodiscard]] FinalizeReport run() noexcept;

    [[noreturn]] void exit(int status) noexcept;

    [[nodiscard]] std::vector<std::string> reapCommand() const;

private:
    bool reap() noexcept;
    void reconcile(FinalizeReport& report) noexcept;
    bool promote(const std::filesystem::path& working, const std::filesystem::path& destination) noexcept;

    const Job& job_;
    const Config& config_;
    Runner& runner_;
    bool reapRemote_;
    std::atomic<bool> done_{false};
};

}
