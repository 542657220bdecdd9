/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace frt {

class Job;

enum class BridgeKind : uint8_t {
    Polling,
    Inotify
};

// Detects files appearing under the job root while the wrapped command runs and
// links each one back onto its caller-visible path (reverse reference).
class Bridge {
public:
    explicit Bridge(const Job& job) noexcept;
    virtual ~Bridge() = default;

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;
    Bridge(Bridge&&) = delete;
    Bridge& operator=(Bridge&&) = delete;

    [[nodiscard]] virtual bool start() = 0;

    // Stops watching, then runs the final sweep. Finalization must not begin before this returns.
    void finish() noexcept;

    // One full walk of the job root; returns the number of reverse links created
    std::size_t sweep() noexcept;

    [[nodiscard]] std::vector<std::filesystem::path> linked() const;
    [[nodiscard]] virtual BridgeKind kind() const noexcept = 0;

protected:
    virtual void stopWatching() noexcept = 0;

    bool project(const std::filesystem::path& working) noexcept;
    bool withdraw(const std::filesystem::path& working) noexcept;
    std::size_t sweepDirectory(const std::filesystem::path& dir) noexcept;

    const Job& job_;

private:
    mutable std::mutex linkedMutex_;
    std::set<std::filesystem::path> linked_;
};

class PollingBridge final : public Bridge {
public:
    PollingBridge(const Job& job, std::chrono::milliseconds interval) noexcept;
    ~PollingBridge() override;

    [[nodiscard]] bool start() override;
    [[nodiscard]] BridgeKind kind() const noexcept override { return BridgeKind::Polling; }

private:
    void stopWatching() noexcept override;
    void pollLoop();

    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread pollThread_;
};

class InotifyBridge final : public Bridge {
public:
    explicit InotifyBridge(const Job& job) noexcept;
    ~InotifyBridge() override;

    [[nodiscard]] bool start() override;
    [[nodiscard]] BridgeKind kind() const noexcept override { return BridgeKind::Inotify; }

private:
    void stopWatching() noexcept override;
    void eventLoop();
    bool drainEvents() noexcept;
    void watchTree(const std::filesystem::path& dir) noexcept;

    int fd_ = -1;
    std::unordered_map<int, std::filesystem::path> watches_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread eventThread_;
};

[[nodiscard]] BridgeKind parseBridgeKind(const std::string& name) noexcept;
[[nodiscard]] std::unique_ptr<Bridge> makeBridge(BridgeKind kind, const Job& job,
                                                 std::chrono::milliseconds interval);

}
