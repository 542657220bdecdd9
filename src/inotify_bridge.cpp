/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/bridge.hpp"
#include "frt/job.hpp"
#include "frt/logger.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace frt {

namespace {
constexpr uint32_t kWatchMask = IN_CREATE | IN_MOVED_TO | IN_CLOSE_WRITE |
                                IN_DELETE | IN_MOVED_FROM | IN_ONLYDIR;
constexpr int kPollTimeoutMs = 100;
}

InotifyBridge::InotifyBridge(const Job& job) noexcept : Bridge(job) {
}

InotifyBridge::~InotifyBridge() {
    stopWatching();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool InotifyBridge::start() {
    if (running_.load()) {
        LOG_WARN("Inotify bridge already running");
        return false;
    }

    fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
        LOG_WARN("inotify unavailable: " + std::string(std::strerror(errno)));
        return false;
    }

    std::error_code ec;
    if (std::filesystem::is_directory(job_.root(), ec)) {
        watchTree(job_.root());
    } else {
        LOG_DEBUG("No working tree to watch: " + job_.root().string());
    }

    // Anything created before the watches existed
    (void)sweep();

    shutdown_.store(false);
    running_.store(true);
    try {
        eventThread_ = std::thread(&InotifyBridge::eventLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start inotify bridge: " + std::string(e.what()));
        running_.store(false);
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    LOG_DEBUG("Inotify bridge started with " + std::to_string(watches_.size()) + " watch(es)");
    return true;
}

void InotifyBridge::stopWatching() noexcept {
    if (!running_.load()) {
        return;
    }

    shutdown_.store(true);
    if (eventThread_.joinable()) {
        eventThread_.join();
    }
    running_.store(false);

    for (const auto& watch : watches_) {
        ::inotify_rm_watch(fd_, watch.first);
    }
    watches_.clear();
    LOG_DEBUG("Inotify bridge stopped");
}

void InotifyBridge::eventLoop() {
    setThreadName("Bridge");

    while (!shutdown_.load()) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("inotify poll failed: " + std::string(std::strerror(errno)));
            break;
        }
        if (ready == 0) {
            continue;
        }

        if (!drainEvents()) {
            break;
        }
    }
}

bool InotifyBridge::drainEvents() noexcept {
    alignas(struct inotify_event) char buffer[16 * 1024];

    for (;;) {
        ssize_t length = ::read(fd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                return true;
            }
            LOG_ERROR("inotify read failed: " + std::string(std::strerror(errno)));
            return false;
        }
        if (length == 0) {
            return true;
        }

        for (char* ptr = buffer; ptr < buffer + length;) {
            auto* event = reinterpret_cast<struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                LOG_WARN("inotify queue overflow, sweeping");
                (void)sweep();
                continue;
            }
            if (event->mask & IN_IGNORED) {
                watches_.erase(event->wd);
                continue;
            }

            auto dir = watches_.find(event->wd);
            if (dir == watches_.end() || event->len == 0) {
                continue;
            }
            auto path = dir->second / event->name;

            if (event->mask & IN_ISDIR) {
                if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
                    // Files may land before the new watch is in place
                    watchTree(path);
                    (void)sweepDirectory(path);
                }
                continue;
            }

            if (event->mask & (IN_CREATE | IN_MOVED_TO | IN_CLOSE_WRITE)) {
                (void)project(path);
            } else if (event->mask & (IN_DELETE | IN_MOVED_FROM)) {
                (void)withdraw(path);
            }
        }
    }
}

void InotifyBridge::watchTree(const std::filesystem::path& dir) noexcept {
    try {
        int wd = ::inotify_add_watch(fd_, dir.c_str(), kWatchMask);
        if (wd < 0) {
            LOG_WARN("Cannot watch " + dir.string() + ": " + std::strerror(errno));
            return;
        }
        watches_[wd] = dir;

        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            std::error_code typeEc;
            if (entry.is_directory(typeEc) && !entry.is_symlink(typeEc)) {
                watchTree(entry.path());
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to watch " + dir.string() + ": " + std::string(e.what()));
    }
}

}
