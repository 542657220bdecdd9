/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/bridge.hpp"
#include "frt/job.hpp"
#include "frt/logger.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace frt {

Bridge::Bridge(const Job& job) noexcept : job_(job) {
}

void Bridge::finish() noexcept {
    stopWatching();
    auto created = sweep();
    LOG_DEBUG("Final sweep linked " + std::to_string(created) + " output(s)");
}

std::size_t Bridge::sweep() noexcept {
    std::error_code ec;
    if (!std::filesystem::is_directory(job_.root(), ec)) {
        return 0;
    }

    std::size_t created = sweepDirectory(job_.root());

    // Withdraw reverse links whose working file has gone away
    for (const auto& absolute : linked()) {
        auto working = job_.localWorkingPath(absolute);
        if (!std::filesystem::exists(std::filesystem::symlink_status(working, ec))) {
            (void)withdraw(working);
        }
    }

    return created;
}

std::size_t Bridge::sweepDirectory(const std::filesystem::path& dir) noexcept {
    std::size_t created = 0;
    try {
        std::error_code ec;
        std::filesystem::recursive_directory_iterator it(
            dir, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec) {
            LOG_DEBUG("Cannot walk " + dir.string() + ": " + ec.message());
            return 0;
        }

        std::filesystem::recursive_directory_iterator end;
        for (; it != end; it.increment(ec)) {
            if (ec) {
                // The tree changed underneath us; the next sweep picks up the rest
                LOG_DEBUG("Sweep interrupted in " + dir.string() + ": " + ec.message());
                break;
            }
            std::error_code typeEc;
            if (it->is_symlink(typeEc)) {
                continue; // forward reference
            }
            if (it->is_regular_file(typeEc) && project(it->path())) {
                ++created;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Sweep of " + dir.string() + " failed: " + std::string(e.what()));
    }
    return created;
}

std::vector<std::filesystem::path> Bridge::linked() const {
    std::lock_guard<std::mutex> lock(linkedMutex_);
    return {linked_.begin(), linked_.end()};
}

bool Bridge::project(const std::filesystem::path& working) noexcept {
    try {
        std::error_code ec;
        auto status = std::filesystem::symlink_status(working, ec);
        if (ec || status.type() != std::filesystem::file_type::regular) {
            return false;
        }

        auto absolute = job_.absolutePath(working);
        if (!absolute) {
            return false;
        }

        std::lock_guard<std::mutex> lock(linkedMutex_);
        if (linked_.count(*absolute) > 0) {
            return false;
        }

        // Anything at the destination, even a dangling link, is left alone
        auto destination = std::filesystem::symlink_status(*absolute, ec);
        if (std::filesystem::exists(destination)) {
            LOG_TRACE("Destination already present: " + absolute->string());
            return false;
        }
        if (!std::filesystem::is_directory(absolute->parent_path(), ec)) {
            LOG_DEBUG("Destination directory missing for " + absolute->string());
            return false;
        }

        std::filesystem::create_symlink(working, *absolute, ec);
        if (ec) {
            LOG_ERROR("Failed to link output " + absolute->string() + ": " + ec.message());
            return false;
        }

        linked_.insert(*absolute);
        LOG_INFO("Linked output " + absolute->string() + " -> " + working.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to project " + working.string() + ": " + std::string(e.what()));
        return false;
    }
}

bool Bridge::withdraw(const std::filesystem::path& working) noexcept {
    try {
        auto absolute = job_.absolutePath(working);
        if (!absolute) {
            return false;
        }

        std::lock_guard<std::mutex> lock(linkedMutex_);
        auto it = linked_.find(*absolute);
        if (it == linked_.end()) {
            return false;
        }
        linked_.erase(it);

        // Only remove the link if it is still the one we created
        std::error_code ec;
        if (std::filesystem::is_symlink(*absolute, ec) &&
            std::filesystem::read_symlink(*absolute, ec) == working) {
            std::filesystem::remove(*absolute, ec);
            if (ec) {
                LOG_ERROR("Failed to remove output link " + absolute->string() + ": " + ec.message());
                return false;
            }
            LOG_INFO("Removed output link " + absolute->string());
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to withdraw " + working.string() + ": " + std::string(e.what()));
        return false;
    }
}

BridgeKind parseBridgeKind(const std::string& name) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "poll" || lower == "polling") {
        return BridgeKind::Polling;
    }
    if (lower != "inotify") {
        LOG_WARN("Unknown bridge strategy '" + name + "', using polling");
        return BridgeKind::Polling;
    }
    return BridgeKind::Inotify;
}

std::unique_ptr<Bridge> makeBridge(BridgeKind kind, const Job& job, std::chrono::milliseconds interval) {
    switch (kind) {
        case BridgeKind::Inotify:
            return std::make_unique<InotifyBridge>(job);
        case BridgeKind::Polling:
        default:
            return std::make_unique<PollingBridge>(job, interval);
    }
}

}
