/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/finalizer.hpp"
#include "frt/config.hpp"
#include "frt/executor.hpp"
#include "frt/job.hpp"
#include "frt/logger.hpp"
#include "frt/runner.hpp"
#include "frt/translator.hpp"
#include <algorithm>
#include <cstdlib>
#include <initializer_list>
#include <iterator>
#include <system_error>
#include <utility>

namespace frt {

namespace {

std::size_t depthBelow(const std::filesystem::path& root, const std::filesystem::path& p) {
    auto relative = p.lexically_relative(root);
    return static_cast<std::size_t>(std::distance(relative.begin(), relative.end()));
}

}

Finalizer::Finalizer(const Job& job, const Config& config, Runner& runner, bool reapRemote) noexcept
    : job_(job), config_(config), runner_(runner), reapRemote_(reapRemote) {
}

FinalizeReport Finalizer::run() noexcept {
    FinalizeReport report;
    if (done_.exchange(true)) {
        report.skipped = true;
        return report;
    }

    if (reapRemote_) {
        report.reaped = reap();
    }
    reconcile(report);

    if (report.failures > 0) {
        LOG_WARN("Cleanup finished with " + std::to_string(report.failures) + " failure(s)");
    }
    LOG_DEBUG("Cleanup: " + std::to_string(report.unlinked) + " unlinked, " +
              std::to_string(report.promoted) + " promoted, " +
              std::to_string(report.removedDirectories) + " directories removed");
    return report;
}

void Finalizer::exit(int status) noexcept {
    (void)run();
    LOG_INFO("Cleaned up, exiting (" + std::to_string(status) + ")");
    Logger::closeFile();
    std::exit(status);
}

std::vector<std::string> Finalizer::reapCommand() const {
    std::string names;
    for (const auto* tool : {&config_.serverTools.ffmpeg, &config_.serverTools.ffprobe}) {
        auto name = std::filesystem::path(*tool).filename().string();
        if (name.empty()) {
            continue;
        }
        if (!names.empty()) names += '|';
        names += name;
    }

    auto quoted = [](const std::string& token) { return needsQuoting(token) ? shellQuote(token) : token; };

    auto command = sshCommand(config_);
    command.insert(command.end(), {"pkill", "-P1", "-u", quoted(config_.username), "-f", quoted(names)});
    return command;
}

bool Finalizer::reap() noexcept {
    try {
        StreamMapping streams;
        streams.in = -1;
        streams.out = STDERR_FILENO;

        auto command = reapCommand();
        LOG_DEBUG("Reaping remote processes: " + formatCommand(command));
        auto outcome = runner_.run(command, streams);
        // pkill exits 1 when nothing matched
        if (outcome.exitCode != 0 && outcome.exitCode != 1) {
            LOG_WARN("Remote cleanup exited with " + std::to_string(outcome.exitCode));
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Remote cleanup failed: " + std::string(e.what()));
        return false;
    }
}

void Finalizer::reconcile(FinalizeReport& report) noexcept {
    namespace fs = std::filesystem;
    const fs::path& root = job_.root();

    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(root, ec))) {
        return;
    }

    std::vector<fs::path> entries;
    try {
        fs::recursive_directory_iterator it(root, ec);
        fs::recursive_directory_iterator end;
        for (; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            LOG_ERROR("Cannot walk " + root.string() + ": " + ec.message());
            ++report.failures;
        }

        // Deepest first so directories are empty by the time they are visited
        std::stable_sort(entries.begin(), entries.end(), [&root](const fs::path& a, const fs::path& b) {
            return depthBelow(root, a) > depthBelow(root, b);
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot walk " + root.string() + ": " + std::string(e.what()));
        ++report.failures;
    }

    for (const auto& entry : entries) {
        auto status = fs::symlink_status(entry, ec);
        if (ec) {
            ++report.failures;
            continue;
        }

        if (fs::is_symlink(status)) {
            if (fs::remove(entry, ec)) {
                ++report.unlinked;
            } else {
                LOG_ERROR("Failed to remove link " + entry.string() + ": " + ec.message());
                ++report.failures;
            }
        } else if (fs::is_directory(status)) {
            if (fs::remove(entry, ec)) {
                ++report.removedDirectories;
            } else {
                LOG_ERROR("Failed to remove directory " + entry.string() + ": " + ec.message());
                ++report.failures;
            }
        } else if (fs::is_regular_file(status)) {
            auto destination = job_.absolutePath(entry);
            if (!destination) {
                ++report.failures;
                continue;
            }

            auto existing = fs::symlink_status(*destination, ec);
            if (fs::exists(existing) && !fs::is_regular_file(existing) && !fs::is_symlink(existing)) {
                // e.g. "-f null /dev/null": the caller never wanted a file there
                LOG_WARN("Not replacing " + destination->string() + ", discarding " + entry.string());
                if (fs::remove(entry, ec)) {
                    ++report.discarded;
                } else {
                    ++report.failures;
                }
            } else if (promote(entry, *destination)) {
                ++report.promoted;
            } else {
                ++report.failures;
            }
        } else {
            LOG_WARN("Leaving unexpected entry " + entry.string());
            ++report.failures;
        }
    }

    if (fs::remove(root, ec)) {
        ++report.removedDirectories;
    } else {
        LOG_ERROR("Failed to remove " + root.string() + ": " + ec.message());
        ++report.failures;
    }
}

bool Finalizer::promote(const std::filesystem::path& working, const std::filesystem::path& destination) noexcept {
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::rename(working, destination, ec);
    if (!ec) {
        LOG_DEBUG("Moved " + working.string() + " to " + destination.string());
        return true;
    }
    if (ec != std::errc::cross_device_link) {
        LOG_ERROR("Failed to move " + working.string() + " to " + destination.string() + ": " + ec.message());
        return false;
    }

    // Different filesystems: copy beside the destination, then swap it in atomically
    fs::path temp = destination;
    temp += ".frt-" + job_.id().substr(0, 8);
    fs::copy_file(working, temp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        LOG_ERROR("Failed to copy " + working.string() + " to " + temp.string() + ": " + ec.message());
        fs::remove(temp, ec);
        return false;
    }
    fs::rename(temp, destination, ec);
    if (ec) {
        LOG_ERROR("Failed to move " + temp.string() + " to " + destination.string() + ": " + ec.message());
        fs::remove(temp, ec);
        return false;
    }
    fs::remove(working, ec);
    if (ec) {
        LOG_WARN("Copied " + working.string() + " but could not remove it: " + ec.message());
    }
    return true;
}

}
