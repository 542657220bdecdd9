/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/job.hpp"
#include "frt/config.hpp"
#include "frt/logger.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace frt {

namespace {

// help, version and capability listings write no files
constexpr std::array<const char*, 22> kBypassCommands = {
    "-h", "-help", "--help", "-version", "--version", "-buildconf",
    "-formats", "-demuxers", "-muxers", "-devices", "-codecs", "-decoders",
    "-encoders", "-bsfs", "-protocols", "-filters", "-pix_fmts", "-layouts",
    "-sample_fmts", "-colors", "-hwaccels", "-L",
};

std::filesystem::path reroot(const std::filesystem::path& base, const std::filesystem::path& absolute) {
    return base / absolute.lexically_normal().relative_path();
}

}

Job::Job(JobId id, std::filesystem::path localRoot, std::filesystem::path remoteRoot,
         bool bypass, ToolKind tool)
    : id_(std::move(id)),
      root_(localRoot / id_),
      remoteRoot_(remoteRoot / id_),
      bypass_(bypass),
      tool_(tool) {
}

Job Job::create(const Config& config, const std::string& programName,
                const std::vector<std::string>& args) {
    Job job(generateId(), config.localWorkingDirectory, config.remoteWorkingDirectory,
            isBypass(args), detectTool(programName));
    LOG_DEBUG("Job " + job.id() + " root: " + job.root().string() +
              ", remote root: " + job.remoteRoot().string() +
              (job.bypass() ? ", bypass" : ""));
    return job;
}

std::filesystem::path Job::localWorkingPath(const std::filesystem::path& absolute) const {
    return reroot(root_, absolute);
}

std::filesystem::path Job::remoteWorkingPath(const std::filesystem::path& absolute) const {
    return reroot(remoteRoot_, absolute);
}

std::optional<std::filesystem::path> Job::absolutePath(const std::filesystem::path& working) const {
    auto relative = working.lexically_normal().lexically_relative(root_.lexically_normal());
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return std::nullopt;
    }
    return std::filesystem::path("/") / relative;
}

bool Job::ensureDirectories(const std::filesystem::path& dir) noexcept {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        LOG_ERROR("Failed to create directory " + dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

JobId Job::generateId() {
    std::random_device device;
    std::uniform_int_distribution<std::uint64_t> dist;

    std::stringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(16) << dist(device)
       << std::setw(16) << dist(device);
    return ss.str();
}

bool Job::isBypass(const std::vector<std::string>& args) noexcept {
    return std::any_of(args.begin(), args.end(), [](const std::string& arg) {
        return std::find(kBypassCommands.begin(), kBypassCommands.end(), arg) != kBypassCommands.end();
    });
}

ToolKind Job::detectTool(const std::string& programName) noexcept {
    auto name = std::filesystem::path(programName).filename().string();
    return name.find("ffprobe") != std::string::npos ? ToolKind::Ffprobe : ToolKind::Ffmpeg;
}

}
