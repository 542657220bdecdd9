/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "frt/types.hpp"

namespace frt {

struct Config;

// One invocation: identifier, working roots and the flags derived from the command line.
// The job exclusively owns <local-root>/<id>; nothing in it changes after creation.
class Job final {
public:
    Job(JobId id, std::filesystem::path localRoot, std::filesystem::path remoteRoot,
        bool bypass, ToolKind tool);

    [[nodiscard]] static Job create(const Config& config, const std::string& programName,
                                    const std::vector<std::string>& args);

    [[nodiscard]] const JobId& id() const noexcept { return id_; }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] const std::filesystem::path& remoteRoot() const noexcept { return remoteRoot_; }
    [[nodiscard]] bool bypass() const noexcept { return bypass_; }
    [[nodiscard]] ToolKind tool() const noexcept { return tool_; }
    [[nodiscard]] bool introspection() const noexcept { return tool_ == ToolKind::Ffprobe; }

    [[nodiscard]] std::filesystem::path localWorkingPath(const std::filesystem::path& absolute) const;
    [[nodiscard]] std::filesystem::path remoteWorkingPath(const std::filesystem::path& absolute) const;

    // Inverse of localWorkingPath; empty when the path is outside the job root
    [[nodiscard]] std::optional<std::filesystem::path> absolutePath(const std::filesystem::path& working) const;

    static bool ensureDirectories(const std::filesystem::path& dir) noexcept;

    [[nodiscard]] static JobId generateId();
    [[nodiscard]] static bool isBypass(const std::vector<std::string>& args) noexcept;
    [[nodiscard]] static ToolKind detectTool(const std::string& programName) noexcept;

private:
    JobId id_;
    std::filesystem::path root_;
    std::filesystem::path remoteRoot_;
    bool bypass_;
    ToolKind tool_;
};

}
