/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "frt/types.hpp"

namespace frt {

class Job;

constexpr const char* kInputFlag = "-i";

// Decides whether a command-line token names a file
using FilePredicate = std::function<bool(const std::string& token)>;

enum class PathTarget : uint8_t {
    Remote,   // rewrite into <remote-root>/<job-id>/...
    Local     // keep the resolved absolute path
};

enum class LinkResult : uint8_t {
    Created,
    Reused,
    Failed
};

struct Translation {
    std::vector<std::string> args;
    std::vector<Reference> references;
};

// Marker-prefixed tokens, or tokens whose last segment ends in '.' + letter [+ alnum...]
[[nodiscard]] FilePredicate defaultFilePredicate(const std::string& marker = "");

[[nodiscard]] bool isProtocolToken(const std::string& token) noexcept;
[[nodiscard]] bool isPathShaped(const std::string& token) noexcept;
[[nodiscard]] bool needsQuoting(const std::string& token) noexcept;
[[nodiscard]] std::string shellQuote(const std::string& token);

class Translator final {
public:
    Translator(const Job& job, FilePredicate isFile, std::string marker = "");

    Translator(const Translator&) = delete;
    Translator& operator=(const Translator&) = delete;

    [[nodiscard]] Translation translate(const std::vector<std::string>& args, PathTarget target) const;

    // Links <working path of source> -> source unless a link is already there
    [[nodiscard]] LinkResult linkForward(const std::filesystem::path& source) const noexcept;

    [[nodiscard]] std::filesystem::path resolve(const std::string& token) const;

private:
    [[nodiscard]] bool isFileToken(const std::vector<std::string>& args, std::size_t index) const;
    [[nodiscard]] bool isProbeTarget(const std::vector<std::string>& args, std::size_t index) const;

    const Job& job_;
    FilePredicate isFile_;
    std::string marker_;
};

}
