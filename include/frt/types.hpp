/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace frt {

// Opaque job identifier (32 lowercase hex characters).
using JobId = std::string;

enum class ReferenceKind : std::uint8_t { Forward, Reverse };

// Wrapped tool; ffprobe invocations are introspection queries.
enum class ToolKind : std::uint8_t { Ffmpeg, Ffprobe };

struct Reference {
    ReferenceKind kind = ReferenceKind::Forward;
    std::filesystem::path absolute;
    std::filesystem::path working;
};

} // namespace frt
