/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <string>
#include <utility>

#include "frt/logger.hpp"

namespace frt {

constexpr const char* kDefaultConfigPath = "/etc/frt.conf";

struct ToolPaths {
    std::string ffmpeg = "/usr/bin/ffmpeg";
    std::string ffprobe = "/usr/bin/ffprobe";
};

struct Config {
    // [Server]
    std::string host;
    std::string username;
    std::string identityFile;
    std::filesystem::path remoteWorkingDirectory;
    ToolPaths serverTools;

    // [Client]
    std::filesystem::path localWorkingDirectory = "/opt/frt/";
    ToolPaths clientTools;
    std::string sshPath = "ssh";
    std::string fileMarker;
    std::string bridge = "inotify";
    std::chrono::milliseconds pollInterval{250};
    std::chrono::milliseconds killTimeout{5000};

    // [Logging]
    std::filesystem::path logFile = "/var/log/frt.log";
    LogLevel logLevel = LogLevel::INFO;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Section/Key -> value, as read from an INI file
using IniValues = std::map<std::pair<std::string, std::string>, std::string>;

class ConfigLoader final {
public:
    // Reads FRT_CONFIG, falling back to /etc/frt.conf
    [[nodiscard]] static ConfigResult load();
    [[nodiscard]] static ConfigResult load(const std::filesystem::path& path);
    [[nodiscard]] static ConfigResult fromValues(IniValues values);

    [[nodiscard]] static bool parseIni(std::istream& in, IniValues& values, std::string& error);

private:
    static void applyEnvironment(IniValues& values);
    [[nodiscard]] static std::string envName(const std::string& section, const std::string& key);
};

}
