/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/config.hpp"
#include "frt/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <istream>

namespace frt {

namespace {

struct KeySpec {
    const char* section;
    const char* key;
    bool required;
};

constexpr std::array<KeySpec, 16> kKeys = {{
    {"Server", "Host", true},
    {"Server", "Username", true},
    {"Server", "WorkingDirectory", true},
    {"Server", "IdentityFile", false},
    {"Server", "FfmpegPath", false},
    {"Server", "FfprobePath", false},
    {"Client", "WorkingDirectory", false},
    {"Client", "FfmpegPath", false},
    {"Client", "FfprobePath", false},
    {"Client", "SshPath", false},
    {"Client", "FileMarker", false},
    {"Client", "Bridge", false},
    {"Client", "PollInterval", false},
    {"Client", "KillTimeout", false},
    {"Logging", "LogFile", false},
    {"Logging", "LogLevel", false},
}};

std::string trim(std::string value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

const std::string* lookup(const IniValues& values, const char* section, const char* key) {
    auto it = values.find({section, key});
    if (it == values.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

void assign(const IniValues& values, const char* section, const char* key, std::string& out) {
    if (auto value = lookup(values, section, key)) {
        out = *value;
    }
}

void assignMillis(const IniValues& values, const char* section, const char* key,
                  std::chrono::milliseconds& out) {
    auto value = lookup(values, section, key);
    if (!value) {
        return;
    }
    try {
        long long parsed = std::stoll(*value);
        if (parsed <= 0) {
            LOG_WARN(std::string("Ignoring non-positive ") + section + "/" + key + ": " + *value);
            return;
        }
        out = std::chrono::milliseconds(parsed);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring malformed ") + section + "/" + key + ": " + *value);
    }
}

}

ConfigResult ConfigLoader::load() {
    const char* env = std::getenv("FRT_CONFIG");
    return load(env && *env ? std::filesystem::path(env) : std::filesystem::path(kDefaultConfigPath));
}

ConfigResult ConfigLoader::load(const std::filesystem::path& path) {
    IniValues values;

    std::ifstream file(path);
    if (file) {
        std::string error;
        if (!parseIni(file, values, error)) {
            return {false, {}, path.string() + ": " + error};
        }
    } else {
        // The environment may still carry the whole configuration
        LOG_DEBUG("Configuration file not readable: " + path.string());
    }

    applyEnvironment(values);
    return fromValues(std::move(values));
}

ConfigResult ConfigLoader::fromValues(IniValues values) {
    for (const auto& option : kKeys) {
        if (option.required && !lookup(values, option.section, option.key)) {
            return {false, {}, std::string("Missing required configuration option ") +
                                   option.section + "/" + option.key};
        }
    }

    Config config;
    assign(values, "Server", "Host", config.host);
    assign(values, "Server", "Username", config.username);
    assign(values, "Server", "IdentityFile", config.identityFile);
    assign(values, "Server", "FfmpegPath", config.serverTools.ffmpeg);
    assign(values, "Server", "FfprobePath", config.serverTools.ffprobe);
    config.remoteWorkingDirectory = *lookup(values, "Server", "WorkingDirectory");

    if (auto dir = lookup(values, "Client", "WorkingDirectory")) {
        config.localWorkingDirectory = *dir;
    }
    assign(values, "Client", "FfmpegPath", config.clientTools.ffmpeg);
    assign(values, "Client", "FfprobePath", config.clientTools.ffprobe);
    assign(values, "Client", "SshPath", config.sshPath);
    assign(values, "Client", "FileMarker", config.fileMarker);
    assign(values, "Client", "Bridge", config.bridge);
    assignMillis(values, "Client", "PollInterval", config.pollInterval);
    assignMillis(values, "Client", "KillTimeout", config.killTimeout);

    if (auto logFile = lookup(values, "Logging", "LogFile")) {
        config.logFile = *logFile;
    }
    if (auto level = lookup(values, "Logging", "LogLevel")) {
        if (!Logger::parseLevel(*level, config.logLevel)) {
            LOG_WARN("Unknown log level '" + *level + "', using INFO");
            config.logLevel = LogLevel::INFO;
        }
    }

    return {true, std::move(config), ""};
}

bool ConfigLoader::parseIni(std::istream& in, IniValues& values, std::string& error) {
    std::string section;
    std::string line;
    int lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                error = "line " + std::to_string(lineNumber) + ": unterminated section header";
                return false;
            }
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto sep = line.find_first_of("=:");
        if (sep == std::string::npos) {
            error = "line " + std::to_string(lineNumber) + ": expected key = value";
            return false;
        }
        if (section.empty()) {
            error = "line " + std::to_string(lineNumber) + ": option outside of a section";
            return false;
        }

        std::string key = trim(line.substr(0, sep));
        std::string value = trim(line.substr(sep + 1));
        if (key.empty()) {
            error = "line " + std::to_string(lineNumber) + ": empty key";
            return false;
        }
        values[{section, key}] = value;
    }

    return true;
}

void ConfigLoader::applyEnvironment(IniValues& values) {
    for (const auto& option : kKeys) {
        const char* env = std::getenv(envName(option.section, option.key).c_str());
        if (env && *env) {
            values[{option.section, option.key}] = env;
        }
    }
}

std::string ConfigLoader::envName(const std::string& section, const std::string& key) {
    std::string name = "FRT_" + section + "_" + key;
    std::transform(name.begin(), name.end(), name.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return name;
}

}
