/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace frt {

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static std::unordered_map<std::thread::id, std::string> g_thread_names;
static std::ofstream g_file;

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = parseEnvLevel();
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

bool Logger::setFile(const std::filesystem::path& path) noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (g_file.is_open()) {
            g_file.close();
        }
        g_file.clear();
        g_file.open(path, std::ios::app);
        return g_file.is_open();
    } catch (const std::exception& e) {
        std::cerr << "frt: cannot open log file " << path << ": " << e.what() << std::endl;
        return false;
    }
}

void Logger::closeFile() noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (g_file.is_open()) {
            g_file.close();
        }
    } catch (const std::exception& e) {
        std::cerr << "frt: cannot close log file: " << e.what() << std::endl;
    }
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return; // Skip if below threshold
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::string thread_info;
        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            auto tid = std::this_thread::get_id();
            auto it = g_thread_names.find(tid);
            if (it != g_thread_names.end()) {
                thread_info = it->second;
            } else {
                std::ostringstream oss;
                oss << "T" << tid;
                thread_info = oss.str();
            }
        }

        std::stringstream ss;
        ss << "[" << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "]";
        ss << " [" << thread_info << "]";
        ss << " " << message;

        {
            // Log file when configured, stderr otherwise
            std::lock_guard<std::mutex> lock(g_log_mutex);
            if (g_file.is_open()) {
                g_file << ss.str() << std::endl;
            } else {
                std::cerr << ss.str() << std::endl;
            }
        }
    } catch (const std::exception& e) {
        // Never throw from logging
        std::fprintf(stderr, "frt: logging failed: %s\n", e.what());
    }
}

bool Logger::parseLevel(const std::string& text, LogLevel& level) noexcept {
    std::string level_str(text);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") { level = LogLevel::ERROR; return true; }
    if (level_str == "warn" || level_str == "warning") { level = LogLevel::WARN; return true; }
    if (level_str == "info") { level = LogLevel::INFO; return true; }
    if (level_str == "debug") { level = LogLevel::DEBUG; return true; }
    if (level_str == "trace") { level = LogLevel::TRACE; return true; }
    return false;
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("FRT_LOG_LEVEL");
    LogLevel parsed = LogLevel::INFO;
    if (env_val && parseLevel(env_val, parsed)) {
        return parsed;
    }
    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

}
