/*
 * frt - Remote Transcoding Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "frt/translator.hpp"
#include "frt/job.hpp"
#include "frt/logger.hpp"
#include <cctype>
#include <regex>
#include <system_error>
#include <utility>

namespace frt {

namespace {

bool hasPrefix(const std::string& value, const std::string& prefix) {
    return !prefix.empty() && value.size() > prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool isOption(const std::string& token) {
    return token.size() > 1 && token[0] == '-';
}

std::string lastSegment(const std::string& token) {
    auto slash = token.find_last_of('/');
    return slash == std::string::npos ? token : token.substr(slash + 1);
}

}

FilePredicate defaultFilePredicate(const std::string& marker) {
    // A digit right after the dot is a number or timestamp, not an extension
    static const std::regex extension(R"(\.[A-Za-z][A-Za-z0-9]*$)");

    return [marker](const std::string& token) {
        if (hasPrefix(token, marker)) {
            return true;
        }
        // Option values such as filter graphs and metadata carry '='
        if (!isPathShaped(token) || token.find('=') != std::string::npos) {
            return false;
        }
        return std::regex_search(lastSegment(token), extension);
    };
}

bool isProtocolToken(const std::string& token) noexcept {
    if (token.find("://") != std::string::npos) {
        return true;
    }
    // scheme:rest (pipe:1, concat:a|b, tcp:...) before any path separator
    auto colon = token.find(':');
    if (colon == std::string::npos || colon == 0 || !std::isalpha(static_cast<unsigned char>(token[0]))) {
        return false;
    }
    for (std::size_t i = 1; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(token[i]);
        if (!std::isalnum(c) && c != '+' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

bool isPathShaped(const std::string& token) noexcept {
    return !token.empty() && token != "-" && token[0] != '-' && !isProtocolToken(token);
}

bool needsQuoting(const std::string& token) noexcept {
    if (token.empty()) {
        return true;
    }
    return token.find_first_of(" \t\n*?()|[]{}<>;&$`'\"\\!#~") != std::string::npos;
}

std::string shellQuote(const std::string& token) {
    std::string quoted = "'";
    for (char c : token) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

Translator::Translator(const Job& job, FilePredicate isFile, std::string marker)
    : job_(job), isFile_(std::move(isFile)), marker_(std::move(marker)) {
    if (!isFile_) {
        isFile_ = defaultFilePredicate(marker_);
    }
}

Translation Translator::translate(const std::vector<std::string>& args, PathTarget target) const {
    Translation result;
    result.args.reserve(args.size());

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string token = args[i];

        if (isFileToken(args, i)) {
            auto absolute = resolve(token);
            auto working = job_.localWorkingPath(absolute);
            (void)Job::ensureDirectories(working.parent_path());

            bool input = (i > 0 && args[i - 1] == kInputFlag) || isProbeTarget(args, i);

            if (input) {
                if (linkForward(absolute) != LinkResult::Failed) {
                    result.references.push_back({ReferenceKind::Forward, absolute, working});
                }
            } else {
                // Outputs do not exist yet; the bridge links them back once they appear
                result.references.push_back({ReferenceKind::Reverse, absolute, working});
            }

            token = target == PathTarget::Remote ? job_.remoteWorkingPath(absolute).string()
                                                 : absolute.string();
            LOG_DEBUG("Rewrote " + args[i] + " -> " + token);
        }

        if (target == PathTarget::Remote && needsQuoting(token)) {
            token = shellQuote(token);
        }
        result.args.push_back(std::move(token));
    }

    return result;
}

LinkResult Translator::linkForward(const std::filesystem::path& source) const noexcept {
    try {
        auto working = job_.localWorkingPath(source);
        if (!Job::ensureDirectories(working.parent_path())) {
            return LinkResult::Failed;
        }

        std::error_code ec;
        auto status = std::filesystem::symlink_status(working, ec);
        if (status.type() == std::filesystem::file_type::symlink) {
            LOG_INFO("Using existing link " + working.string());
            return LinkResult::Reused;
        }
        if (std::filesystem::exists(status)) {
            LOG_ERROR("Working path occupied by a non-link: " + working.string());
            return LinkResult::Failed;
        }

        if (!std::filesystem::exists(source, ec)) {
            LOG_WARN("Input does not exist: " + source.string());
        }

        std::filesystem::create_symlink(source, working, ec);
        if (ec) {
            if (ec == std::errc::file_exists) {
                LOG_INFO("Using existing link " + working.string());
                return LinkResult::Reused;
            }
            LOG_ERROR("Failed to link " + working.string() + " -> " + source.string() + ": " + ec.message());
            return LinkResult::Failed;
        }

        LOG_INFO("Created link " + working.string() + " -> " + source.string());
        return LinkResult::Created;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to link " + source.string() + ": " + std::string(e.what()));
        return LinkResult::Failed;
    }
}

std::filesystem::path Translator::resolve(const std::string& token) const {
    std::string value = hasPrefix(token, marker_) ? token.substr(marker_.size()) : token;

    std::error_code ec;
    auto absolute = std::filesystem::absolute(value, ec);
    if (ec) {
        LOG_WARN("Cannot resolve " + value + ": " + ec.message());
        return std::filesystem::path(value).lexically_normal();
    }
    return absolute.lexically_normal();
}

bool Translator::isFileToken(const std::vector<std::string>& args, std::size_t index) const {
    const auto& token = args[index];
    if (isFile_(token)) {
        return true;
    }
    if (!isPathShaped(token)) {
        return false;
    }
    if (index > 0 && args[index - 1] == kInputFlag) {
        return true;
    }

    // ffprobe positional inputs need no extension as long as they exist
    std::error_code ec;
    if (job_.introspection() && !job_.bypass() && std::filesystem::exists(resolve(token), ec)) {
        return true;
    }

    // The final token names the destination unless it is the value of an option
    bool last = index + 1 == args.size();
    bool optionValue = index > 0 && isOption(args[index - 1]);
    return last && !job_.bypass() && !optionValue;
}

// For ffprobe every file token is read, not written: the final one and any other
// naming an existing file, except the value of -o
bool Translator::isProbeTarget(const std::vector<std::string>& args, std::size_t index) const {
    if (!job_.introspection() || job_.bypass()) {
        return false;
    }
    if (index > 0 && args[index - 1] == "-o") {
        return false;
    }
    if (index + 1 == args.size()) {
        return true;
    }

    std::error_code ec;
    return isPathShaped(args[index]) && std::filesystem::exists(resolve(args[index]), ec);
}

}
