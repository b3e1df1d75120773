// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
#include "backends/SpdlogBackend.h"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace RNE {

namespace {

constexpr const char *LOGGER_NAME = "RNE";
constexpr const char *LOG_FILE_NAME = "rne.log";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v";

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

// spdlog::level::from_str maps unknown names to off, so only an explicit "off" may turn logging off
spdlog::level::level_enum levelFromEnvironment(spdlog::level::level_enum fallback) {
    const char *value = std::getenv("SPDLOG_LEVEL");
    if (!value) {
        return fallback;
    }

    std::string name(value);
    for (char &c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (name == "error") {
        name = "err";
    }

    auto parsed = spdlog::level::from_str(name);
    return (parsed != spdlog::level::off || name == "off") ? parsed : fallback;
}

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(std::move(console));

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (std::filesystem::path(logDir) / LOG_FILE_NAME).string(), true);
        file->set_pattern(FILE_PATTERN);
        sinks.push_back(std::move(file));
    }

    // Kept out of the spdlog registry; Logger::reset() recreates a logger with the same name
    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger_->set_level(levelFromEnvironment(spdlog::level::info));
}

void SpdlogBackend::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    spdlog::source_loc where{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
    logger_->log(where, toSpdlogLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlogLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

}  // namespace RNE
