// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace RNE {

/**
 * @brief Process-wide logging entry point
 *
 * All router components log through the LOG_* macros below. The backend is
 * created lazily (SpdlogBackend writing to stdout) unless one was installed
 * with setBackend() first.
 *
 * @code
 * RNE::Logger::initialize("logs");
 * LOG_INFO("Router: started at {}", state.path);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Replace the active backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    static void initialize();

    /**
     * @brief Install the spdlog backend, optionally mirroring output to logDir/rne.log
     *
     * No effect when a backend is already installed.
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void reset();

    static void setLevel(LogLevel level);

    static void log(LogLevel level, const std::string &message,
                    const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static ILoggerBackend &backend();
    static std::string callerName(const std::source_location &loc);

    static std::unique_ptr<ILoggerBackend> backend_;
};

}  // namespace RNE

#define RNE_LOG(level, ...) RNE::Logger::log(level, fmt::format(__VA_ARGS__), std::source_location::current())

#define LOG_TRACE(...) RNE_LOG(RNE::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) RNE_LOG(RNE::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) RNE_LOG(RNE::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) RNE_LOG(RNE::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) RNE_LOG(RNE::LogLevel::Error, __VA_ARGS__)
