// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
#pragma once

#include <source_location>
#include <string>

namespace RNE {

enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Sink for every diagnostic the router emits
 *
 * The default implementation is SpdlogBackend. Hosts install their own with
 * Logger::setBackend() to merge router diagnostics into an existing log, and
 * the unit tests install one that records messages for assertions.
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param message Already formatted, prefixed with the calling function
     * @param loc Call site of the LOG_* macro
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace RNE
