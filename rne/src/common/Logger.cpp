// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <mutex>
#include <string_view>

namespace RNE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {

// Routers may live on different threads (one per request); backend swaps are serialized
std::mutex &backendMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex());
    backend_ = std::move(backend);
}

void Logger::initialize() {
    initialize("", false);
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex());
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(backendMutex());
    backend_.reset();
}

void Logger::setLevel(LogLevel level) {
    backend().setLevel(level);
}

void Logger::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    backend().log(level, callerName(loc) + "() - " + message, loc);
}

void Logger::flush() {
    backend().flush();
}

ILoggerBackend &Logger::backend() {
    if (!backend_) {
        initialize();
    }
    return *backend_;
}

// "void RNE::GuardRegistry::clear(RNE::GuardKind, ...)" -> "RNE::GuardRegistry::clear"
std::string Logger::callerName(const std::source_location &loc) {
    std::string_view signature = loc.function_name();

    std::size_t argsBegin = signature.find('(');
    if (argsBegin == std::string_view::npos) {
        return "UnknownFunction";
    }

    // Walk back to the space that ends the return type, stepping over template arguments
    std::size_t nameBegin = argsBegin;
    int depth = 0;
    while (nameBegin > 0) {
        char c = signature[nameBegin - 1];
        if (c == '>') {
            ++depth;
        } else if (c == '<') {
            --depth;
        } else if (c == ' ' && depth == 0) {
            break;
        }
        --nameBegin;
    }

    std::string name;
    depth = 0;
    for (char c : signature.substr(nameBegin, argsBegin - nameBegin)) {
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0 && c != '*' && c != '&' && c != ' ') {
            name += c;
        }
    }

    return name.empty() ? "UnknownFunction" : name;
}

}  // namespace RNE
