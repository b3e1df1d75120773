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
#include <spdlog/spdlog.h>
#include <string>

namespace RNE {

/**
 * @brief Default Logger backend writing through one spdlog logger
 *
 * Console output is always on; a file sink is added when a log directory is
 * given. The initial level is info unless SPDLOG_LEVEL names another one.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace RNE
