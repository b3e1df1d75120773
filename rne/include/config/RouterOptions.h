// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include "RNETypes.h"
#include "common/Constants.h"
#include <cstddef>
#include <functional>
#include <string>

namespace RNE {

/**
 * @brief Registry ceilings and diagnostic thresholds
 *
 * A ceiling of 0 disables the corresponding check.
 */
struct RouterLimits {
    std::size_t maxLifecycleHandlers = Constants::DEFAULT_MAX_LIFECYCLE_HANDLERS;
    std::size_t lifecycleWarnThreshold = Constants::DEFAULT_LIFECYCLE_WARN_THRESHOLD;
    std::size_t lifecycleErrorThreshold = Constants::DEFAULT_LIFECYCLE_ERROR_THRESHOLD;
    std::size_t maxMiddleware = Constants::DEFAULT_MAX_MIDDLEWARE;
    std::size_t middlewareWarnThreshold = Constants::DEFAULT_MIDDLEWARE_WARN_THRESHOLD;
    std::size_t middlewareErrorThreshold = Constants::DEFAULT_MIDDLEWARE_ERROR_THRESHOLD;
};

/**
 * @brief Router configuration snapshot
 *
 * Providers, when set, take precedence over the static values and are
 * evaluated each time a default route is needed.
 */
struct RouterOptions {
    std::string defaultRoute;
    std::function<std::string()> defaultRouteProvider;
    Params defaultParams;
    std::function<Params()> defaultParamsProvider;
    bool allowNotFound = false;
    bool ignoreQueryParams = false;
    RouterLimits limits;

    std::string resolveDefaultRoute() const {
        return defaultRouteProvider ? defaultRouteProvider() : defaultRoute;
    }

    Params resolveDefaultParams() const {
        return defaultParamsProvider ? defaultParamsProvider() : defaultParams;
    }
};

}  // namespace RNE
