// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include <cstddef>

namespace RNE::Constants {

// ============================================================================
// Route naming
// ============================================================================

/**
 * @brief Reserved route name for not-found states
 *
 * Activation guards never run for this route and it is always considered
 * present when a transition commits.
 */
constexpr const char *UNKNOWN_ROUTE = "@@rne/UNKNOWN_ROUTE";

constexpr char SEGMENT_SEPARATOR = '.';

/**
 * @brief Param key carrying the unmatched path on not-found states
 */
constexpr const char *UNKNOWN_ROUTE_PATH_PARAM = "path";

// ============================================================================
// Registry limits
// ============================================================================

// Lifecycle guards (activation + deactivation entries combined)
constexpr std::size_t DEFAULT_MAX_LIFECYCLE_HANDLERS = 200;
constexpr std::size_t DEFAULT_LIFECYCLE_WARN_THRESHOLD = 50;
constexpr std::size_t DEFAULT_LIFECYCLE_ERROR_THRESHOLD = 100;

// Middleware chain
constexpr std::size_t DEFAULT_MAX_MIDDLEWARE = 50;
constexpr std::size_t DEFAULT_MIDDLEWARE_WARN_THRESHOLD = 15;
constexpr std::size_t DEFAULT_MIDDLEWARE_ERROR_THRESHOLD = 30;

// ============================================================================
// Diagnostics
// ============================================================================

constexpr const char *GUARD_REDIRECT_NOT_ALLOWED = "Guards cannot redirect. Use middleware for redirects.";

constexpr const char *CONCURRENT_NAVIGATION_WARNING =
    "Concurrent navigation detected on shared router instance. "
    "For server-side rendering, create an isolated router per request.";

}  // namespace RNE::Constants
