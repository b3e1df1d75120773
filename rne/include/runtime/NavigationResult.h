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
#include "common/RouterError.h"
#include <functional>
#include <optional>

namespace RNE {

/**
 * @brief Outcome of navigate(), navigateToDefault() and start()
 */
struct NavigationResult {
    bool success = false;
    std::optional<State> state;  // Committed state on success
    std::optional<RouterError> error;

    static NavigationResult createSuccess(const State &state) {
        NavigationResult result;
        result.success = true;
        result.state = state;
        return result;
    }

    static NavigationResult createError(const RouterError &error) {
        NavigationResult result;
        result.success = false;
        result.error = error;
        return result;
    }
};

/**
 * @brief Completion callback, invoked exactly once per call
 *
 * Exceptions thrown from the callback are caught and logged.
 */
using NavigationCallback = std::function<void(const NavigationResult &)>;

}  // namespace RNE
