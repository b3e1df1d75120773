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
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace RNE {

class GuardRegistry;

/**
 * @brief Outcome reported by a guard
 *
 * A guard may answer with a redirect target, but the pipeline reports it as a
 * rejection carrying the attempted target. Only middleware may redirect.
 */
struct GuardResult {
    bool allowed = false;
    std::optional<State> redirect;
    std::string message;

    static GuardResult allow() {
        GuardResult result;
        result.allowed = true;
        return result;
    }

    static GuardResult reject(const std::string &message = "") {
        GuardResult result;
        result.allowed = false;
        result.message = message;
        return result;
    }

    static GuardResult redirectTo(const State &target) {
        GuardResult result;
        result.allowed = false;
        result.redirect = target;
        return result;
    }
};

/**
 * @brief Completion continuation handed to a guard
 *
 * Synchronous guards call it before returning; asynchronous guards keep it and
 * call it later. Only the first call counts.
 */
using GuardCallback = std::function<void(const GuardResult &)>;

/**
 * @brief Compiled guard stored in the registry
 *
 * Throwing from a guard is treated as a rejection.
 */
using GuardFn = std::function<void(const State &toState, const std::optional<State> &fromState, GuardCallback done)>;

/**
 * @brief Factory invoked once at registration time
 *
 * Receives the registry so that it can co-register guards for other segments.
 */
using GuardFactory = std::function<GuardFn(GuardRegistry &registry)>;

/**
 * @brief Boolean shorthand or factory
 */
using GuardHandler = std::variant<bool, GuardFactory>;

using GuardPredicate = std::function<bool(const State &toState, const std::optional<State> &fromState)>;

/**
 * @brief Guard that always answers @p allowed
 */
inline GuardFn constantGuard(bool allowed) {
    return [allowed](const State &, const std::optional<State> &, GuardCallback done) {
        done(allowed ? GuardResult::allow() : GuardResult::reject());
    };
}

/**
 * @brief Wrap a synchronous predicate into a guard
 */
inline GuardFn fromPredicate(GuardPredicate predicate) {
    return [predicate = std::move(predicate)](const State &toState, const std::optional<State> &fromState,
                                              GuardCallback done) {
        done(predicate(toState, fromState) ? GuardResult::allow() : GuardResult::reject());
    };
}

/**
 * @brief Factory shorthand for a synchronous predicate
 */
inline GuardHandler predicateHandler(GuardPredicate predicate) {
    return GuardFactory([predicate = std::move(predicate)](GuardRegistry &) { return fromPredicate(predicate); });
}

}  // namespace RNE
