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

class GuardRegistry;
class MiddlewareChain;

/**
 * @brief Outcome of one pipeline run
 */
struct TransitionResult {
    bool success = false;
    std::optional<State> state;  // State to commit, after middleware
    std::optional<RouterError> error;
    TransitionPhase phase = TransitionPhase::Deactivating;  // Last phase reached
    TransitionSegments segments;

    static TransitionResult createSuccess(const State &state, TransitionPhase phase,
                                          const TransitionSegments &segments) {
        TransitionResult result;
        result.success = true;
        result.state = state;
        result.phase = phase;
        result.segments = segments;
        return result;
    }

    static TransitionResult createError(const RouterError &error, TransitionPhase phase,
                                        const TransitionSegments &segments) {
        TransitionResult result;
        result.success = false;
        result.error = error;
        result.phase = phase;
        result.segments = segments;
        return result;
    }
};

using TransitionCallback = std::function<void(const TransitionResult &)>;

/**
 * @brief Deactivation, activation and middleware stages of a transition
 *
 * Stages run strictly in order:
 * 1. Deactivation guards of left segments, deepest first. Skipped without a
 *    source state or with forceDeactivate.
 * 2. Activation guards of entered segments, root to leaf. Skipped for the
 *    unknown-route state.
 * 3. Middleware in registration order; a middleware may replace the state.
 * 4. Deactivation guards of segments no longer active are removed.
 *
 * The cancellation predicate is checked before every guard or middleware call,
 * after every answer, and between stages. Exceptions thrown by guards or
 * middleware are converted into errors; the callback never sees raw exceptions
 * and is invoked at most once.
 */
class TransitionPipeline {
public:
    TransitionPipeline(GuardRegistry &guards, MiddlewareChain &middleware);

    void run(const State &toState, const std::optional<State> &fromState, const NavigationOptions &options,
             CancellationPredicate isCancelled, TransitionCallback callback);

private:
    class Run;

    GuardRegistry &guards_;
    MiddlewareChain &middleware_;
};

}  // namespace RNE
