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
#include "runtime/NavigationResult.h"
#include "runtime/RouterStatus.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace RNE {

class IRouteResolver;
class INotificationSink;
class OptionsStore;

/**
 * @brief Narrow view of the navigation coordinator used by the lifecycle
 */
struct LifecycleCapabilities {
    // Runs a prepared state from no source state, without TransitionSuccess
    std::function<void(const State &toState, const NavigationOptions &options, NavigationCallback callback)>
        runTransition;
    std::function<bool()> cancelTransition;
    std::function<void()> clearState;
    std::function<bool()> isNavigating;
};

/**
 * @brief STOPPED -> STARTING -> STARTED state machine of a router
 *
 * start() is two-phase: the router becomes active immediately so that the
 * start transition is not treated as cancelled, but it only becomes started,
 * locks its options and notifies RouterStart once that transition commits.
 * A failed start leaves the router fully stopped.
 *
 * A navigation that supersedes the start transition takes it over: the
 * router stays active and becomes started when that navigation commits.
 */
class RouterLifecycle {
public:
    RouterLifecycle(std::shared_ptr<RouterStatus> status, LifecycleCapabilities capabilities, IRouteResolver &routes,
                    OptionsStore &options, INotificationSink &notifications);

    /**
     * @brief Start at the default route
     */
    void start(NavigationCallback done);

    /**
     * @brief Start at @p path; an unmatched explicit path never falls back to the default route
     */
    void start(const std::string &path, NavigationCallback done);

    /**
     * @brief Start at an already resolved state
     */
    void start(const State &state, NavigationCallback done);

    /**
     * @brief Cancel any transition and return to STOPPED; idempotent
     */
    void stop();

    /**
     * @brief Report the outcome of a caller-issued navigation
     *
     * Completes or abandons a start that was taken over by a navigation.
     */
    void onNavigationSettled(const NavigationResult &result);

    bool isStarted() const {
        return status_->started;
    }

    bool isActive() const {
        return status_->active;
    }

private:
    struct StartAttempt {
        NavigationCallback done;
        bool invoked = false;
    };

    bool rejectIfRunning(const NavigationCallback &done);
    void startFrom(const std::optional<std::string> &path, NavigationCallback done);
    void performTransition(const State &toState, const std::shared_ptr<StartAttempt> &attempt);
    bool supersededByNavigation(const RouterError &error) const;
    void markStarted(const State &state);
    void handleComplete(const std::shared_ptr<StartAttempt> &attempt, const NavigationResult &result,
                        bool emitErrorEvent);
    void notify(RouterEvent event, const std::optional<State> &toState = std::nullopt,
                const std::optional<RouterError> &error = std::nullopt,
                const std::optional<NavigationOptions> &options = std::nullopt);

    static NavigationOptions startOptions();

    std::shared_ptr<RouterStatus> status_;
    LifecycleCapabilities capabilities_;
    IRouteResolver &routes_;
    OptionsStore &options_;
    INotificationSink &notifications_;

    // Start transition was superseded; the navigation that replaced it finishes the start
    bool adopted_ = false;
};

}  // namespace RNE
