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
#include "runtime/CancellationToken.h"
#include "runtime/NavigationResult.h"
#include "runtime/RouterStatus.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace RNE {

class IRouteResolver;
class INotificationSink;
class OptionsStore;
class TransitionPipeline;
struct TransitionResult;

/**
 * @brief Intake, supersession and commit of navigation requests
 *
 * Navigation is last-writer-wins: starting a transition while another is
 * outstanding cancels the outstanding one, which settles immediately as
 * TransitionCancelled. Answers its guards or middleware produce later are
 * discarded. Each accepted request settles exactly once with exactly one
 * terminal notification.
 *
 * The coordinator owns the committed state. It does not know about the
 * lifecycle; it only reads the shared RouterStatus.
 */
class NavigationCoordinator {
public:
    NavigationCoordinator(std::shared_ptr<RouterStatus> status, IRouteResolver &routes, TransitionPipeline &pipeline,
                          INotificationSink &notifications, OptionsStore &options);

    ~NavigationCoordinator();

    NavigationCoordinator(const NavigationCoordinator &) = delete;
    NavigationCoordinator &operator=(const NavigationCoordinator &) = delete;

    /**
     * @brief Navigate to a route by name
     *
     * Fails with RouterNotStarted (no notification) when the router is not
     * active, RouteNotFound when the route cannot be resolved, and SameStates
     * when the target equals the current state and neither reload nor force
     * is set.
     */
    void navigate(const std::string &name, const Params &params, const NavigationOptions &options,
                  NavigationCallback callback);

    /**
     * @brief Navigate to the configured default route with the default params
     */
    void navigateToDefault(const NavigationOptions &options, NavigationCallback callback);

    /**
     * @brief Run a prepared state through the pipeline and commit it
     *
     * @param emitSuccess Whether TransitionSuccess is notified on commit
     */
    void navigateToState(const State &toState, const std::optional<State> &fromState,
                         const NavigationOptions &options, bool emitSuccess, NavigationCallback callback);

    /**
     * @brief Cancel the outstanding transition, if any
     * @return true when a transition was cancelled
     */
    bool cancel();

    bool isNavigating() const;

    const std::optional<State> &getState() const {
        return state_;
    }

    void clearState() {
        state_.reset();
    }

private:
    struct PendingNavigation {
        std::uint64_t id = 0;
        CancellationToken token;
        State toState;
        std::optional<State> fromState;
        NavigationOptions options;
        bool emitSuccess = true;
        NavigationCallback callback;
        std::chrono::steady_clock::time_point startedAt;
        bool settled = false;

        explicit PendingNavigation(std::shared_ptr<const RouterStatus> status) : token(std::move(status)) {}
    };

    void onTransitionDone(const std::shared_ptr<PendingNavigation> &navigation, const TransitionResult &result);
    void commit(PendingNavigation &navigation, const TransitionResult &result);
    void settleCancelled(PendingNavigation &navigation);
    void routeError(const RouterError &error, const State &toState, const std::optional<State> &fromState);

    void notify(RouterEvent event, const std::optional<State> &toState, const std::optional<State> &fromState,
                const std::optional<RouterError> &error = std::nullopt,
                const std::optional<NavigationOptions> &options = std::nullopt);
    void fail(const NavigationCallback &callback, const RouterError &error);

    std::shared_ptr<RouterStatus> status_;
    IRouteResolver &routes_;
    TransitionPipeline &pipeline_;
    INotificationSink &notifications_;
    OptionsStore &options_;

    std::optional<State> state_;
    std::shared_ptr<PendingNavigation> current_;
    std::uint64_t nextId_ = 1;
};

/**
 * @brief Invoke a completion callback, logging anything it throws
 */
void safeCallback(const NavigationCallback &callback, const NavigationResult &result);

}  // namespace RNE
