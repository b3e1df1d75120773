// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "runtime/RouterLifecycle.h"
#include "common/Logger.h"
#include "common/StateHelper.h"
#include "config/OptionsStore.h"
#include "events/INotificationSink.h"
#include "routing/IRouteResolver.h"
#include "runtime/NavigationCoordinator.h"

#include <stdexcept>

namespace RNE {

namespace {

// Reused for rejected concurrent start() calls, which never allocate a transition
const RouterError &alreadyStartedError() {
    static const RouterError error(ErrorCode::AlreadyStarted);
    return error;
}

const RouterError &noStartPathError() {
    static const RouterError error(ErrorCode::NoStartPathOrState);
    return error;
}

}  // namespace

RouterLifecycle::RouterLifecycle(std::shared_ptr<RouterStatus> status, LifecycleCapabilities capabilities,
                                 IRouteResolver &routes, OptionsStore &options, INotificationSink &notifications)
    : status_(std::move(status)), capabilities_(std::move(capabilities)), routes_(routes), options_(options),
      notifications_(notifications) {
    if (!status_) {
        throw std::invalid_argument("RouterLifecycle: router status cannot be null");
    }
    if (!capabilities_.runTransition || !capabilities_.cancelTransition || !capabilities_.clearState ||
        !capabilities_.isNavigating) {
        throw std::invalid_argument("RouterLifecycle: all lifecycle capabilities must be provided");
    }
}

void RouterLifecycle::start(NavigationCallback done) {
    startFrom(std::nullopt, std::move(done));
}

void RouterLifecycle::start(const std::string &path, NavigationCallback done) {
    startFrom(path, std::move(done));
}

void RouterLifecycle::start(const State &state, NavigationCallback done) {
    if (rejectIfRunning(done)) {
        return;
    }

    auto attempt = std::make_shared<StartAttempt>();
    attempt->done = std::move(done);

    status_->active = true;

    if (!StateHelper::isUnknownRoute(state) && !routes_.hasRoute(state.name)) {
        RouterError error(ErrorCode::RouteNotFound, fmt::format("Start state \"{}\" does not exist", state.name));
        error.withRouteName(state.name);
        handleComplete(attempt, NavigationResult::createError(error), true);
        return;
    }

    State toState = state;
    toState.meta.options = startOptions();
    performTransition(toState, attempt);
}

void RouterLifecycle::stop() {
    status_->active = false;
    adopted_ = false;
    capabilities_.cancelTransition();

    if (status_->started) {
        status_->started = false;
        capabilities_.clearState();
        options_.unlock();
        LOG_INFO("RouterLifecycle: Router stopped");
        notify(RouterEvent::RouterStop);
    }
}

bool RouterLifecycle::rejectIfRunning(const NavigationCallback &done) {
    if (status_->started || status_->active) {
        LOG_DEBUG("RouterLifecycle: start() ignored, router is already started or starting");
        safeCallback(done, NavigationResult::createError(alreadyStartedError()));
        return true;
    }
    return false;
}

void RouterLifecycle::startFrom(const std::optional<std::string> &path, NavigationCallback done) {
    if (rejectIfRunning(done)) {
        return;
    }

    auto snapshot = options_.get();
    std::string defaultRoute = snapshot->resolveDefaultRoute();

    // Checked before the router becomes active so that this common misconfiguration causes no active flip
    if (!path && defaultRoute.empty()) {
        LOG_WARN("RouterLifecycle: No start path given and no default route configured");
        notify(RouterEvent::TransitionError, std::nullopt, noStartPathError());
        safeCallback(done, NavigationResult::createError(noStartPathError()));
        return;
    }

    auto attempt = std::make_shared<StartAttempt>();
    attempt->done = std::move(done);

    status_->active = true;

    const std::string &target = path ? *path : defaultRoute;
    if (auto matched = routes_.matchPath(target)) {
        State toState = std::move(*matched);
        toState.meta.options = startOptions();
        performTransition(toState, attempt);
        return;
    }

    if (!path) {
        auto resolved = routes_.resolve(defaultRoute, snapshot->resolveDefaultParams());
        if (!resolved) {
            RouterError error(ErrorCode::RouteNotFound, fmt::format("Default route \"{}\" not found", defaultRoute));
            error.withRouteName(defaultRoute);
            handleComplete(attempt, NavigationResult::createError(error), true);
            return;
        }

        State toState = std::move(resolved->state);
        toState.meta.options = startOptions();
        performTransition(toState, attempt);
        return;
    }

    if (snapshot->allowNotFound) {
        performTransition(StateHelper::makeNotFoundState(target, startOptions()), attempt);
        return;
    }

    RouterError error(ErrorCode::RouteNotFound, fmt::format("No route matches path \"{}\"", target));
    error.withPath(target);
    handleComplete(attempt, NavigationResult::createError(error), true);
}

void RouterLifecycle::performTransition(const State &toState, const std::shared_ptr<StartAttempt> &attempt) {
    capabilities_.runTransition(toState, startOptions(), [this, attempt](const NavigationResult &result) {
        // Transition errors were already notified by the coordinator
        handleComplete(attempt, result, false);
    });
}

void RouterLifecycle::handleComplete(const std::shared_ptr<StartAttempt> &attempt, const NavigationResult &result,
                                     bool emitErrorEvent) {
    if (attempt->invoked) {
        LOG_WARN("RouterLifecycle: Start callback already invoked");
        return;
    }
    attempt->invoked = true;

    if (!result.success) {
        const RouterError &error = *result.error;

        if (supersededByNavigation(error)) {
            LOG_DEBUG("RouterLifecycle: Start transition superseded by a navigation, waiting for it to commit");
            adopted_ = true;
            safeCallback(attempt->done, result);
            return;
        }

        status_->active = false;

        if (error.isRoutine()) {
            LOG_DEBUG("RouterLifecycle: Start transition ended: {}", error.what());
        } else {
            LOG_WARN("RouterLifecycle: Router failed to start ({}): {}", RouterError::codeToString(error.getCode()),
                     error.what());
        }

        if (emitErrorEvent) {
            notify(RouterEvent::TransitionError, std::nullopt, error);
        }

        safeCallback(attempt->done, result);
        return;
    }

    markStarted(*result.state);
    notify(RouterEvent::TransitionSuccess, result.state, std::nullopt, startOptions());

    safeCallback(attempt->done, result);
}

void RouterLifecycle::onNavigationSettled(const NavigationResult &result) {
    if (!adopted_ || status_->started) {
        return;
    }

    if (result.success) {
        // The navigation already notified its own TransitionSuccess
        adopted_ = false;
        markStarted(*result.state);
        return;
    }

    // A fast failure of another request, or this navigation superseded in turn
    if (status_->active && capabilities_.isNavigating()) {
        return;
    }

    adopted_ = false;
    status_->active = false;
    LOG_DEBUG("RouterLifecycle: Navigation that replaced the start transition failed: {}", result.error->what());
}

// Only a newer navigation cancels a transition while the router stays active and busy
bool RouterLifecycle::supersededByNavigation(const RouterError &error) const {
    return error.getCode() == ErrorCode::TransitionCancelled && status_->active && capabilities_.isNavigating();
}

void RouterLifecycle::markStarted(const State &state) {
    status_->started = true;
    options_.lock();

    LOG_INFO("RouterLifecycle: Router started at '{}'", state.path);

    notify(RouterEvent::RouterStart);
}

void RouterLifecycle::notify(RouterEvent event, const std::optional<State> &toState,
                             const std::optional<RouterError> &error, const std::optional<NavigationOptions> &options) {
    RouterNotification notification;
    notification.event = event;
    notification.toState = toState;
    notification.error = error;
    notification.options = options;

    try {
        notifications_.notify(notification);
    } catch (const std::exception &e) {
        LOG_ERROR("RouterLifecycle: Notification sink failed for {}: {}", toString(event), e.what());
    }
}

NavigationOptions RouterLifecycle::startOptions() {
    NavigationOptions options;
    options.replace = true;
    return options;
}

}  // namespace RNE
