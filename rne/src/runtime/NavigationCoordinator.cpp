// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "runtime/NavigationCoordinator.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/SegmentHelper.h"
#include "common/StateHelper.h"
#include "config/OptionsStore.h"
#include "events/INotificationSink.h"
#include "routing/IRouteResolver.h"
#include "runtime/TransitionPipeline.h"

#include <stdexcept>

namespace RNE {

void safeCallback(const NavigationCallback &callback, const NavigationResult &result) {
    if (!callback) {
        return;
    }

    try {
        callback(result);
    } catch (const std::exception &e) {
        LOG_ERROR("NavigationCoordinator: Error in navigation callback: {}", e.what());
    } catch (...) {
        LOG_ERROR("NavigationCoordinator: Unknown error in navigation callback");
    }
}

NavigationCoordinator::NavigationCoordinator(std::shared_ptr<RouterStatus> status, IRouteResolver &routes,
                                             TransitionPipeline &pipeline, INotificationSink &notifications,
                                             OptionsStore &options)
    : status_(std::move(status)), routes_(routes), pipeline_(pipeline), notifications_(notifications),
      options_(options) {
    if (!status_) {
        throw std::invalid_argument("NavigationCoordinator: router status cannot be null");
    }
}

NavigationCoordinator::~NavigationCoordinator() {
    // Outstanding pipeline runs hold only a weak reference to their record
    if (current_) {
        current_->token.cancel();
    }
}

void NavigationCoordinator::navigate(const std::string &name, const Params &params, const NavigationOptions &options,
                                     NavigationCallback callback) {
    if (!status_->active) {
        LOG_WARN("NavigationCoordinator: Router is not started");
        fail(callback, RouterError(ErrorCode::RouterNotStarted));
        return;
    }

    auto resolved = routes_.resolve(name, params);
    if (!resolved) {
        RouterError error(ErrorCode::RouteNotFound, fmt::format("Route \"{}\" not found", name));
        error.withRouteName(name);
        LOG_WARN("NavigationCoordinator: {}", error.what());
        notify(RouterEvent::TransitionError, std::nullopt, state_, error);
        fail(callback, error);
        return;
    }

    State toState = std::move(resolved->state);
    toState.meta.options = options;
    toState.meta.redirected = options.redirected;

    auto snapshot = options_.get();
    if (!options.reload && !options.force && state_ &&
        routes_.statesEqual(*state_, toState, snapshot->ignoreQueryParams)) {
        RouterError error(ErrorCode::SameStates);
        LOG_DEBUG("NavigationCoordinator: Already at '{}'", toState.name);
        notify(RouterEvent::TransitionError, toState, state_, error);
        fail(callback, error);
        return;
    }

    navigateToState(toState, state_, options, true, std::move(callback));
}

void NavigationCoordinator::navigateToDefault(const NavigationOptions &options, NavigationCallback callback) {
    if (!status_->active) {
        LOG_WARN("NavigationCoordinator: Router is not started");
        fail(callback, RouterError(ErrorCode::RouterNotStarted));
        return;
    }

    auto snapshot = options_.get();
    std::string routeName = snapshot->resolveDefaultRoute();
    if (routeName.empty()) {
        RouterError error(ErrorCode::RouteNotFound, "Default route is not configured");
        error.withRouteName(routeName);
        LOG_WARN("NavigationCoordinator: {}", error.what());
        notify(RouterEvent::TransitionError, std::nullopt, state_, error);
        fail(callback, error);
        return;
    }

    navigate(routeName, snapshot->resolveDefaultParams(), options, std::move(callback));
}

void NavigationCoordinator::navigateToState(const State &toState, const std::optional<State> &fromState,
                                            const NavigationOptions &options, bool emitSuccess,
                                            NavigationCallback callback) {
    std::shared_ptr<PendingNavigation> superseded;
    if (current_ && !current_->settled) {
        LOG_WARN("NavigationCoordinator: {}", Constants::CONCURRENT_NAVIGATION_WARNING);
        superseded = current_;
    }

    auto navigation = std::make_shared<PendingNavigation>(status_);
    navigation->id = nextId_++;
    navigation->toState = toState;
    navigation->fromState = fromState;
    navigation->options = options;
    navigation->emitSuccess = emitSuccess;
    navigation->callback = std::move(callback);
    navigation->startedAt = std::chrono::steady_clock::now();

    // The newcomer is current before the superseded one settles, so its callback sees a navigation in progress
    current_ = navigation;
    if (superseded) {
        settleCancelled(*superseded);

        // That callback may itself have navigated again
        if (navigation->settled) {
            return;
        }
    }

    LOG_DEBUG("NavigationCoordinator: Transition #{} '{}' -> '{}'", navigation->id,
              fromState ? fromState->name : std::string(), toState.name);

    notify(RouterEvent::TransitionStart, toState, fromState);

    // A listener reacting to TransitionStart may already have superseded this navigation
    if (navigation->settled) {
        return;
    }

    std::weak_ptr<PendingNavigation> weak = navigation;
    pipeline_.run(toState, fromState, options, navigation->token.predicate(),
                  [this, weak](const TransitionResult &result) {
                      auto navigation = weak.lock();
                      if (!navigation) {
                          return;
                      }
                      onTransitionDone(navigation, result);
                  });
}

bool NavigationCoordinator::cancel() {
    if (!current_ || current_->settled) {
        return false;
    }

    auto cancelled = current_;
    current_.reset();
    settleCancelled(*cancelled);
    return true;
}

bool NavigationCoordinator::isNavigating() const {
    return current_ && !current_->settled;
}

void NavigationCoordinator::onTransitionDone(const std::shared_ptr<PendingNavigation> &navigation,
                                             const TransitionResult &result) {
    if (navigation->settled) {
        LOG_DEBUG("NavigationCoordinator: Ignoring late result of settled transition #{}", navigation->id);
        return;
    }

    navigation->settled = true;
    if (current_ == navigation) {
        current_.reset();
    }

    if (result.success && result.state) {
        commit(*navigation, result);
        return;
    }

    RouterError error = result.error ? *result.error : RouterError(ErrorCode::TransitionError);
    routeError(error, navigation->toState, navigation->fromState);
    fail(navigation->callback, error);
}

void NavigationCoordinator::commit(PendingNavigation &navigation, const TransitionResult &result) {
    const State &finalState = *result.state;

    // The route may have been removed while a guard was suspended
    if (!StateHelper::isUnknownRoute(finalState) && !routes_.hasRoute(finalState.name)) {
        RouterError error(ErrorCode::RouteNotFound,
                          fmt::format("Route \"{}\" was removed during the transition", finalState.name));
        error.withRouteName(finalState.name);
        LOG_WARN("NavigationCoordinator: {}", error.what());
        notify(RouterEvent::TransitionError, finalState, navigation.fromState, error);
        fail(navigation.callback, error);
        return;
    }

    TransitionMeta meta;
    meta.phase = result.phase;
    meta.reason = "success";
    if (navigation.fromState) {
        meta.from = navigation.fromState->name;
    }
    meta.segments = result.segments;
    meta.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                          navigation.startedAt);

    State committed = finalState;
    committed.transition = meta;
    state_ = committed;

    LOG_DEBUG("NavigationCoordinator: Committed '{}' (activated: [{}], deactivated: [{}], {} ms)", committed.name,
              SegmentHelper::join(meta.segments.activated), SegmentHelper::join(meta.segments.deactivated),
              meta.duration.count());

    if (navigation.emitSuccess) {
        notify(RouterEvent::TransitionSuccess, committed, navigation.fromState, std::nullopt, navigation.options);
    }

    safeCallback(navigation.callback, NavigationResult::createSuccess(committed));
}

void NavigationCoordinator::settleCancelled(PendingNavigation &navigation) {
    if (navigation.settled) {
        return;
    }

    navigation.settled = true;
    navigation.token.cancel();

    RouterError error(ErrorCode::TransitionCancelled);
    routeError(error, navigation.toState, navigation.fromState);
    fail(navigation.callback, error);
}

void NavigationCoordinator::routeError(const RouterError &error, const State &toState,
                                       const std::optional<State> &fromState) {
    switch (error.getCode()) {
    case ErrorCode::TransitionCancelled:
        LOG_DEBUG("NavigationCoordinator: Transition to '{}' cancelled", toState.name);
        notify(RouterEvent::TransitionCancel, toState, fromState);
        break;
    case ErrorCode::CannotActivate:
    case ErrorCode::CannotDeactivate:
        LOG_WARN("NavigationCoordinator: Transition to '{}' blocked at segment '{}': {}", toState.name,
                 error.getSegment(), error.what());
        notify(RouterEvent::TransitionBlocked, toState, fromState, error);
        break;
    default:
        LOG_ERROR("NavigationCoordinator: Transition to '{}' failed ({}): {}", toState.name,
                  RouterError::codeToString(error.getCode()), error.what());
        notify(RouterEvent::TransitionError, toState, fromState, error);
        break;
    }
}

void NavigationCoordinator::notify(RouterEvent event, const std::optional<State> &toState,
                                   const std::optional<State> &fromState, const std::optional<RouterError> &error,
                                   const std::optional<NavigationOptions> &options) {
    RouterNotification notification;
    notification.event = event;
    notification.toState = toState;
    notification.fromState = fromState;
    notification.error = error;
    notification.options = options;

    try {
        notifications_.notify(notification);
    } catch (const std::exception &e) {
        LOG_ERROR("NavigationCoordinator: Notification sink failed for {}: {}", toString(event), e.what());
    }
}

void NavigationCoordinator::fail(const NavigationCallback &callback, const RouterError &error) {
    safeCallback(callback, NavigationResult::createError(error));
}

}  // namespace RNE
