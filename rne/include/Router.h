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
#include "config/OptionsStore.h"
#include "events/EventBus.h"
#include "guards/GuardRegistry.h"
#include "routing/RouteTable.h"
#include "runtime/MiddlewareChain.h"
#include "runtime/NavigationCoordinator.h"
#include "runtime/NavigationResult.h"
#include "runtime/RouterLifecycle.h"
#include "runtime/RouterStatus.h"
#include "runtime/TransitionPipeline.h"
#include <memory>
#include <optional>
#include <string>

namespace RNE {

/**
 * @brief Navigation router
 *
 * Wires the route resolver, guard registry, middleware chain, transition
 * pipeline, navigation coordinator, lifecycle and event bus of one router
 * instance. Instances share nothing; create one per server-side request.
 *
 * Navigation outcomes are delivered through NavigationCallback. With
 * synchronous guards and middleware the callback runs before the call returns.
 *
 * @code
 * RNE::Router router;
 * router.addRoute("home", "/");
 * router.addRoute("users", "/users");
 * router.registerGuard(RNE::GuardKind::Activate, "users", true);
 * router.start("/", [](const RNE::NavigationResult &result) {
 *     LOG_INFO("Started at {}", result.state->path);
 * });
 * router.navigate("users");
 * @endcode
 *
 * Not thread-safe: drive each router from a single thread.
 */
class Router {
public:
    /**
     * @brief Router backed by its own RouteTable
     */
    explicit Router(RouterOptions options = RouterOptions{});

    /**
     * @brief Router backed by an external resolver; route table methods are unavailable
     */
    explicit Router(std::shared_ptr<IRouteResolver> resolver, RouterOptions options = RouterOptions{});

    ~Router();

    Router(const Router &) = delete;
    Router &operator=(const Router &) = delete;

    // Lifecycle
    void start(NavigationCallback done = {});
    void start(const std::string &path, NavigationCallback done = {});
    void start(const State &state, NavigationCallback done = {});
    void stop();
    bool isStarted() const;
    bool isActive() const;

    // Navigation
    void navigate(const std::string &name, const Params &params = {}, const NavigationOptions &options = {},
                  NavigationCallback done = {});
    void navigateToDefault(const NavigationOptions &options = {}, NavigationCallback done = {});
    bool cancel();
    bool isNavigating() const;
    const std::optional<State> &getState() const;

    // Guards
    void registerGuard(GuardKind kind, const std::string &name, const GuardHandler &handler);
    bool clearGuard(GuardKind kind, const std::string &name);

    GuardRegistry &guards() {
        return guards_;
    }

    // Middleware
    std::size_t useMiddleware(MiddlewareFn middleware);
    bool removeMiddleware(std::size_t id);

    // Events
    std::size_t addEventListener(RouterEvent event, RouterEventListener listener);
    bool removeEventListener(std::size_t id);

    // Options
    void setOption(const std::string &name, const json &value);

    OptionsStore &options() {
        return options_;
    }

    // Routes
    /**
     * @throws std::logic_error when the router uses an external resolver
     */
    void addRoute(const std::string &name, const std::string &pathPattern);
    bool removeRoute(const std::string &name);

    /**
     * @brief Remove every route and every guard
     */
    void clearRoutes();

    std::optional<std::string> buildPath(const std::string &name, const Params &params = {}) const;

    IRouteResolver &resolver() {
        return *resolver_;
    }

private:
    // Lets the lifecycle finish a start that a navigation took over
    NavigationCallback observed(NavigationCallback done);
    RouteTable &requireRouteTable(const char *operation) const;
    void applyLimits();

    std::shared_ptr<RouterStatus> status_;
    OptionsStore options_;
    std::shared_ptr<RouteTable> routeTable_;
    std::shared_ptr<IRouteResolver> resolver_;
    EventBus events_;
    GuardRegistry guards_;
    MiddlewareChain middleware_;
    TransitionPipeline pipeline_;
    NavigationCoordinator coordinator_;
    RouterLifecycle lifecycle_;
};

}  // namespace RNE
