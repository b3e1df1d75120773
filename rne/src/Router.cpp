// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "Router.h"
#include "common/Logger.h"

#include <stdexcept>

namespace RNE {

namespace {

std::shared_ptr<IRouteResolver> requireResolver(std::shared_ptr<IRouteResolver> resolver) {
    if (!resolver) {
        throw std::invalid_argument("Router: route resolver cannot be null");
    }
    return resolver;
}

}  // namespace

Router::Router(RouterOptions options) : Router(std::make_shared<RouteTable>(), std::move(options)) {
    routeTable_ = std::static_pointer_cast<RouteTable>(resolver_);
}

Router::Router(std::shared_ptr<IRouteResolver> resolver, RouterOptions options)
    : status_(std::make_shared<RouterStatus>()), options_(std::move(options)),
      resolver_(requireResolver(std::move(resolver))), guards_(options_.get()->limits),
      middleware_(options_.get()->limits), pipeline_(guards_, middleware_),
      coordinator_(status_, *resolver_, pipeline_, events_, options_),
      lifecycle_(status_,
                 LifecycleCapabilities{
                     [this](const State &toState, const NavigationOptions &navOptions, NavigationCallback callback) {
                         coordinator_.navigateToState(toState, std::nullopt, navOptions, false, std::move(callback));
                     },
                     [this]() { return coordinator_.cancel(); }, [this]() { coordinator_.clearState(); },
                     [this]() { return coordinator_.isNavigating(); }},
                 *resolver_, options_, events_) {}

Router::~Router() {
    // Suspended guards that answer after destruction observe cancellation
    status_->active = false;
}

void Router::start(NavigationCallback done) {
    lifecycle_.start(std::move(done));
}

void Router::start(const std::string &path, NavigationCallback done) {
    lifecycle_.start(path, std::move(done));
}

void Router::start(const State &state, NavigationCallback done) {
    lifecycle_.start(state, std::move(done));
}

void Router::stop() {
    lifecycle_.stop();
}

bool Router::isStarted() const {
    return lifecycle_.isStarted();
}

bool Router::isActive() const {
    return lifecycle_.isActive();
}

void Router::navigate(const std::string &name, const Params &params, const NavigationOptions &options,
                      NavigationCallback done) {
    coordinator_.navigate(name, params, options, observed(std::move(done)));
}

void Router::navigateToDefault(const NavigationOptions &options, NavigationCallback done) {
    coordinator_.navigateToDefault(options, observed(std::move(done)));
}

bool Router::cancel() {
    return coordinator_.cancel();
}

bool Router::isNavigating() const {
    return coordinator_.isNavigating();
}

const std::optional<State> &Router::getState() const {
    return coordinator_.getState();
}

void Router::registerGuard(GuardKind kind, const std::string &name, const GuardHandler &handler) {
    guards_.registerGuard(kind, name, handler);
}

bool Router::clearGuard(GuardKind kind, const std::string &name) {
    return guards_.clear(kind, name);
}

std::size_t Router::useMiddleware(MiddlewareFn middleware) {
    return middleware_.use(std::move(middleware));
}

bool Router::removeMiddleware(std::size_t id) {
    return middleware_.remove(id);
}

std::size_t Router::addEventListener(RouterEvent event, RouterEventListener listener) {
    return events_.addEventListener(event, std::move(listener));
}

bool Router::removeEventListener(std::size_t id) {
    return events_.removeEventListener(id);
}

void Router::setOption(const std::string &name, const json &value) {
    options_.setOption(name, value);
    if (name == "limits") {
        applyLimits();
    }
}

void Router::addRoute(const std::string &name, const std::string &pathPattern) {
    requireRouteTable("addRoute").addRoute(name, pathPattern);
}

bool Router::removeRoute(const std::string &name) {
    return requireRouteTable("removeRoute").removeRoute(name);
}

void Router::clearRoutes() {
    requireRouteTable("clearRoutes").clear();
    guards_.clearAll();
}

std::optional<std::string> Router::buildPath(const std::string &name, const Params &params) const {
    return requireRouteTable("buildPath").buildPath(name, params);
}

NavigationCallback Router::observed(NavigationCallback done) {
    return [this, done = std::move(done)](const NavigationResult &result) {
        lifecycle_.onNavigationSettled(result);
        safeCallback(done, result);
    };
}

RouteTable &Router::requireRouteTable(const char *operation) const {
    if (!routeTable_) {
        throw std::logic_error(fmt::format("Router::{}: router uses an external route resolver", operation));
    }
    return *routeTable_;
}

void Router::applyLimits() {
    auto snapshot = options_.get();
    guards_.setLimits(snapshot->limits);
    middleware_.setLimits(snapshot->limits);
}

}  // namespace RNE
