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
#include "config/RouterOptions.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace RNE {

/**
 * @brief Outcome reported by a middleware
 */
struct MiddlewareResult {
    enum class Action { Next, Replace, Reject };

    Action action = Action::Next;
    std::optional<State> state;  // Set for Replace
    std::string message;         // Set for Reject

    static MiddlewareResult next() {
        return MiddlewareResult{};
    }

    static MiddlewareResult replace(const State &state) {
        MiddlewareResult result;
        result.action = Action::Replace;
        result.state = state;
        return result;
    }

    static MiddlewareResult reject(const std::string &message = "") {
        MiddlewareResult result;
        result.action = Action::Reject;
        result.message = message;
        return result;
    }
};

using MiddlewareCallback = std::function<void(const MiddlewareResult &)>;

/**
 * @brief Post-guard hook
 *
 * Receives the state produced by the previous middleware. Replacing the state
 * is the only supported redirect mechanism.
 */
using MiddlewareFn = std::function<void(const State &toState, const std::optional<State> &fromState,
                                        const CancellationPredicate &isCancelled, MiddlewareCallback done)>;

/**
 * @brief Ordered middleware registrations
 *
 * Middleware runs in registration order. Removal by id keeps the relative order
 * of the remaining entries.
 */
class MiddlewareChain {
public:
    explicit MiddlewareChain(const RouterLimits &limits = RouterLimits{});

    void setLimits(const RouterLimits &limits);

    /**
     * @brief Append a middleware
     * @return Registration id for remove()
     * @throws RouterError InvalidMiddleware for an empty function,
     *         MiddlewareLimitExceeded past the hard limit
     */
    std::size_t use(MiddlewareFn middleware);

    bool remove(std::size_t id);

    void clear();

    std::size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

    /**
     * @brief Copy of the functions in execution order
     *
     * A transition works on a snapshot so that registrations made while it is
     * suspended do not affect it.
     */
    std::vector<MiddlewareFn> snapshot() const;

private:
    void checkCountThresholds(std::size_t newSize) const;

    RouterLimits limits_;
    std::vector<std::pair<std::size_t, MiddlewareFn>> entries_;
    std::size_t nextId_ = 1;
};

}  // namespace RNE
