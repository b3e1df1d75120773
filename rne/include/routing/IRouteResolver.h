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
#include <optional>
#include <string>
#include <vector>

namespace RNE {

/**
 * @brief Result of resolving a route name
 */
struct ResolvedRoute {
    State state;
    std::vector<std::string> segments;  // Cumulative segment ids, root to leaf
};

/**
 * @brief Route resolution contract consumed by the navigation core
 *
 * The core never inspects route definitions directly. RouteTable is the
 * bundled implementation; hosts with their own route tree implement this
 * interface instead.
 */
class IRouteResolver {
public:
    virtual ~IRouteResolver() = default;

    /**
     * @brief Build a state for @p name with @p params
     * @return nullopt when the route does not exist or a URL param is missing
     */
    virtual std::optional<ResolvedRoute> resolve(const std::string &name, const Params &params) const = 0;

    /**
     * @brief Match a path (with optional query string) to a state
     */
    virtual std::optional<State> matchPath(const std::string &path) const = 0;

    virtual bool hasRoute(const std::string &name) const = 0;

    virtual bool statesEqual(const State &a, const State &b, bool ignoreQueryParams) const = 0;
};

}  // namespace RNE
