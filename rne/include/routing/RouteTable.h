// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include "routing/IRouteResolver.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace RNE {

/**
 * @brief Hierarchical route table
 *
 * A route named "users.profile" is a child of "users"; its path pattern is
 * appended to the parent's pattern. Pattern tokens starting with ':' are URL
 * params; any other param of a state is a query param and is serialized as a
 * sorted "?key=value" suffix.
 *
 * @code
 * RouteTable routes;
 * routes.addRoute("users", "/users");
 * routes.addRoute("users.profile", "/:id");
 * routes.buildPath("users.profile", {{"id", "42"}, {"tab", "posts"}});  // "/users/42?tab=posts"
 * @endcode
 */
class RouteTable : public IRouteResolver {
public:
    RouteTable() = default;
    ~RouteTable() override = default;

    /**
     * @brief Add or replace a route
     * @throws std::invalid_argument when the name is empty or reserved, the
     *         parent route is missing, or the pattern repeats a param name
     */
    void addRoute(const std::string &name, const std::string &pathPattern);

    /**
     * @brief Remove a route and all of its descendants
     * @return false when the route does not exist
     */
    bool removeRoute(const std::string &name);

    void clear();

    std::size_t size() const {
        return routes_.size();
    }

    std::vector<std::string> getRouteNames() const;

    /**
     * @brief Build the path of @p name, or nullopt when a URL param is missing
     */
    std::optional<std::string> buildPath(const std::string &name, const Params &params) const;

    std::optional<ResolvedRoute> resolve(const std::string &name, const Params &params) const override;
    std::optional<State> matchPath(const std::string &path) const override;
    bool hasRoute(const std::string &name) const override;
    bool statesEqual(const State &a, const State &b, bool ignoreQueryParams) const override;

private:
    struct Route {
        std::string name;
        std::string pattern;              // Relative to the parent route
        std::vector<std::string> tokens;  // Full path tokens, parents included
        std::vector<std::string> urlParams;
    };

    static std::vector<std::string> tokenize(const std::string &pattern);
    static bool isParamToken(const std::string &token);
    static std::string encode(const std::string &value);
    static std::string decode(const std::string &value);
    static Params parseQuery(const std::string &query);

    std::vector<std::string> urlParamsOf(const std::string &segment) const;

    std::map<std::string, Route> routes_;
};

}  // namespace RNE
