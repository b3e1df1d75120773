// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "routing/RouteTable.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/SegmentHelper.h"
#include "common/StateHelper.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>

namespace RNE {

void RouteTable::addRoute(const std::string &name, const std::string &pathPattern) {
    if (name.empty()) {
        throw std::invalid_argument("RouteTable: route name cannot be empty");
    }
    if (name == Constants::UNKNOWN_ROUTE) {
        throw std::invalid_argument(fmt::format("RouteTable: route name \"{}\" is reserved", name));
    }

    std::vector<std::string> ids = SegmentHelper::nameToIds(name);
    std::vector<std::string> tokens;
    if (ids.size() > 1) {
        const std::string &parentName = ids[ids.size() - 2];
        auto parent = routes_.find(parentName);
        if (parent == routes_.end()) {
            throw std::invalid_argument(
                fmt::format("RouteTable: parent route \"{}\" of \"{}\" does not exist", parentName, name));
        }
        tokens = parent->second.tokens;
    }

    std::vector<std::string> ownTokens = tokenize(pathPattern);
    tokens.insert(tokens.end(), ownTokens.begin(), ownTokens.end());

    std::set<std::string> seen;
    for (const auto &token : tokens) {
        if (isParamToken(token) && !seen.insert(token.substr(1)).second) {
            throw std::invalid_argument(
                fmt::format("RouteTable: param \"{}\" appears twice in the path of \"{}\"", token.substr(1), name));
        }
    }

    Route route;
    route.name = name;
    route.pattern = pathPattern;
    route.tokens = std::move(tokens);
    for (const auto &token : ownTokens) {
        if (isParamToken(token)) {
            route.urlParams.push_back(token.substr(1));
        }
    }

    if (routes_.count(name) > 0) {
        LOG_WARN("RouteTable: Replacing route \"{}\"", name);
    }
    routes_[name] = std::move(route);

    LOG_DEBUG("RouteTable: Added route \"{}\" with pattern \"{}\"", name, pathPattern);
}

bool RouteTable::removeRoute(const std::string &name) {
    if (routes_.erase(name) == 0) {
        LOG_DEBUG("RouteTable: Route \"{}\" not found, nothing removed", name);
        return false;
    }

    std::string prefix = name + Constants::SEGMENT_SEPARATOR;
    for (auto it = routes_.begin(); it != routes_.end();) {
        if (it->first.rfind(prefix, 0) == 0) {
            it = routes_.erase(it);
        } else {
            ++it;
        }
    }

    LOG_DEBUG("RouteTable: Removed route \"{}\" and its descendants", name);
    return true;
}

void RouteTable::clear() {
    routes_.clear();
}

std::vector<std::string> RouteTable::getRouteNames() const {
    std::vector<std::string> names;
    names.reserve(routes_.size());
    for (const auto &[name, route] : routes_) {
        names.push_back(name);
    }
    return names;
}

std::optional<std::string> RouteTable::buildPath(const std::string &name, const Params &params) const {
    auto it = routes_.find(name);
    if (it == routes_.end()) {
        return std::nullopt;
    }

    std::string path;
    std::set<std::string> used;
    for (const auto &token : it->second.tokens) {
        path += '/';
        if (isParamToken(token)) {
            std::string param = token.substr(1);
            auto value = params.find(param);
            if (value == params.end()) {
                LOG_DEBUG("RouteTable: Missing URL param \"{}\" for route \"{}\"", param, name);
                return std::nullopt;
            }
            path += encode(value->second);
            used.insert(param);
        } else {
            path += token;
        }
    }

    if (path.empty()) {
        path = "/";
    }

    std::string query;
    for (const auto &[key, value] : params) {
        if (used.count(key) > 0) {
            continue;
        }
        query += query.empty() ? '?' : '&';
        query += encode(key) + "=" + encode(value);
    }

    return path + query;
}

std::optional<ResolvedRoute> RouteTable::resolve(const std::string &name, const Params &params) const {
    auto path = buildPath(name, params);
    if (!path) {
        return std::nullopt;
    }

    ResolvedRoute resolved;
    resolved.segments = SegmentHelper::nameToIds(name);
    resolved.state.name = name;
    resolved.state.params = params;
    resolved.state.path = *path;

    std::set<std::string> urlParams;
    for (const auto &segment : resolved.segments) {
        auto &sources = resolved.state.meta.paramsBySegment[segment];
        for (const auto &param : urlParamsOf(segment)) {
            sources[param] = ParamSource::Url;
            urlParams.insert(param);
        }
    }

    auto &leafSources = resolved.state.meta.paramsBySegment[name];
    for (const auto &[key, value] : params) {
        if (urlParams.count(key) == 0) {
            leafSources[key] = ParamSource::Query;
        }
    }

    return resolved;
}

std::optional<State> RouteTable::matchPath(const std::string &path) const {
    std::string pathPart = path;
    std::string queryPart;
    auto queryPos = path.find('?');
    if (queryPos != std::string::npos) {
        pathPart = path.substr(0, queryPos);
        queryPart = path.substr(queryPos + 1);
    }

    std::vector<std::string> tokens = tokenize(pathPart);

    const Route *best = nullptr;
    std::size_t bestStatic = 0;
    std::size_t bestDepth = 0;
    Params bestParams;

    for (const auto &[name, route] : routes_) {
        if (route.tokens.size() != tokens.size()) {
            continue;
        }

        Params captured;
        std::size_t staticCount = 0;
        bool matched = true;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const std::string &expected = route.tokens[i];
            if (isParamToken(expected)) {
                captured[expected.substr(1)] = decode(tokens[i]);
            } else if (expected == tokens[i]) {
                ++staticCount;
            } else {
                matched = false;
                break;
            }
        }
        if (!matched) {
            continue;
        }

        // Static segments beat params; among equal patterns the deepest route wins
        std::size_t depth = SegmentHelper::nameToIds(name).size();
        if (!best || staticCount > bestStatic || (staticCount == bestStatic && depth > bestDepth)) {
            best = &route;
            bestStatic = staticCount;
            bestDepth = depth;
            bestParams = std::move(captured);
        }
    }

    if (!best) {
        return std::nullopt;
    }

    for (const auto &[key, value] : parseQuery(queryPart)) {
        bestParams.emplace(key, value);
    }

    auto resolved = resolve(best->name, bestParams);
    if (!resolved) {
        return std::nullopt;
    }
    return resolved->state;
}

bool RouteTable::hasRoute(const std::string &name) const {
    return routes_.count(name) > 0;
}

bool RouteTable::statesEqual(const State &a, const State &b, bool ignoreQueryParams) const {
    return StateHelper::areStatesEqual(a, b, ignoreQueryParams);
}

std::vector<std::string> RouteTable::tokenize(const std::string &pattern) {
    std::vector<std::string> tokens;
    std::stringstream stream(pattern);
    std::string token;
    while (std::getline(stream, token, '/')) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

bool RouteTable::isParamToken(const std::string &token) {
    return token.size() > 1 && token[0] == ':';
}

std::string RouteTable::encode(const std::string &value) {
    static const char *hex = "0123456789ABCDEF";
    std::string encoded;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }
    return encoded;
}

std::string RouteTable::decode(const std::string &value) {
    std::string decoded;
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            decoded += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else if (value[i] == '+') {
            decoded += ' ';
        } else {
            decoded += value[i];
        }
    }
    return decoded;
}

Params RouteTable::parseQuery(const std::string &query) {
    Params params;
    std::stringstream stream(query);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            params[decode(pair)] = "";
        } else {
            params[decode(pair.substr(0, eq))] = decode(pair.substr(eq + 1));
        }
    }
    return params;
}

std::vector<std::string> RouteTable::urlParamsOf(const std::string &segment) const {
    auto it = routes_.find(segment);
    return it == routes_.end() ? std::vector<std::string>{} : it->second.urlParams;
}

}  // namespace RNE
