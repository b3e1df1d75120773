// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "common/StateHelper.h"
#include "common/Constants.h"

namespace RNE::StateHelper {

State makeNotFoundState(const std::string &path, const NavigationOptions &options) {
    State state;
    state.name = Constants::UNKNOWN_ROUTE;
    state.params[Constants::UNKNOWN_ROUTE_PATH_PARAM] = path;
    state.path = path;
    state.meta.options = options;
    state.meta.redirected = options.redirected;
    return state;
}

bool isUnknownRoute(const State &state) {
    return state.name == Constants::UNKNOWN_ROUTE;
}

std::vector<std::string> getUrlParams(const State &state) {
    std::vector<std::string> urlParams;

    for (const auto &[segment, paramSources] : state.meta.paramsBySegment) {
        for (const auto &[param, source] : paramSources) {
            if (source == ParamSource::Url) {
                urlParams.push_back(param);
            }
        }
    }

    return urlParams;
}

bool areStatesEqual(const State &a, const State &b, bool ignoreQueryParams) {
    if (a.name != b.name) {
        return false;
    }

    if (!ignoreQueryParams) {
        return a.params == b.params;
    }

    for (const auto &param : getUrlParams(a)) {
        auto left = a.params.find(param);
        auto right = b.params.find(param);
        bool leftPresent = left != a.params.end();
        bool rightPresent = right != b.params.end();
        if (leftPresent != rightPresent || (leftPresent && left->second != right->second)) {
            return false;
        }
    }

    return true;
}

}  // namespace RNE::StateHelper
