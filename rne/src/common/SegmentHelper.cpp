// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "common/SegmentHelper.h"
#include "common/Constants.h"
#include <algorithm>

namespace RNE::SegmentHelper {

namespace {

std::vector<std::string> reversed(const std::vector<std::string> &ids) {
    return std::vector<std::string>(ids.rbegin(), ids.rend());
}

size_t pointOfDifference(const State &toState, const State &fromState, const std::vector<std::string> &toIds,
                         const std::vector<std::string> &fromIds) {
    size_t maxIndex = std::min(toIds.size(), fromIds.size());

    for (size_t i = 0; i < maxIndex; ++i) {
        if (toIds[i] != fromIds[i]) {
            return i;
        }

        if (extractSegmentParams(toIds[i], toState) != extractSegmentParams(fromIds[i], fromState)) {
            return i;
        }
    }

    return maxIndex;
}

}  // namespace

std::vector<std::string> nameToIds(const std::string &name) {
    if (name.empty()) {
        return {""};
    }

    std::vector<std::string> ids;
    size_t pos = name.find(Constants::SEGMENT_SEPARATOR);
    while (pos != std::string::npos) {
        ids.push_back(name.substr(0, pos));
        pos = name.find(Constants::SEGMENT_SEPARATOR, pos + 1);
    }
    ids.push_back(name);

    return ids;
}

Params extractSegmentParams(const std::string &segment, const State &state) {
    Params result;

    auto segmentIt = state.meta.paramsBySegment.find(segment);
    if (segmentIt == state.meta.paramsBySegment.end()) {
        return result;
    }

    for (const auto &[key, source] : segmentIt->second) {
        auto valueIt = state.params.find(key);
        if (valueIt != state.params.end()) {
            result[key] = valueIt->second;
        }
    }

    return result;
}

TransitionPath getTransitionPath(const State &toState, const std::optional<State> &fromState) {
    if (!fromState) {
        return {"", {}, nameToIds(toState.name)};
    }

    if (toState.meta.options.reload) {
        return {"", reversed(nameToIds(fromState->name)), nameToIds(toState.name)};
    }

    auto toIds = nameToIds(toState.name);
    auto fromIds = nameToIds(fromState->name);
    size_t i = pointOfDifference(toState, *fromState, toIds, fromIds);

    TransitionPath path;
    for (size_t j = fromIds.size(); j > i; --j) {
        path.toDeactivate.push_back(fromIds[j - 1]);
    }
    path.toActivate.assign(toIds.begin() + static_cast<std::ptrdiff_t>(i), toIds.end());
    path.intersection = i > 0 ? fromIds[i - 1] : "";

    return path;
}

std::string join(const std::vector<std::string> &segments, const std::string &separator) {
    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += segments[i];
    }
    return result;
}

}  // namespace RNE::SegmentHelper
