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

namespace RNE::SegmentHelper {

/**
 * @brief Segments to leave and enter for one transition
 */
struct TransitionPath {
    std::string intersection;               // Deepest shared segment, empty when none
    std::vector<std::string> toDeactivate;  // Deepest first
    std::vector<std::string> toActivate;    // Root to leaf
};

/**
 * @brief Convert a route name to cumulative segment ids
 *
 * nameToIds("users.profile.edit") -> {"users", "users.profile", "users.profile.edit"}
 * nameToIds("") -> {""}
 */
std::vector<std::string> nameToIds(const std::string &name);

/**
 * @brief Params of @p state that belong to @p segment, per meta.paramsBySegment
 */
Params extractSegmentParams(const std::string &segment, const State &state);

/**
 * @brief Compute which segments a transition deactivates and activates
 *
 * Two segments with the same name still differ when their segment-scoped
 * params differ. A reload option on @p toState re-activates every segment.
 *
 * @param toState Target state
 * @param fromState Current state, absent for the first transition
 */
TransitionPath getTransitionPath(const State &toState, const std::optional<State> &fromState);

/**
 * @brief Join segment ids for log output
 */
std::string join(const std::vector<std::string> &segments, const std::string &separator = ", ");

}  // namespace RNE::SegmentHelper
