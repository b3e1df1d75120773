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
#include <string>
#include <vector>

namespace RNE::StateHelper {

/**
 * @brief Build the reserved not-found state for an unmatched path
 *
 * The unmatched path is kept both as State::path and as the "path" param.
 */
State makeNotFoundState(const std::string &path, const NavigationOptions &options);

bool isUnknownRoute(const State &state);

/**
 * @brief Names of params declared as URL params in the state's segment metadata
 */
std::vector<std::string> getUrlParams(const State &state);

/**
 * @brief Structural equality used by the same-state short-circuit
 *
 * Compares route names, then either every param or only URL params when
 * @p ignoreQueryParams is set. Transition metadata and options are ignored.
 */
bool areStatesEqual(const State &a, const State &b, bool ignoreQueryParams);

}  // namespace RNE::StateHelper
