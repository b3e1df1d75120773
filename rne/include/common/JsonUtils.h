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
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace RNE {

using json = nlohmann::json;

/**
 * @brief JSON helpers for configuration loading and state diagnostics
 *
 * Keeps nlohmann::json parsing and error handling in one place so the options
 * store and log output format values the same way.
 */
class JsonUtils {
public:
    /**
     * @brief Parse an options document
     * @param errorOut Receives the parser message when parsing fails
     * @return nullopt for empty or malformed input
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);
    static std::string toPrettyString(const json &value);

    /**
     * @brief Convert a flat JSON object of scalars to Params
     *
     * Numbers and booleans are serialized with their JSON spelling.
     * @return nullopt if @p value is not an object or holds a nested value
     */
    static std::optional<Params> toParams(const json &value);

    static json toJson(const Params &params);
    static json toJson(const NavigationOptions &options);
    static json toJson(const TransitionMeta &transition);

    /**
     * @brief Diagnostic view of a state, including transition metadata when present
     */
    static json toJson(const State &state);
};

}  // namespace RNE
