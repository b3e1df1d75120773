// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include "common/JsonUtils.h"
#include "config/RouterOptions.h"
#include <functional>
#include <memory>
#include <string>

namespace RNE {

/**
 * @brief Owner of the router's option snapshot
 *
 * get() hands out an immutable snapshot; every change replaces the snapshot,
 * so a transition that captured one keeps seeing consistent values.
 *
 * While locked (router started), only defaultRoute and defaultParams may
 * change. Changing anything else throws RouterError(OptionsLocked).
 *
 * Recognized JSON keys: defaultRoute, defaultParams, allowNotFound,
 * ignoreQueryParams and limits (object with maxLifecycleHandlers,
 * lifecycleWarnThreshold, lifecycleErrorThreshold, maxMiddleware,
 * middlewareWarnThreshold, middlewareErrorThreshold).
 */
class OptionsStore {
public:
    explicit OptionsStore(RouterOptions options = RouterOptions{});

    std::shared_ptr<const RouterOptions> get() const {
        return options_;
    }

    /**
     * @brief Replace one option from its JSON value
     * @throws RouterError InvalidOption for unknown keys or mistyped values,
     *         OptionsLocked for locked keys
     */
    void setOption(const std::string &name, const json &value);

    void setDefaultRouteProvider(std::function<std::string()> provider);
    void setDefaultParamsProvider(std::function<Params()> provider);

    void lock() {
        locked_ = true;
    }

    void unlock() {
        locked_ = false;
    }

    bool isLocked() const {
        return locked_;
    }

    /**
     * @brief Build options from a JSON object; missing keys keep their defaults
     * @throws RouterError InvalidOption
     */
    static RouterOptions fromJson(const json &document);

    /**
     * @brief Read and parse a JSON options file
     * @throws RouterError InvalidOption when the file cannot be read or parsed
     */
    static RouterOptions loadFromFile(const std::string &filePath);

    static bool isUnlockedOption(const std::string &name);

private:
    static void applyOption(RouterOptions &options, const std::string &name, const json &value);
    static void applyLimits(RouterLimits &limits, const json &value);

    std::shared_ptr<const RouterOptions> options_;
    bool locked_ = false;
};

}  // namespace RNE
