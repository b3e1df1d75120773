// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "config/OptionsStore.h"
#include "common/Logger.h"
#include "common/RouterError.h"

#include <fstream>
#include <sstream>

namespace RNE {

namespace {

RouterError invalidOption(const std::string &name, const std::string &reason) {
    return RouterError(ErrorCode::InvalidOption, fmt::format("Invalid value for option \"{}\": {}", name, reason));
}

bool requireBool(const std::string &name, const json &value) {
    if (!value.is_boolean()) {
        throw invalidOption(name, fmt::format("expected boolean, got {}", value.type_name()));
    }
    return value.get<bool>();
}

std::size_t requireSize(const std::string &name, const json &value) {
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<long long>() >= 0)) {
        throw invalidOption(name, fmt::format("expected non-negative integer, got {}", JsonUtils::toCompactString(value)));
    }
    return value.get<std::size_t>();
}

}  // namespace

OptionsStore::OptionsStore(RouterOptions options) : options_(std::make_shared<const RouterOptions>(std::move(options))) {}

void OptionsStore::setOption(const std::string &name, const json &value) {
    if (locked_ && !isUnlockedOption(name)) {
        throw RouterError(ErrorCode::OptionsLocked,
                          fmt::format("Options cannot be changed after router.start(): \"{}\"", name));
    }

    RouterOptions next = *options_;
    applyOption(next, name, value);
    options_ = std::make_shared<const RouterOptions>(std::move(next));

    LOG_DEBUG("OptionsStore: Set option \"{}\" = {}", name, JsonUtils::toCompactString(value));
}

void OptionsStore::setDefaultRouteProvider(std::function<std::string()> provider) {
    RouterOptions next = *options_;
    next.defaultRouteProvider = std::move(provider);
    options_ = std::make_shared<const RouterOptions>(std::move(next));
}

void OptionsStore::setDefaultParamsProvider(std::function<Params()> provider) {
    RouterOptions next = *options_;
    next.defaultParamsProvider = std::move(provider);
    options_ = std::make_shared<const RouterOptions>(std::move(next));
}

RouterOptions OptionsStore::fromJson(const json &document) {
    if (!document.is_object()) {
        throw RouterError(ErrorCode::InvalidOption,
                          fmt::format("Options document must be a JSON object, got {}", document.type_name()));
    }

    RouterOptions options;
    for (const auto &[name, value] : document.items()) {
        applyOption(options, name, value);
    }
    return options;
}

RouterOptions OptionsStore::loadFromFile(const std::string &filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        LOG_ERROR("OptionsStore: Failed to open options file: {}", filePath);
        throw RouterError(ErrorCode::InvalidOption, fmt::format("Cannot open options file: {}", filePath));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string parseError;
    auto document = JsonUtils::parseJson(buffer.str(), &parseError);
    if (!document) {
        LOG_ERROR("OptionsStore: Failed to parse options file {}: {}", filePath, parseError);
        throw RouterError(ErrorCode::InvalidOption,
                          fmt::format("Cannot parse options file {}: {}", filePath, parseError));
    }

    LOG_INFO("OptionsStore: Loaded options from {}", filePath);
    return fromJson(*document);
}

bool OptionsStore::isUnlockedOption(const std::string &name) {
    return name == "defaultRoute" || name == "defaultParams";
}

void OptionsStore::applyOption(RouterOptions &options, const std::string &name, const json &value) {
    if (name == "defaultRoute") {
        if (!value.is_string()) {
            throw invalidOption(name, fmt::format("expected string, got {}", value.type_name()));
        }
        options.defaultRoute = value.get<std::string>();
    } else if (name == "defaultParams") {
        auto params = JsonUtils::toParams(value);
        if (!params) {
            throw invalidOption(name, "expected flat object of scalar values");
        }
        options.defaultParams = std::move(*params);
    } else if (name == "allowNotFound") {
        options.allowNotFound = requireBool(name, value);
    } else if (name == "ignoreQueryParams") {
        options.ignoreQueryParams = requireBool(name, value);
    } else if (name == "limits") {
        applyLimits(options.limits, value);
    } else {
        throw RouterError(ErrorCode::InvalidOption, fmt::format("Unknown option \"{}\"", name));
    }
}

void OptionsStore::applyLimits(RouterLimits &limits, const json &value) {
    if (!value.is_object()) {
        throw invalidOption("limits", fmt::format("expected object, got {}", value.type_name()));
    }

    for (const auto &[key, item] : value.items()) {
        std::string qualified = "limits." + key;
        if (key == "maxLifecycleHandlers") {
            limits.maxLifecycleHandlers = requireSize(qualified, item);
        } else if (key == "lifecycleWarnThreshold") {
            limits.lifecycleWarnThreshold = requireSize(qualified, item);
        } else if (key == "lifecycleErrorThreshold") {
            limits.lifecycleErrorThreshold = requireSize(qualified, item);
        } else if (key == "maxMiddleware") {
            limits.maxMiddleware = requireSize(qualified, item);
        } else if (key == "middlewareWarnThreshold") {
            limits.middlewareWarnThreshold = requireSize(qualified, item);
        } else if (key == "middlewareErrorThreshold") {
            limits.middlewareErrorThreshold = requireSize(qualified, item);
        } else {
            throw RouterError(ErrorCode::InvalidOption, fmt::format("Unknown option \"{}\"", qualified));
        }
    }
}

}  // namespace RNE
