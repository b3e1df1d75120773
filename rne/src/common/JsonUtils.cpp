// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "common/JsonUtils.h"
#include "common/Logger.h"

namespace RNE {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Document is empty";
        }
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Parse error at byte {}: {}", e.byte, e.what());
        return std::nullopt;
    }
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump();
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

std::optional<Params> JsonUtils::toParams(const json &value) {
    if (!value.is_object()) {
        return std::nullopt;
    }

    Params params;
    for (const auto &[key, item] : value.items()) {
        if (item.is_string()) {
            params[key] = item.get<std::string>();
        } else if (item.is_number() || item.is_boolean()) {
            params[key] = item.dump();
        } else {
            LOG_DEBUG("JsonUtils: Unsupported param type for key '{}': {}", key, item.type_name());
            return std::nullopt;
        }
    }

    return params;
}

json JsonUtils::toJson(const Params &params) {
    json object = json::object();
    for (const auto &[key, value] : params) {
        object[key] = value;
    }
    return object;
}

json JsonUtils::toJson(const NavigationOptions &options) {
    return json{{"replace", options.replace},
                {"reload", options.reload},
                {"force", options.force},
                {"forceDeactivate", options.forceDeactivate},
                {"redirected", options.redirected}};
}

json JsonUtils::toJson(const TransitionMeta &transition) {
    json object = {{"phase", toString(transition.phase)},
                   {"reason", transition.reason},
                   {"duration", transition.duration.count()},
                   {"segments",
                    {{"activated", transition.segments.activated},
                     {"deactivated", transition.segments.deactivated},
                     {"intersection", transition.segments.intersection}}}};

    if (transition.from) {
        object["from"] = *transition.from;
    }

    return object;
}

json JsonUtils::toJson(const State &state) {
    json object = {{"name", state.name}, {"path", state.path}, {"params", toJson(state.params)}};

    json segments = json::object();
    for (const auto &[segment, paramSources] : state.meta.paramsBySegment) {
        json sources = json::object();
        for (const auto &[param, source] : paramSources) {
            sources[param] = source == ParamSource::Url ? "url" : "query";
        }
        segments[segment] = sources;
    }

    object["meta"] = {{"params", segments}, {"options", toJson(state.meta.options)}, {"redirected", state.meta.redirected}};

    if (state.transition) {
        object["transition"] = toJson(*state.transition);
    }

    return object;
}

}  // namespace RNE
