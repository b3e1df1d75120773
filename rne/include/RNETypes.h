// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace RNE {

/**
 * @brief Route parameters (name -> serialized value)
 *
 * Ordered so that query strings and equality checks are deterministic.
 */
using Params = std::map<std::string, std::string>;

/**
 * @brief Per-call navigation flags
 *
 * Immutable per call and never merged across calls.
 */
struct NavigationOptions {
    bool replace = false;          // Host history should replace the current entry
    bool reload = false;           // Re-run every segment even if unchanged
    bool force = false;            // Bypass the same-state check
    bool forceDeactivate = false;  // Skip deactivation guards
    bool redirected = false;       // Navigation originates from a middleware redirect

    bool operator==(const NavigationOptions &) const = default;
};

/**
 * @brief Where a route parameter lives in the resolved path
 */
enum class ParamSource { Url, Query };

/**
 * @brief Metadata attached to a State by route resolution
 */
struct StateMeta {
    // segment name -> (param name -> source); drives segment-scoped diffing
    std::map<std::string, std::map<std::string, ParamSource>> paramsBySegment;
    NavigationOptions options;
    bool redirected = false;

    bool operator==(const StateMeta &) const = default;
};

/**
 * @brief Last pipeline phase reached by a transition
 */
enum class TransitionPhase { Deactivating, Activating, Middleware };

struct TransitionSegments {
    std::vector<std::string> activated;
    std::vector<std::string> deactivated;
    std::string intersection;  // Deepest shared ancestor, empty when none

    bool operator==(const TransitionSegments &) const = default;
};

/**
 * @brief Attached only to states produced by a committed transition
 */
struct TransitionMeta {
    TransitionPhase phase = TransitionPhase::Deactivating;
    std::string reason = "success";
    std::optional<std::string> from;
    TransitionSegments segments;
    std::chrono::milliseconds duration{0};

    bool operator==(const TransitionMeta &) const = default;
};

/**
 * @brief Resolved router state
 *
 * Produced by route resolution and treated as immutable once constructed;
 * the engine copies states instead of mutating them.
 */
struct State {
    std::string name;  // Dot-delimited segment path, e.g. "admin.users"
    Params params;
    std::string path;
    StateMeta meta;
    std::optional<TransitionMeta> transition;

    bool operator==(const State &) const = default;
};

enum class GuardKind { Activate, Deactivate };

/**
 * @brief Notifications emitted by the core
 */
enum class RouterEvent {
    RouterStart,
    RouterStop,
    TransitionStart,
    TransitionSuccess,
    TransitionError,
    TransitionCancel,
    TransitionBlocked
};

/**
 * @brief Cooperative cancellation check handed to every pipeline stage
 */
using CancellationPredicate = std::function<bool()>;

inline const char *toString(GuardKind kind) {
    return kind == GuardKind::Activate ? "activate" : "deactivate";
}

inline const char *toString(TransitionPhase phase) {
    switch (phase) {
    case TransitionPhase::Deactivating:
        return "deactivating";
    case TransitionPhase::Activating:
        return "activating";
    case TransitionPhase::Middleware:
        return "middleware";
    }
    return "unknown";
}

inline const char *toString(RouterEvent event) {
    switch (event) {
    case RouterEvent::RouterStart:
        return "$start";
    case RouterEvent::RouterStop:
        return "$stop";
    case RouterEvent::TransitionStart:
        return "$$start";
    case RouterEvent::TransitionSuccess:
        return "$$success";
    case RouterEvent::TransitionError:
        return "$$error";
    case RouterEvent::TransitionCancel:
        return "$$cancel";
    case RouterEvent::TransitionBlocked:
        return "$$blocked";
    }
    return "unknown";
}

}  // namespace RNE
