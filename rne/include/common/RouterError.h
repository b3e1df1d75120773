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
#include <stdexcept>
#include <string>

namespace RNE {

/**
 * @brief Flat error taxonomy shared by every router entry point
 */
enum class ErrorCode {
    // Navigation outcomes
    RouterNotStarted,
    AlreadyStarted,
    NoStartPathOrState,
    RouteNotFound,
    SameStates,
    TransitionCancelled,
    CannotActivate,
    CannotDeactivate,
    TransitionError,

    // Registration errors
    InvalidGuardHandler,
    GuardFactoryNotCallable,
    GuardSelfModification,
    GuardLimitExceeded,
    MiddlewareLimitExceeded,
    InvalidMiddleware,

    // Options store
    OptionsLocked,
    InvalidOption
};

/**
 * @brief Router error with optional navigation context
 *
 * Navigation failures travel inside NavigationResult; registration and option
 * errors are thrown. The context fields are filled only where they apply:
 * - segment: blocking segment of CannotActivate / CannotDeactivate
 * - path: start path that failed to match
 * - routeName: route that failed to resolve
 * - attemptedRedirect: redirect returned by a guard (reported, never honored)
 */
class RouterError : public std::runtime_error {
public:
    explicit RouterError(ErrorCode code, const std::string &message = "");

    ErrorCode getCode() const {
        return code_;
    }

    const std::string &getSegment() const {
        return segment_;
    }

    const std::string &getPath() const {
        return path_;
    }

    const std::string &getRouteName() const {
        return routeName_;
    }

    const std::optional<State> &getAttemptedRedirect() const {
        return attemptedRedirect_;
    }

    RouterError &withSegment(const std::string &segment);
    RouterError &withPath(const std::string &path);
    RouterError &withRouteName(const std::string &routeName);
    RouterError &withAttemptedRedirect(const State &redirect);

    /**
     * @brief Expected outcomes that must not be logged as failures
     */
    bool isRoutine() const {
        return code_ == ErrorCode::TransitionCancelled || code_ == ErrorCode::SameStates;
    }

    bool isBlocked() const {
        return code_ == ErrorCode::CannotActivate || code_ == ErrorCode::CannotDeactivate;
    }

    /**
     * @brief Stable code string, e.g. "CANNOT_ACTIVATE"
     */
    static const char *codeToString(ErrorCode code);

private:
    ErrorCode code_;
    std::string segment_;
    std::string path_;
    std::string routeName_;
    std::optional<State> attemptedRedirect_;
};

}  // namespace RNE
