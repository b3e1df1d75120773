// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "common/RouterError.h"

namespace RNE {

RouterError::RouterError(ErrorCode code, const std::string &message)
    : std::runtime_error(message.empty() ? codeToString(code) : message), code_(code) {}

RouterError &RouterError::withSegment(const std::string &segment) {
    segment_ = segment;
    return *this;
}

RouterError &RouterError::withPath(const std::string &path) {
    path_ = path;
    return *this;
}

RouterError &RouterError::withRouteName(const std::string &routeName) {
    routeName_ = routeName;
    return *this;
}

RouterError &RouterError::withAttemptedRedirect(const State &redirect) {
    attemptedRedirect_ = redirect;
    return *this;
}

const char *RouterError::codeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::RouterNotStarted:
        return "NOT_STARTED";
    case ErrorCode::AlreadyStarted:
        return "ALREADY_STARTED";
    case ErrorCode::NoStartPathOrState:
        return "NO_START_PATH_OR_STATE";
    case ErrorCode::RouteNotFound:
        return "ROUTE_NOT_FOUND";
    case ErrorCode::SameStates:
        return "SAME_STATES";
    case ErrorCode::TransitionCancelled:
        return "CANCELLED";
    case ErrorCode::CannotActivate:
        return "CANNOT_ACTIVATE";
    case ErrorCode::CannotDeactivate:
        return "CANNOT_DEACTIVATE";
    case ErrorCode::TransitionError:
        return "TRANSITION_ERR";
    case ErrorCode::InvalidGuardHandler:
        return "INVALID_GUARD_HANDLER";
    case ErrorCode::GuardFactoryNotCallable:
        return "GUARD_FACTORY_NOT_CALLABLE";
    case ErrorCode::GuardSelfModification:
        return "GUARD_SELF_MODIFICATION";
    case ErrorCode::GuardLimitExceeded:
        return "GUARD_LIMIT_EXCEEDED";
    case ErrorCode::MiddlewareLimitExceeded:
        return "MIDDLEWARE_LIMIT_EXCEEDED";
    case ErrorCode::InvalidMiddleware:
        return "INVALID_MIDDLEWARE";
    case ErrorCode::OptionsLocked:
        return "OPTIONS_LOCKED";
    case ErrorCode::InvalidOption:
        return "INVALID_OPTION";
    }
    return "UNKNOWN_ERROR";
}

}  // namespace RNE
