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
#include "common/RouterError.h"
#include <optional>

namespace RNE {

/**
 * @brief Payload of a router notification
 */
struct RouterNotification {
    RouterEvent event = RouterEvent::TransitionStart;
    std::optional<State> toState;
    std::optional<State> fromState;
    std::optional<RouterError> error;
    std::optional<NavigationOptions> options;
};

/**
 * @brief Receiver of lifecycle and transition notifications
 *
 * Every navigation attempt that passes the not-started check produces exactly
 * one terminal notification: TransitionSuccess, TransitionError,
 * TransitionCancel or TransitionBlocked. TransitionSuccess is skipped for the
 * start transition, which reports RouterStart followed by TransitionSuccess
 * from the lifecycle instead.
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual void notify(const RouterNotification &notification) = 0;
};

}  // namespace RNE
