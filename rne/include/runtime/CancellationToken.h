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
#include "runtime/RouterStatus.h"
#include <atomic>
#include <memory>

namespace RNE {

/**
 * @brief Cancellation state of a single transition
 *
 * Cancelled once cancel() is called or the owning router becomes inactive.
 * Copies share the same flag.
 */
class CancellationToken {
public:
    explicit CancellationToken(std::shared_ptr<const RouterStatus> status);

    void cancel();

    bool isCancelled() const;

    /**
     * @brief Predicate view for pipeline stages and middleware
     */
    CancellationPredicate predicate() const;

private:
    std::shared_ptr<const RouterStatus> status_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace RNE
