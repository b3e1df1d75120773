// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "runtime/CancellationToken.h"

#include <stdexcept>

namespace RNE {

CancellationToken::CancellationToken(std::shared_ptr<const RouterStatus> status)
    : status_(std::move(status)), cancelled_(std::make_shared<std::atomic<bool>>(false)) {
    if (!status_) {
        throw std::invalid_argument("CancellationToken: router status cannot be null");
    }
}

void CancellationToken::cancel() {
    cancelled_->store(true);
}

bool CancellationToken::isCancelled() const {
    return cancelled_->load() || !status_->active.load();
}

CancellationPredicate CancellationToken::predicate() const {
    return [status = status_, cancelled = cancelled_]() { return cancelled->load() || !status->active.load(); };
}

}  // namespace RNE
