// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "runtime/MiddlewareChain.h"
#include "common/Logger.h"
#include "common/RouterError.h"

#include <algorithm>

namespace RNE {

MiddlewareChain::MiddlewareChain(const RouterLimits &limits) : limits_(limits) {}

void MiddlewareChain::setLimits(const RouterLimits &limits) {
    limits_ = limits;
}

std::size_t MiddlewareChain::use(MiddlewareFn middleware) {
    if (!middleware) {
        throw RouterError(ErrorCode::InvalidMiddleware, "Middleware must be a callable function");
    }

    std::size_t newSize = entries_.size() + 1;
    if (limits_.maxMiddleware != 0 && newSize > limits_.maxMiddleware) {
        throw RouterError(ErrorCode::MiddlewareLimitExceeded,
                          fmt::format("Middleware limit exceeded ({}). Current: {}. Consider consolidating middleware.",
                                      limits_.maxMiddleware, entries_.size()));
    }

    checkCountThresholds(newSize);

    std::size_t id = nextId_++;
    entries_.emplace_back(id, std::move(middleware));

    LOG_DEBUG("MiddlewareChain: Registered middleware #{} (total: {})", id, entries_.size());
    return id;
}

bool MiddlewareChain::remove(std::size_t id) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [id](const auto &entry) { return entry.first == id; });
    if (it == entries_.end()) {
        LOG_WARN("MiddlewareChain: Attempted to remove non-existent middleware #{}", id);
        return false;
    }

    entries_.erase(it);
    return true;
}

void MiddlewareChain::clear() {
    entries_.clear();
}

std::vector<MiddlewareFn> MiddlewareChain::snapshot() const {
    std::vector<MiddlewareFn> functions;
    functions.reserve(entries_.size());
    for (const auto &entry : entries_) {
        functions.push_back(entry.second);
    }
    return functions;
}

void MiddlewareChain::checkCountThresholds(std::size_t newSize) const {
    if (newSize >= limits_.middlewareErrorThreshold) {
        LOG_ERROR("MiddlewareChain: {} middleware registered! This is excessive and will impact performance. Hard "
                  "limit at {}.",
                  newSize, limits_.maxMiddleware);
    } else if (newSize >= limits_.middlewareWarnThreshold) {
        LOG_WARN("MiddlewareChain: {} middleware registered. Consider if all are necessary.", newSize);
    }
}

}  // namespace RNE
