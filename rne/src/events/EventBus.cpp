// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "events/EventBus.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace RNE {

std::size_t EventBus::addEventListener(RouterEvent event, RouterEventListener listener) {
    if (!listener) {
        throw std::invalid_argument("EventBus: listener cannot be empty");
    }

    std::size_t id = nextId_++;
    listeners_[event].emplace_back(id, std::move(listener));
    return id;
}

bool EventBus::removeEventListener(std::size_t id) {
    for (auto &[event, entries] : listeners_) {
        auto it = std::find_if(entries.begin(), entries.end(), [id](const auto &entry) { return entry.first == id; });
        if (it != entries.end()) {
            entries.erase(it);
            return true;
        }
    }

    LOG_DEBUG("EventBus: No listener registered with id {}", id);
    return false;
}

bool EventBus::hasListeners(RouterEvent event) const {
    auto it = listeners_.find(event);
    return it != listeners_.end() && !it->second.empty();
}

bool EventBus::isRegistered(RouterEvent event, std::size_t id) const {
    auto it = listeners_.find(event);
    return it != listeners_.end() && std::any_of(it->second.begin(), it->second.end(),
                                                 [id](const auto &entry) { return entry.first == id; });
}

void EventBus::clear() {
    listeners_.clear();
}

void EventBus::notify(const RouterNotification &notification) {
    auto it = listeners_.find(notification.event);
    if (it == listeners_.end() || it->second.empty()) {
        return;
    }

    // Copy so that listeners can unsubscribe during dispatch
    auto snapshot = it->second;

    for (const auto &[id, listener] : snapshot) {
        // Removed by an earlier listener of this dispatch
        if (!isRegistered(notification.event, id)) {
            continue;
        }

        try {
            listener(notification);
        } catch (const std::exception &e) {
            LOG_ERROR("EventBus: Listener #{} for {} threw: {}", id, toString(notification.event), e.what());
        } catch (...) {
            LOG_ERROR("EventBus: Listener #{} for {} threw a non-standard exception", id,
                      toString(notification.event));
        }
    }
}

}  // namespace RNE
