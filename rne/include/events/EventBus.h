// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include "events/INotificationSink.h"
#include <cstddef>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace RNE {

using RouterEventListener = std::function<void(const RouterNotification &)>;

/**
 * @brief Default notification sink dispatching to registered listeners
 *
 * Listeners of one event run in registration order. A listener that throws is
 * logged and does not prevent the remaining listeners from running. Listeners
 * may add or remove listeners while being notified; changes apply to the next
 * notification.
 */
class EventBus : public INotificationSink {
public:
    EventBus() = default;
    ~EventBus() override = default;

    /**
     * @return Listener id for removeEventListener()
     */
    std::size_t addEventListener(RouterEvent event, RouterEventListener listener);

    bool removeEventListener(std::size_t id);

    bool hasListeners(RouterEvent event) const;

    void clear();

    void notify(const RouterNotification &notification) override;

private:
    bool isRegistered(RouterEvent event, std::size_t id) const;

    std::map<RouterEvent, std::vector<std::pair<std::size_t, RouterEventListener>>> listeners_;
    std::size_t nextId_ = 1;
};

}  // namespace RNE
