// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include <atomic>

namespace RNE {

/**
 * @brief Lifecycle flags of one router instance
 *
 * STOPPED:  active=false, started=false
 * STARTING: active=true,  started=false
 * STARTED:  active=true,  started=true
 *
 * Shared by every cancellation token the router hands out; clearing active
 * cancels all of them at once.
 */
struct RouterStatus {
    std::atomic<bool> active{false};
    std::atomic<bool> started{false};
};

}  // namespace RNE
