// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include <set>
#include <string>

namespace RNE {

/**
 * @brief RAII guard that marks a segment name as "being registered"
 *
 * GuardRegistry rejects any registration or clear for a name present in the
 * compiling set. The mark is removed on every exit path of the factory call,
 * including exceptions thrown by user factories.
 *
 * Usage:
 * @code
 * {
 *     RegistrationScope scope(compiling_, name);
 *     GuardFn fn = factory(*this);
 * }  // name removed from compiling_
 * @endcode
 */
class RegistrationScope {
public:
    /**
     * @brief Mark @p name as compiling
     * @param compiling Set owned by the registry
     * @param name Segment name whose factory is about to run
     */
    explicit RegistrationScope(std::set<std::string> &compiling, const std::string &name)
        : compiling_(compiling), name_(name) {
        compiling_.insert(name_);
    }

    /**
     * @brief Destructor removes the mark
     * @note noexcept to prevent exception propagation during stack unwinding
     */
    ~RegistrationScope() noexcept {
        compiling_.erase(name_);
    }

    // Non-copyable, non-movable (RAII idiom)
    RegistrationScope(const RegistrationScope &) = delete;
    RegistrationScope &operator=(const RegistrationScope &) = delete;
    RegistrationScope(RegistrationScope &&) = delete;
    RegistrationScope &operator=(RegistrationScope &&) = delete;

private:
    std::set<std::string> &compiling_;
    std::string name_;
};

}  // namespace RNE
