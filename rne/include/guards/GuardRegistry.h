// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include "config/RouterOptions.h"
#include "guards/GuardTypes.h"
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace RNE {

/**
 * @brief Activation and deactivation guards keyed by segment name
 *
 * Handlers are compiled once at registration. A registration either commits
 * both the source handler and the compiled guard, or leaves the registry
 * untouched. While a factory for a name is running, registering or clearing
 * that same name throws GuardSelfModification; other names may be registered
 * from inside the factory.
 *
 * Not thread-safe: a registry belongs to one router and is mutated only from
 * the thread driving that router.
 */
class GuardRegistry {
public:
    explicit GuardRegistry(const RouterLimits &limits = RouterLimits{});

    void setLimits(const RouterLimits &limits);

    /**
     * @brief Compile and store a guard
     *
     * @throws RouterError GuardSelfModification, GuardLimitExceeded,
     *         InvalidGuardHandler or GuardFactoryNotCallable. Exceptions thrown
     *         by the factory itself propagate unchanged.
     */
    void registerGuard(GuardKind kind, const std::string &name, const GuardHandler &handler);

    /**
     * @brief Remove the source handler and compiled guard for @p name
     * @return false when nothing was registered under @p name
     * @throws RouterError GuardSelfModification while @p name is compiling
     */
    bool clear(GuardKind kind, const std::string &name);

    void clearAll();

    bool hasGuard(GuardKind kind, const std::string &name) const;

    /**
     * @brief Combined number of activation and deactivation entries
     */
    std::size_t size() const;
    std::size_t size(GuardKind kind) const;

    std::optional<GuardFn> getGuard(GuardKind kind, const std::string &name) const;

    /**
     * @brief Source handlers as registered, for cloning a configuration
     */
    std::map<std::string, GuardHandler> getFactories(GuardKind kind) const;

    /**
     * @brief Guards for @p segments that have one, in the order given
     */
    std::vector<std::pair<std::string, GuardFn>> collect(GuardKind kind, const std::vector<std::string> &segments) const;

    /**
     * @brief Run a guard and require a synchronous answer
     *
     * Missing guards allow. A guard that throws, or does not answer before
     * returning, is treated as a rejection.
     */
    bool checkGuardSync(GuardKind kind, const std::string &name, const State &toState,
                        const std::optional<State> &fromState) const;

    bool isRegistering(const std::string &name) const {
        return compiling_.count(name) > 0;
    }

private:
    struct Entries {
        std::map<std::string, GuardHandler> factories;
        std::map<std::string, GuardFn> compiled;
    };

    Entries &entriesFor(GuardKind kind);
    const Entries &entriesFor(GuardKind kind) const;

    GuardFn compile(GuardKind kind, const std::string &name, const GuardHandler &handler);
    void checkNotRegistering(GuardKind kind, const std::string &name, const char *operation) const;
    void checkCapacity(GuardKind kind, const std::string &name) const;
    void checkCountThresholds(std::size_t newSize) const;

    RouterLimits limits_;
    Entries activation_;
    Entries deactivation_;
    std::set<std::string> compiling_;
};

}  // namespace RNE
