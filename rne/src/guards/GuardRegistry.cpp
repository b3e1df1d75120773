// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "guards/GuardRegistry.h"
#include "common/Logger.h"
#include "common/RouterError.h"
#include "guards/RegistrationScope.h"

#include <memory>

namespace RNE {

GuardRegistry::GuardRegistry(const RouterLimits &limits) : limits_(limits) {}

void GuardRegistry::setLimits(const RouterLimits &limits) {
    limits_ = limits;
}

void GuardRegistry::registerGuard(GuardKind kind, const std::string &name, const GuardHandler &handler) {
    checkNotRegistering(kind, name, "register");

    Entries &entries = entriesFor(kind);
    bool isOverwrite = entries.compiled.count(name) > 0;

    if (!isOverwrite) {
        checkCapacity(kind, name);
    }

    // Compile before touching either map so that a failing factory leaves no trace
    GuardFn compiled = compile(kind, name, handler);

    if (isOverwrite) {
        LOG_WARN("GuardRegistry: Overwriting existing {} guard for route \"{}\"", toString(kind), name);
    } else {
        // The factory may have registered guards for other routes meanwhile
        checkCapacity(kind, name);
        checkCountThresholds(size() + 1);
    }

    entries.factories[name] = handler;
    entries.compiled[name] = std::move(compiled);

    LOG_DEBUG("GuardRegistry: Registered {} guard for route \"{}\" (total: {})", toString(kind), name, size());
}

void GuardRegistry::checkCapacity(GuardKind kind, const std::string &name) const {
    if (limits_.maxLifecycleHandlers != 0 && size() + 1 >= limits_.maxLifecycleHandlers) {
        throw RouterError(ErrorCode::GuardLimitExceeded,
                          fmt::format("Guard limit exceeded ({}). Cannot register {} guard for route \"{}\"",
                                      limits_.maxLifecycleHandlers, toString(kind), name))
            .withRouteName(name);
    }
}

bool GuardRegistry::clear(GuardKind kind, const std::string &name) {
    checkNotRegistering(kind, name, "clear");

    Entries &entries = entriesFor(kind);
    bool removedFactory = entries.factories.erase(name) > 0;
    bool removedCompiled = entries.compiled.erase(name) > 0;

    if (!removedFactory && !removedCompiled) {
        LOG_DEBUG("GuardRegistry: No {} guard registered for route \"{}\"", toString(kind), name);
        return false;
    }

    LOG_DEBUG("GuardRegistry: Cleared {} guard for route \"{}\"", toString(kind), name);
    return true;
}

void GuardRegistry::clearAll() {
    activation_ = Entries{};
    deactivation_ = Entries{};
    LOG_DEBUG("GuardRegistry: Cleared all guards");
}

bool GuardRegistry::hasGuard(GuardKind kind, const std::string &name) const {
    return entriesFor(kind).compiled.count(name) > 0;
}

std::size_t GuardRegistry::size() const {
    return activation_.compiled.size() + deactivation_.compiled.size();
}

std::size_t GuardRegistry::size(GuardKind kind) const {
    return entriesFor(kind).compiled.size();
}

std::optional<GuardFn> GuardRegistry::getGuard(GuardKind kind, const std::string &name) const {
    const Entries &entries = entriesFor(kind);
    auto it = entries.compiled.find(name);
    if (it == entries.compiled.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, GuardHandler> GuardRegistry::getFactories(GuardKind kind) const {
    return entriesFor(kind).factories;
}

std::vector<std::pair<std::string, GuardFn>> GuardRegistry::collect(GuardKind kind,
                                                                    const std::vector<std::string> &segments) const {
    const Entries &entries = entriesFor(kind);
    std::vector<std::pair<std::string, GuardFn>> guards;

    for (const auto &segment : segments) {
        auto it = entries.compiled.find(segment);
        if (it != entries.compiled.end()) {
            guards.emplace_back(segment, it->second);
        }
    }

    return guards;
}

bool GuardRegistry::checkGuardSync(GuardKind kind, const std::string &name, const State &toState,
                                   const std::optional<State> &fromState) const {
    auto guard = getGuard(kind, name);
    if (!guard) {
        return true;
    }

    // Shared so that a late answer from an async guard writes into live memory
    auto answer = std::make_shared<std::optional<GuardResult>>();

    try {
        (*guard)(toState, fromState, [answer](const GuardResult &result) {
            if (!answer->has_value()) {
                *answer = result;
            }
        });
    } catch (const std::exception &e) {
        LOG_DEBUG("GuardRegistry: {} guard for \"{}\" threw during sync check: {}", toString(kind), name, e.what());
        return false;
    }

    if (!answer->has_value()) {
        LOG_WARN("GuardRegistry: {} guard for \"{}\" did not answer synchronously. Sync check cannot resolve async "
                 "guards, returning false.",
                 toString(kind), name);
        return false;
    }

    return (*answer)->allowed;
}

GuardRegistry::Entries &GuardRegistry::entriesFor(GuardKind kind) {
    return kind == GuardKind::Activate ? activation_ : deactivation_;
}

const GuardRegistry::Entries &GuardRegistry::entriesFor(GuardKind kind) const {
    return kind == GuardKind::Activate ? activation_ : deactivation_;
}

GuardFn GuardRegistry::compile(GuardKind kind, const std::string &name, const GuardHandler &handler) {
    if (const bool *constant = std::get_if<bool>(&handler)) {
        return constantGuard(*constant);
    }

    const GuardFactory &factory = std::get<GuardFactory>(handler);
    if (!factory) {
        throw RouterError(ErrorCode::InvalidGuardHandler,
                          fmt::format("Invalid {} guard handler for route \"{}\": factory is empty", toString(kind),
                                      name))
            .withRouteName(name);
    }

    GuardFn fn;
    {
        RegistrationScope scope(compiling_, name);
        fn = factory(*this);
    }

    if (!fn) {
        throw RouterError(ErrorCode::GuardFactoryNotCallable,
                          fmt::format("Factory for {} guard \"{}\" must return a callable guard", toString(kind), name))
            .withRouteName(name);
    }

    return fn;
}

void GuardRegistry::checkNotRegistering(GuardKind kind, const std::string &name, const char *operation) const {
    if (isRegistering(name)) {
        throw RouterError(ErrorCode::GuardSelfModification,
                          fmt::format("Cannot {} {} guard for route \"{}\" while its own factory is running", operation,
                                      toString(kind), name))
            .withRouteName(name);
    }
}

void GuardRegistry::checkCountThresholds(std::size_t newSize) const {
    if (limits_.maxLifecycleHandlers == 0) {
        return;
    }

    if (newSize >= limits_.lifecycleErrorThreshold) {
        LOG_ERROR("GuardRegistry: {} lifecycle guards registered! This is excessive. Hard limit at {}.", newSize,
                  limits_.maxLifecycleHandlers);
    } else if (newSize >= limits_.lifecycleWarnThreshold) {
        LOG_WARN("GuardRegistry: {} lifecycle guards registered. Consider consolidating logic.", newSize);
    }
}

}  // namespace RNE
