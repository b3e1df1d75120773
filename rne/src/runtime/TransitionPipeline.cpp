// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RNE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RNE (Route Navigation Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "runtime/TransitionPipeline.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/SegmentHelper.h"
#include "common/StateHelper.h"
#include "guards/GuardRegistry.h"
#include "runtime/MiddlewareChain.h"

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace RNE {

/**
 * @brief State of one pipeline execution
 *
 * Kept alive by the continuations handed to guards and middleware, so an
 * asynchronous answer arriving after the caller moved on still finds valid
 * memory. Once completed, further answers are ignored.
 */
class TransitionPipeline::Run : public std::enable_shared_from_this<TransitionPipeline::Run> {
public:
    Run(GuardRegistry &guards, const State &toState, const std::optional<State> &fromState,
        const NavigationOptions &options, CancellationPredicate isCancelled, std::vector<MiddlewareFn> middleware,
        TransitionCallback callback)
        : guards_(guards), toState_(toState), fromState_(fromState), options_(options),
          isCancelled_(std::move(isCancelled)), middleware_(std::move(middleware)), callback_(std::move(callback)),
          currentState_(toState) {}

    void start() {
        State pathTarget = toState_;
        pathTarget.meta.options.reload = pathTarget.meta.options.reload || options_.reload;
        SegmentHelper::TransitionPath path = SegmentHelper::getTransitionPath(pathTarget, fromState_);
        segments_.activated = path.toActivate;
        segments_.deactivated = path.toDeactivate;
        segments_.intersection = path.intersection;

        // Guards are snapshotted up front; registrations made while suspended apply to the next transition
        bool shouldDeactivate = fromState_.has_value() && !options_.forceDeactivate && !path.toDeactivate.empty();
        bool shouldActivate = !StateHelper::isUnknownRoute(toState_) && !path.toActivate.empty();

        if (shouldDeactivate) {
            deactivationGuards_ = guards_.collect(GuardKind::Deactivate, path.toDeactivate);
        }
        if (shouldActivate) {
            activationGuards_ = guards_.collect(GuardKind::Activate, path.toActivate);
        }

        LOG_DEBUG("TransitionPipeline: '{}' -> '{}' (deactivate: [{}], activate: [{}])",
                  fromState_ ? fromState_->name : std::string(), toState_.name, SegmentHelper::join(path.toDeactivate),
                  SegmentHelper::join(path.toActivate));

        phase_ = TransitionPhase::Deactivating;
        runGuard(GuardKind::Deactivate, 0);
    }

private:
    const std::vector<std::pair<std::string, GuardFn>> &guardsFor(GuardKind kind) const {
        return kind == GuardKind::Activate ? activationGuards_ : deactivationGuards_;
    }

    void runGuard(GuardKind kind, std::size_t index) {
        if (completed_) {
            return;
        }

        if (isCancelled_()) {
            fail(RouterError(ErrorCode::TransitionCancelled));
            return;
        }

        const auto &guards = guardsFor(kind);
        if (index >= guards.size()) {
            if (kind == GuardKind::Deactivate) {
                phase_ = TransitionPhase::Activating;
                runGuard(GuardKind::Activate, 0);
            } else {
                runMiddleware(0);
            }
            return;
        }

        const std::string &segment = guards[index].first;
        const GuardFn &guard = guards[index].second;
        auto self = shared_from_this();
        auto answered = std::make_shared<bool>(false);

        GuardCallback done = [self, kind, index, segment, answered](const GuardResult &result) {
            if (*answered) {
                return;
            }
            *answered = true;
            self->onGuardAnswer(kind, index, segment, result);
        };

        try {
            guard(currentState_, fromState_, done);
        } catch (const std::exception &e) {
            onGuardThrow(kind, segment, answered, e.what());
        } catch (...) {
            onGuardThrow(kind, segment, answered, "Guard threw a non-standard exception");
        }
    }

    // A throw before answering is a rejection; a throw after answering cannot change the outcome
    void onGuardThrow(GuardKind kind, const std::string &segment, const std::shared_ptr<bool> &answered,
                      const std::string &what) {
        if (*answered) {
            LOG_WARN("TransitionPipeline: {} guard for '{}' threw after answering: {}", toString(kind), segment, what);
            return;
        }
        *answered = true;
        fail(guardError(kind, segment, what));
    }

    void onGuardAnswer(GuardKind kind, std::size_t index, const std::string &segment, const GuardResult &result) {
        if (completed_) {
            return;
        }

        if (isCancelled_()) {
            fail(RouterError(ErrorCode::TransitionCancelled));
            return;
        }

        if (result.redirect) {
            fail(guardError(kind, segment, Constants::GUARD_REDIRECT_NOT_ALLOWED).withAttemptedRedirect(*result.redirect));
            return;
        }

        if (!result.allowed) {
            fail(guardError(kind, segment, result.message));
            return;
        }

        runGuard(kind, index + 1);
    }

    void runMiddleware(std::size_t index) {
        if (completed_) {
            return;
        }

        if (isCancelled_()) {
            fail(RouterError(ErrorCode::TransitionCancelled));
            return;
        }

        if (index >= middleware_.size()) {
            finish();
            return;
        }

        phase_ = TransitionPhase::Middleware;

        auto self = shared_from_this();
        auto answered = std::make_shared<bool>(false);

        MiddlewareCallback done = [self, index, answered](const MiddlewareResult &result) {
            if (*answered) {
                return;
            }
            *answered = true;
            self->onMiddlewareAnswer(index, result);
        };

        try {
            middleware_[index](currentState_, fromState_, isCancelled_, done);
        } catch (const std::exception &e) {
            onMiddlewareThrow(index, answered, e.what());
        } catch (...) {
            onMiddlewareThrow(index, answered, "Middleware threw a non-standard exception");
        }
    }

    void onMiddlewareThrow(std::size_t index, const std::shared_ptr<bool> &answered, const std::string &what) {
        if (*answered) {
            LOG_WARN("TransitionPipeline: Middleware #{} threw after answering: {}", index, what);
            return;
        }
        *answered = true;
        fail(RouterError(ErrorCode::TransitionError, what));
    }

    void onMiddlewareAnswer(std::size_t index, const MiddlewareResult &result) {
        if (completed_) {
            return;
        }

        if (isCancelled_()) {
            fail(RouterError(ErrorCode::TransitionCancelled));
            return;
        }

        switch (result.action) {
        case MiddlewareResult::Action::Reject:
            fail(RouterError(ErrorCode::TransitionError, result.message));
            return;
        case MiddlewareResult::Action::Replace:
            if (result.state) {
                State replaced = *result.state;
                if (replaced.name != currentState_.name) {
                    replaced.meta.redirected = true;
                    LOG_DEBUG("TransitionPipeline: Middleware redirected '{}' to '{}'", currentState_.name,
                              replaced.name);
                }
                currentState_ = std::move(replaced);
            }
            break;
        case MiddlewareResult::Action::Next:
            break;
        }

        runMiddleware(index + 1);
    }

    void finish() {
        if (fromState_) {
            cleanupDeactivationGuards();
        }
        complete(TransitionResult::createSuccess(currentState_, phase_, segments_));
    }

    // Deactivation guards of segments that are no longer active would otherwise
    // run against unrelated future states
    void cleanupDeactivationGuards() {
        std::vector<std::string> activeIds = SegmentHelper::nameToIds(currentState_.name);
        std::set<std::string> activeSet(activeIds.begin(), activeIds.end());

        for (const auto &segment : SegmentHelper::nameToIds(fromState_->name)) {
            if (activeSet.count(segment) == 0 && guards_.hasGuard(GuardKind::Deactivate, segment)) {
                guards_.clear(GuardKind::Deactivate, segment);
                LOG_DEBUG("TransitionPipeline: Removed deactivation guard of inactive segment '{}'", segment);
            }
        }
    }

    RouterError guardError(GuardKind kind, const std::string &segment, const std::string &message) const {
        ErrorCode code = kind == GuardKind::Activate ? ErrorCode::CannotActivate : ErrorCode::CannotDeactivate;
        RouterError error(code, message);
        error.withSegment(segment);
        return error;
    }

    void fail(const RouterError &error) {
        complete(TransitionResult::createError(error, phase_, segments_));
    }

    void complete(const TransitionResult &result) {
        if (completed_) {
            return;
        }
        completed_ = true;

        try {
            callback_(result);
        } catch (const std::exception &e) {
            LOG_ERROR("TransitionPipeline: Error in transition callback: {}", e.what());
        } catch (...) {
            LOG_ERROR("TransitionPipeline: Unknown error in transition callback");
        }
    }

    GuardRegistry &guards_;
    State toState_;
    std::optional<State> fromState_;
    NavigationOptions options_;
    CancellationPredicate isCancelled_;
    std::vector<MiddlewareFn> middleware_;
    TransitionCallback callback_;

    State currentState_;
    TransitionPhase phase_ = TransitionPhase::Deactivating;
    TransitionSegments segments_;
    std::vector<std::pair<std::string, GuardFn>> deactivationGuards_;
    std::vector<std::pair<std::string, GuardFn>> activationGuards_;
    bool completed_ = false;
};

TransitionPipeline::TransitionPipeline(GuardRegistry &guards, MiddlewareChain &middleware)
    : guards_(guards), middleware_(middleware) {}

void TransitionPipeline::run(const State &toState, const std::optional<State> &fromState,
                             const NavigationOptions &options, CancellationPredicate isCancelled,
                             TransitionCallback callback) {
    if (!isCancelled) {
        isCancelled = []() { return false; };
    }

    auto execution = std::make_shared<Run>(guards_, toState, fromState, options, std::move(isCancelled),
                                           middleware_.snapshot(), std::move(callback));
    execution->start();
}

}  // namespace RNE
