#include "runtime/RouterLifecycle.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/RouterError.h"
#include "common/TestUtils.h"
#include "config/OptionsStore.h"
#include "mocks/MockRouteResolver.h"
#include "mocks/RecordingNotificationSink.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>

using namespace RNE;
using namespace RNE::Test;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

/**
 * Drives RouterLifecycle with a scripted coordinator: each runTransition call
 * is recorded and answered either immediately or when the test says so.
 */
class RouterLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto backend = std::make_unique<CapturingLoggerBackend>();
        logs_ = backend.get();
        Logger::setBackend(std::move(backend));

        ON_CALL(routes_, matchPath(_)).WillByDefault(Return(std::nullopt));
        ON_CALL(routes_, resolve(_, _)).WillByDefault(Return(std::nullopt));
        ON_CALL(routes_, hasRoute(_)).WillByDefault(Return(false));

        LifecycleCapabilities capabilities;
        capabilities.runTransition = [this](const State &toState, const NavigationOptions &options,
                                            NavigationCallback callback) {
            transitions_.push_back(toState);
            transitionOptions_.push_back(options);
            activeDuringTransition_ = status_->active;
            if (deferTransitions_) {
                pendingCallback_ = std::move(callback);
                return;
            }
            callback(transitionOutcome_ ? NavigationResult::createError(*transitionOutcome_)
                                        : NavigationResult::createSuccess(toState));
        };
        capabilities.cancelTransition = [this]() {
            ++cancelCount_;
            return false;
        };
        capabilities.clearState = [this]() { ++clearCount_; };
        capabilities.isNavigating = [this]() { return navigating_; };

        lifecycle_ = std::make_unique<RouterLifecycle>(status_, capabilities, routes_, options_, sink_);
    }

    void TearDown() override {
        lifecycle_.reset();
        Logger::reset();
    }

    void expectPath(const std::string &path, const std::string &name) {
        ON_CALL(routes_, matchPath(path)).WillByDefault(Return(makeState(name, {}, path)));
    }

    std::shared_ptr<RouterStatus> status_ = std::make_shared<RouterStatus>();
    NiceMock<MockRouteResolver> routes_;
    OptionsStore options_;
    RecordingNotificationSink sink_;
    std::unique_ptr<RouterLifecycle> lifecycle_;
    CapturingLoggerBackend *logs_ = nullptr;

    std::vector<State> transitions_;
    std::vector<NavigationOptions> transitionOptions_;
    bool activeDuringTransition_ = false;
    bool deferTransitions_ = false;
    NavigationCallback pendingCallback_;
    std::optional<RouterError> transitionOutcome_;
    int cancelCount_ = 0;
    int clearCount_ = 0;
    bool navigating_ = false;
};

TEST_F(RouterLifecycleTest, Start_ActiveDuringTransitionStartedAfterCommit) {
    expectPath("/home", "home");
    deferTransitions_ = true;

    ResultCollector collector;
    lifecycle_->start("/home", collector.callback());

    EXPECT_TRUE(activeDuringTransition_);
    EXPECT_TRUE(lifecycle_->isActive());
    EXPECT_FALSE(lifecycle_->isStarted());
    EXPECT_FALSE(options_.isLocked());
    EXPECT_EQ(sink_.count(RouterEvent::RouterStart), 0);

    pendingCallback_(NavigationResult::createSuccess(transitions_.front()));

    EXPECT_TRUE(lifecycle_->isStarted());
    EXPECT_TRUE(options_.isLocked());
    EXPECT_EQ(sink_.getEvents(), (std::vector<RouterEvent>{RouterEvent::RouterStart, RouterEvent::TransitionSuccess}));
    ASSERT_EQ(collector.count(), 1u);
    EXPECT_TRUE(collector.last().success);
    EXPECT_TRUE(transitionOptions_.front().replace);
}

TEST_F(RouterLifecycleTest, Start_NoPathNoDefault_FailsWithoutActivating) {
    ResultCollector collector;
    lifecycle_->start(collector.callback());

    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::NoStartPathOrState);
    EXPECT_FALSE(lifecycle_->isActive());
    EXPECT_TRUE(transitions_.empty());
    EXPECT_EQ(sink_.getEvents(), (std::vector<RouterEvent>{RouterEvent::TransitionError}));
}

TEST_F(RouterLifecycleTest, Start_DefaultRouteResolvedByName) {
    options_.setOption("defaultRoute", "home");
    options_.setOption("defaultParams", json{{"lang", "en"}});
    EXPECT_CALL(routes_, resolve("home", Params{{"lang", "en"}})).WillOnce([](const std::string &, const Params &p) {
        ResolvedRoute resolved;
        resolved.state = makeState("home", p);
        return std::optional<ResolvedRoute>(resolved);
    });

    ResultCollector collector;
    lifecycle_->start(collector.callback());

    ASSERT_TRUE(collector.last().success);
    ASSERT_EQ(transitions_.size(), 1u);
    EXPECT_EQ(transitions_.front().name, "home");
    EXPECT_EQ(transitions_.front().params.at("lang"), "en");
    EXPECT_TRUE(lifecycle_->isStarted());
}

TEST_F(RouterLifecycleTest, Start_UnknownDefaultRoute_FailsAndStops) {
    options_.setOption("defaultRoute", "ghost");

    ResultCollector collector;
    lifecycle_->start(collector.callback());

    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::RouteNotFound);
    EXPECT_EQ(collector.last().error->getRouteName(), "ghost");
    EXPECT_FALSE(lifecycle_->isActive());
    EXPECT_EQ(sink_.count(RouterEvent::TransitionError), 1);
}

TEST_F(RouterLifecycleTest, Start_UnmatchedExplicitPath_NeverFallsBackToDefault) {
    options_.setOption("defaultRoute", "home");
    EXPECT_CALL(routes_, resolve(_, _)).Times(0);

    ResultCollector collector;
    lifecycle_->start("/nowhere", collector.callback());

    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::RouteNotFound);
    EXPECT_EQ(collector.last().error->getPath(), "/nowhere");
    EXPECT_TRUE(transitions_.empty());
    EXPECT_FALSE(lifecycle_->isActive());
    EXPECT_FALSE(lifecycle_->isStarted());
}

TEST_F(RouterLifecycleTest, Start_UnmatchedPathWithAllowNotFound_EntersUnknownRoute) {
    options_.setOption("allowNotFound", true);

    ResultCollector collector;
    lifecycle_->start("/nowhere", collector.callback());

    ASSERT_TRUE(collector.last().success);
    ASSERT_EQ(transitions_.size(), 1u);
    EXPECT_EQ(transitions_.front().name, Constants::UNKNOWN_ROUTE);
    EXPECT_EQ(transitions_.front().path, "/nowhere");
    EXPECT_EQ(transitions_.front().params.at(Constants::UNKNOWN_ROUTE_PATH_PARAM), "/nowhere");
    EXPECT_TRUE(lifecycle_->isStarted());
}

TEST_F(RouterLifecycleTest, Start_FromState_RequiresExistingRoute) {
    ResultCollector collector;
    lifecycle_->start(makeState("ghost"), collector.callback());
    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::RouteNotFound);
    EXPECT_FALSE(lifecycle_->isActive());

    EXPECT_CALL(routes_, hasRoute("home")).WillOnce(Return(true));
    lifecycle_->start(makeState("home"), collector.callback());
    EXPECT_TRUE(collector.last().success);
    EXPECT_TRUE(lifecycle_->isStarted());
}

TEST_F(RouterLifecycleTest, Start_WhileStartingOrStarted_RejectedWithAlreadyStarted) {
    expectPath("/home", "home");
    deferTransitions_ = true;

    ResultCollector first;
    ResultCollector second;
    lifecycle_->start("/home", first.callback());
    lifecycle_->start("/home", second.callback());

    EXPECT_EQ(second.lastErrorCode(), ErrorCode::AlreadyStarted);
    EXPECT_EQ(transitions_.size(), 1u);

    pendingCallback_(NavigationResult::createSuccess(transitions_.front()));
    lifecycle_->start("/home", second.callback());

    EXPECT_EQ(second.count(), 2u);
    EXPECT_EQ(second.lastErrorCode(), ErrorCode::AlreadyStarted);
    EXPECT_EQ(first.count(), 1u);
}

TEST_F(RouterLifecycleTest, Start_TransitionFailure_ResetsActiveWithoutDuplicateErrorEvent) {
    expectPath("/admin", "admin");
    transitionOutcome_ = RouterError(ErrorCode::CannotActivate).withSegment("admin");

    ResultCollector collector;
    lifecycle_->start("/admin", collector.callback());

    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::CannotActivate);
    EXPECT_FALSE(lifecycle_->isActive());
    EXPECT_FALSE(lifecycle_->isStarted());
    EXPECT_FALSE(options_.isLocked());
    // The coordinator owns notifications for pipeline failures
    EXPECT_TRUE(sink_.getNotifications().empty());
}

TEST_F(RouterLifecycleTest, Stop_IsIdempotentAndUnlocksOptions) {
    expectPath("/home", "home");
    lifecycle_->start("/home", {});
    ASSERT_TRUE(lifecycle_->isStarted());
    ASSERT_TRUE(options_.isLocked());
    sink_.clear();

    lifecycle_->stop();
    lifecycle_->stop();

    EXPECT_FALSE(lifecycle_->isActive());
    EXPECT_FALSE(lifecycle_->isStarted());
    EXPECT_FALSE(options_.isLocked());
    EXPECT_EQ(sink_.getEvents(), (std::vector<RouterEvent>{RouterEvent::RouterStop}));
    EXPECT_EQ(clearCount_, 1);
    EXPECT_EQ(cancelCount_, 2);
}

TEST_F(RouterLifecycleTest, Stop_DuringStart_CancelsWithoutStopEvent) {
    expectPath("/home", "home");
    deferTransitions_ = true;
    lifecycle_->start("/home", {});

    lifecycle_->stop();

    EXPECT_FALSE(lifecycle_->isActive());
    EXPECT_EQ(cancelCount_, 1);
    EXPECT_EQ(sink_.count(RouterEvent::RouterStop), 0);
}

TEST_F(RouterLifecycleTest, LockedOptions_OnlyDefaultsRemainWritable) {
    expectPath("/home", "home");
    lifecycle_->start("/home", {});
    ASSERT_TRUE(options_.isLocked());

    EXPECT_NO_THROW(options_.setOption("defaultRoute", "dashboard"));
    try {
        options_.setOption("allowNotFound", true);
        FAIL() << "Expected OptionsLocked";
    } catch (const RouterError &e) {
        EXPECT_EQ(e.getCode(), ErrorCode::OptionsLocked);
    }

    lifecycle_->stop();
    EXPECT_NO_THROW(options_.setOption("allowNotFound", true));
}

TEST_F(RouterLifecycleTest, StartSupersededByNavigation_StartedWhenNavigationCommits) {
    expectPath("/home", "home");
    deferTransitions_ = true;

    ResultCollector collector;
    lifecycle_->start("/home", collector.callback());

    // A navigation replaces the start transition while it is suspended
    navigating_ = true;
    pendingCallback_(NavigationResult::createError(RouterError(ErrorCode::TransitionCancelled)));

    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::TransitionCancelled);
    EXPECT_TRUE(lifecycle_->isActive());
    EXPECT_FALSE(lifecycle_->isStarted());
    EXPECT_TRUE(sink_.getNotifications().empty());

    navigating_ = false;
    lifecycle_->onNavigationSettled(NavigationResult::createSuccess(makeState("about")));

    EXPECT_TRUE(lifecycle_->isStarted());
    EXPECT_TRUE(options_.isLocked());
    EXPECT_EQ(sink_.getEvents(), (std::vector<RouterEvent>{RouterEvent::RouterStart}));
}

TEST_F(RouterLifecycleTest, StartSupersededByNavigation_NavigationFailureStopsRouter) {
    expectPath("/home", "home");
    deferTransitions_ = true;
    lifecycle_->start("/home", {});

    navigating_ = true;
    pendingCallback_(NavigationResult::createError(RouterError(ErrorCode::TransitionCancelled)));
    ASSERT_TRUE(lifecycle_->isActive());

    navigating_ = false;
    lifecycle_->onNavigationSettled(NavigationResult::createError(RouterError(ErrorCode::CannotActivate)));

    EXPECT_FALSE(lifecycle_->isActive());
    EXPECT_FALSE(lifecycle_->isStarted());
    EXPECT_EQ(sink_.count(RouterEvent::RouterStart), 0);
}

TEST_F(RouterLifecycleTest, StartCancelledWithoutSuccessor_StopsRouter) {
    expectPath("/home", "home");
    deferTransitions_ = true;
    lifecycle_->start("/home", {});

    pendingCallback_(NavigationResult::createError(RouterError(ErrorCode::TransitionCancelled)));
    lifecycle_->onNavigationSettled(NavigationResult::createSuccess(makeState("about")));

    EXPECT_FALSE(lifecycle_->isActive());
    EXPECT_FALSE(lifecycle_->isStarted());
}
