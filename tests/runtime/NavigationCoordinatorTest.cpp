#include "runtime/NavigationCoordinator.h"
#include "common/Logger.h"
#include "common/StateHelper.h"
#include "common/TestUtils.h"
#include "config/OptionsStore.h"
#include "guards/GuardRegistry.h"
#include "mocks/MockRouteResolver.h"
#include "mocks/RecordingNotificationSink.h"
#include "runtime/MiddlewareChain.h"
#include "runtime/TransitionPipeline.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using namespace RNE;
using namespace RNE::Test;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class NavigationCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto backend = std::make_unique<CapturingLoggerBackend>();
        logs_ = backend.get();
        Logger::setBackend(std::move(backend));

        status_->active = true;
        status_->started = true;

        ON_CALL(routes_, resolve(_, _)).WillByDefault([](const std::string &name, const Params &params) {
            ResolvedRoute resolved;
            resolved.state = makeState(name, params);
            return std::optional<ResolvedRoute>(resolved);
        });
        ON_CALL(routes_, hasRoute(_)).WillByDefault(Return(true));
        ON_CALL(routes_, statesEqual(_, _, _)).WillByDefault([](const State &a, const State &b, bool ignoreQuery) {
            return StateHelper::areStatesEqual(a, b, ignoreQuery);
        });

        coordinator_ = std::make_unique<NavigationCoordinator>(status_, routes_, pipeline_, sink_, options_);
    }

    void TearDown() override {
        coordinator_.reset();
        Logger::reset();
    }

    void navigateTo(const std::string &name, ResultCollector &collector, const NavigationOptions &options = {}) {
        coordinator_->navigate(name, {}, options, collector.callback());
    }

    std::shared_ptr<RouterStatus> status_ = std::make_shared<RouterStatus>();
    NiceMock<MockRouteResolver> routes_;
    GuardRegistry guards_;
    MiddlewareChain middleware_;
    TransitionPipeline pipeline_{guards_, middleware_};
    RecordingNotificationSink sink_;
    OptionsStore options_;
    std::unique_ptr<NavigationCoordinator> coordinator_;
    CapturingLoggerBackend *logs_ = nullptr;
};

TEST_F(NavigationCoordinatorTest, NotStarted_RejectedWithoutNotificationOrResolution) {
    status_->active = false;
    EXPECT_CALL(routes_, resolve(_, _)).Times(0);

    ResultCollector collector;
    navigateTo("home", collector);

    ASSERT_EQ(collector.count(), 1u);
    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::RouterNotStarted);
    EXPECT_TRUE(sink_.getNotifications().empty());
}

TEST_F(NavigationCoordinatorTest, RouteNotFound_NotifiesErrorAndKeepsState) {
    ResultCollector collector;
    navigateTo("home", collector);
    ASSERT_TRUE(collector.last().success);
    sink_.clear();

    EXPECT_CALL(routes_, resolve("missing", _)).WillOnce(Return(std::nullopt));
    navigateTo("missing", collector);

    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::RouteNotFound);
    EXPECT_EQ(collector.last().error->getRouteName(), "missing");
    EXPECT_EQ(sink_.getEvents(), (std::vector<RouterEvent>{RouterEvent::TransitionError}));
    EXPECT_EQ(coordinator_->getState()->name, "home");
}

TEST_F(NavigationCoordinatorTest, SameStates_FailsWithoutRunningPipeline) {
    std::vector<std::string> calls;
    guards_.registerGuard(GuardKind::Activate, "home", guardHandler(recordingGuard(calls, "+home")));

    ResultCollector collector;
    navigateTo("home", collector);
    State committed = *coordinator_->getState();
    sink_.clear();

    navigateTo("home", collector);

    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::SameStates);
    EXPECT_EQ(calls.size(), 1u);
    EXPECT_EQ(*coordinator_->getState(), committed);
    EXPECT_EQ(sink_.getEvents(), (std::vector<RouterEvent>{RouterEvent::TransitionError}));
    EXPECT_FALSE(logs_->contains(LogLevel::Error, "SAME_STATES"));
}

TEST_F(NavigationCoordinatorTest, SameStates_BypassedByReloadOrForce) {
    ResultCollector collector;
    navigateTo("home", collector);

    NavigationOptions reload;
    reload.reload = true;
    navigateTo("home", collector, reload);
    EXPECT_TRUE(collector.last().success);

    NavigationOptions force;
    force.force = true;
    navigateTo("home", collector, force);
    EXPECT_TRUE(collector.last().success);
}

TEST_F(NavigationCoordinatorTest, SameStates_QueryOnlyChangeHonorsIgnoreQueryParams) {
    ON_CALL(routes_, resolve(_, _)).WillByDefault([](const std::string &name, const Params &params) {
        ResolvedRoute resolved;
        resolved.state = makeState(name, params);
        for (const auto &[key, value] : params) {
            resolved.state.meta.paramsBySegment[name][key] = key == "id" ? ParamSource::Url : ParamSource::Query;
        }
        return std::optional<ResolvedRoute>(resolved);
    });

    ResultCollector collector;
    coordinator_->navigate("users", {{"id", "1"}, {"tab", "a"}}, {}, collector.callback());
    coordinator_->navigate("users", {{"id", "1"}, {"tab", "b"}}, {}, collector.callback());
    EXPECT_TRUE(collector.last().success);

    options_.setOption("ignoreQueryParams", true);
    coordinator_->navigate("users", {{"id", "1"}, {"tab", "c"}}, {}, collector.callback());
    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::SameStates);
}

TEST_F(NavigationCoordinatorTest, Supersession_PendingTransitionCancelledAndLateResultDiscarded) {
    ManualScheduler scheduler;
    guards_.registerGuard(GuardKind::Activate, "a", guardHandler(scheduler.deferredGuard("a")));

    ResultCollector first;
    ResultCollector second;
    navigateTo("a", first);
    EXPECT_TRUE(coordinator_->isNavigating());
    EXPECT_EQ(first.count(), 0u);

    navigateTo("b", second);

    ASSERT_EQ(first.count(), 1u);
    EXPECT_EQ(first.lastErrorCode(), ErrorCode::TransitionCancelled);
    ASSERT_EQ(second.count(), 1u);
    EXPECT_TRUE(second.last().success);
    EXPECT_EQ(coordinator_->getState()->name, "b");
    EXPECT_TRUE(logs_->contains(LogLevel::Warn, "Concurrent navigation detected"));

    // The guard of "a" answers long after it was superseded
    scheduler.runAll();

    EXPECT_EQ(first.count(), 1u);
    EXPECT_EQ(coordinator_->getState()->name, "b");
    EXPECT_EQ(sink_.count(RouterEvent::TransitionCancel), 1);
    EXPECT_EQ(sink_.count(RouterEvent::TransitionSuccess), 1);
    EXPECT_FALSE(coordinator_->isNavigating());
}

TEST_F(NavigationCoordinatorTest, Supersession_CancelNotifiedBeforeNewTransitionStarts) {
    ManualScheduler scheduler;
    guards_.registerGuard(GuardKind::Activate, "a", guardHandler(scheduler.deferredGuard("a")));

    ResultCollector collector;
    navigateTo("a", collector);
    navigateTo("b", collector);

    EXPECT_EQ(sink_.getEvents(),
              (std::vector<RouterEvent>{RouterEvent::TransitionStart, RouterEvent::TransitionCancel,
                                        RouterEvent::TransitionStart, RouterEvent::TransitionSuccess}));
}

TEST_F(NavigationCoordinatorTest, GuardRejection_RoutedToBlocked) {
    guards_.registerGuard(GuardKind::Activate, "admin", false);

    ResultCollector collector;
    navigateTo("admin", collector);

    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::CannotActivate);
    EXPECT_EQ(sink_.count(RouterEvent::TransitionBlocked), 1);
    EXPECT_EQ(sink_.count(RouterEvent::TransitionError), 0);
    EXPECT_FALSE(coordinator_->getState().has_value());
}

TEST_F(NavigationCoordinatorTest, MiddlewareRejection_RoutedToError) {
    middleware_.use([](const State &, const std::optional<State> &, const CancellationPredicate &,
                       MiddlewareCallback done) { done(MiddlewareResult::reject("nope")); });

    ResultCollector collector;
    navigateTo("admin", collector);

    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::TransitionError);
    EXPECT_EQ(sink_.count(RouterEvent::TransitionError), 1);
    EXPECT_EQ(sink_.count(RouterEvent::TransitionBlocked), 0);
}

TEST_F(NavigationCoordinatorTest, RouteRemovedDuringGuard_FailsWithRouteNotFound) {
    ManualScheduler scheduler;
    guards_.registerGuard(GuardKind::Activate, "reports", guardHandler(scheduler.deferredGuard("reports")));

    ResultCollector collector;
    navigateTo("reports", collector);

    EXPECT_CALL(routes_, hasRoute("reports")).WillOnce(Return(false));
    scheduler.runAll();

    ASSERT_EQ(collector.count(), 1u);
    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::RouteNotFound);
    EXPECT_EQ(collector.last().error->getRouteName(), "reports");
    EXPECT_FALSE(coordinator_->getState().has_value());
    EXPECT_EQ(sink_.count(RouterEvent::TransitionError), 1);
    EXPECT_EQ(sink_.count(RouterEvent::TransitionSuccess), 0);
}

TEST_F(NavigationCoordinatorTest, Commit_StampsTransitionMetadata) {
    ResultCollector collector;
    navigateTo("home", collector);
    coordinator_->navigate("users.view", {{"id", "3"}}, {}, collector.callback());

    ASSERT_TRUE(collector.last().success);
    const State &state = *coordinator_->getState();
    ASSERT_TRUE(state.transition.has_value());
    EXPECT_EQ(state.transition->reason, "success");
    EXPECT_EQ(state.transition->from, "home");
    EXPECT_EQ(state.transition->phase, TransitionPhase::Activating);
    EXPECT_EQ(state.transition->segments.activated, (std::vector<std::string>{"users", "users.view"}));
    EXPECT_EQ(state.transition->segments.deactivated, (std::vector<std::string>{"home"}));
    EXPECT_GE(state.transition->duration.count(), 0);
    EXPECT_EQ(*collector.last().state, state);
}

TEST_F(NavigationCoordinatorTest, EmitSuccessFalse_SuppressesSuccessNotification) {
    ResultCollector collector;
    coordinator_->navigateToState(makeState("home"), std::nullopt, {}, false, collector.callback());

    EXPECT_TRUE(collector.last().success);
    EXPECT_EQ(sink_.getEvents(), (std::vector<RouterEvent>{RouterEvent::TransitionStart}));
}

TEST_F(NavigationCoordinatorTest, ThrowingCallback_LoggedAndStateStillCommitted) {
    coordinator_->navigate("home", {}, {}, [](const NavigationResult &) { throw std::runtime_error("ui crashed"); });

    EXPECT_EQ(coordinator_->getState()->name, "home");
    EXPECT_TRUE(logs_->contains(LogLevel::Error, "ui crashed"));
}

TEST_F(NavigationCoordinatorTest, Cancel_SettlesOutstandingTransition) {
    ManualScheduler scheduler;
    guards_.registerGuard(GuardKind::Activate, "slow", guardHandler(scheduler.deferredGuard("slow")));

    ResultCollector collector;
    navigateTo("slow", collector);

    EXPECT_TRUE(coordinator_->cancel());
    EXPECT_FALSE(coordinator_->cancel());
    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::TransitionCancelled);
    EXPECT_FALSE(coordinator_->isNavigating());

    scheduler.runAll();
    EXPECT_EQ(collector.count(), 1u);
    EXPECT_FALSE(coordinator_->getState().has_value());
}

TEST_F(NavigationCoordinatorTest, NavigateToDefault_UsesDefaultRouteAndParams) {
    ResultCollector collector;
    coordinator_->navigateToDefault({}, collector.callback());
    EXPECT_EQ(collector.lastErrorCode(), ErrorCode::RouteNotFound);

    options_.setOption("defaultRoute", "dashboard");
    options_.setOption("defaultParams", json{{"tab", "summary"}});
    coordinator_->navigateToDefault({}, collector.callback());

    ASSERT_TRUE(collector.last().success);
    EXPECT_EQ(collector.last().state->name, "dashboard");
    EXPECT_EQ(collector.last().state->params.at("tab"), "summary");
}

TEST_F(NavigationCoordinatorTest, ExactlyOneTerminalNotificationPerAttempt) {
    guards_.registerGuard(GuardKind::Activate, "blocked", false);

    ResultCollector collector;
    navigateTo("home", collector);
    navigateTo("home", collector);
    navigateTo("blocked", collector);

    int terminal = sink_.count(RouterEvent::TransitionSuccess) + sink_.count(RouterEvent::TransitionError) +
                   sink_.count(RouterEvent::TransitionCancel) + sink_.count(RouterEvent::TransitionBlocked);
    EXPECT_EQ(terminal, 3);
    EXPECT_EQ(collector.count(), 3u);
}
