#include "config/OptionsStore.h"
#include "common/Logger.h"
#include "common/RouterError.h"
#include "common/TestUtils.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>

using namespace RNE;
using namespace RNE::Test;

class OptionsStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setBackend(std::make_unique<CapturingLoggerBackend>());
    }

    void TearDown() override {
        Logger::reset();
    }

    static ErrorCode codeOf(const std::function<void()> &fn) {
        try {
            fn();
        } catch (const RouterError &e) {
            return e.getCode();
        }
        ADD_FAILURE() << "Expected RouterError";
        return ErrorCode::TransitionError;
    }

    OptionsStore store_;
};

TEST_F(OptionsStoreTest, Defaults) {
    auto options = store_.get();

    EXPECT_TRUE(options->defaultRoute.empty());
    EXPECT_FALSE(options->allowNotFound);
    EXPECT_FALSE(options->ignoreQueryParams);
    EXPECT_EQ(options->limits.maxLifecycleHandlers, 200u);
    EXPECT_EQ(options->limits.maxMiddleware, 50u);
}

TEST_F(OptionsStoreTest, SetOption_ReplacesSnapshot) {
    auto before = store_.get();

    store_.setOption("allowNotFound", true);

    EXPECT_FALSE(before->allowNotFound);
    EXPECT_TRUE(store_.get()->allowNotFound);
}

TEST_F(OptionsStoreTest, Locked_OnlyDefaultRouteAndParamsMayChange) {
    store_.lock();

    EXPECT_NO_THROW(store_.setOption("defaultRoute", "home"));
    EXPECT_NO_THROW(store_.setOption("defaultParams", json{{"page", "1"}}));
    EXPECT_EQ(codeOf([this]() { store_.setOption("allowNotFound", true); }), ErrorCode::OptionsLocked);

    store_.unlock();
    EXPECT_NO_THROW(store_.setOption("allowNotFound", true));
    EXPECT_EQ(store_.get()->defaultRoute, "home");
    EXPECT_EQ(store_.get()->defaultParams.at("page"), "1");
}

TEST_F(OptionsStoreTest, SetOption_RejectsUnknownAndMistyped) {
    EXPECT_EQ(codeOf([this]() { store_.setOption("trailingSlash", "strict"); }), ErrorCode::InvalidOption);
    EXPECT_EQ(codeOf([this]() { store_.setOption("allowNotFound", "yes"); }), ErrorCode::InvalidOption);
    EXPECT_EQ(codeOf([this]() { store_.setOption("limits", json{{"maxMiddleware", -1}}); }),
              ErrorCode::InvalidOption);
}

TEST_F(OptionsStoreTest, Providers_TakePrecedence) {
    store_.setOption("defaultRoute", "home");
    store_.setDefaultRouteProvider([]() { return std::string("dashboard"); });

    EXPECT_EQ(store_.get()->resolveDefaultRoute(), "dashboard");
}

TEST_F(OptionsStoreTest, FromJson_ParsesNestedLimits) {
    auto options = OptionsStore::fromJson(json::parse(R"({
        "defaultRoute": "home",
        "defaultParams": {"lang": "en"},
        "ignoreQueryParams": true,
        "limits": {"maxLifecycleHandlers": 20, "lifecycleWarnThreshold": 5}
    })"));

    EXPECT_EQ(options.defaultRoute, "home");
    EXPECT_EQ(options.defaultParams.at("lang"), "en");
    EXPECT_TRUE(options.ignoreQueryParams);
    EXPECT_EQ(options.limits.maxLifecycleHandlers, 20u);
    EXPECT_EQ(options.limits.lifecycleWarnThreshold, 5u);
    EXPECT_EQ(options.limits.maxMiddleware, 50u);
}

TEST_F(OptionsStoreTest, LoadFromFile_ReadsAndReportsErrors) {
    auto dir = std::filesystem::temp_directory_path();
    auto valid = dir / "rne_options_valid.json";
    auto broken = dir / "rne_options_broken.json";
    {
        std::ofstream(valid) << R"({"allowNotFound": true})";
        std::ofstream(broken) << R"({"allowNotFound": )";
    }

    EXPECT_TRUE(OptionsStore::loadFromFile(valid.string()).allowNotFound);
    EXPECT_EQ(codeOf([&broken]() { OptionsStore::loadFromFile(broken.string()); }), ErrorCode::InvalidOption);
    EXPECT_EQ(codeOf([&dir]() { OptionsStore::loadFromFile((dir / "rne_missing.json").string()); }),
              ErrorCode::InvalidOption);

    std::filesystem::remove(valid);
    std::filesystem::remove(broken);
}
