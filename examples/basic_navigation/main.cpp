#include "Router.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <iostream>

int main() {
    using namespace RNE;

    Logger::initialize();
    Logger::setLevel(LogLevel::Info);

    std::cout << "=== Basic Navigation Example ===" << "\n\n";

    RouterOptions options;
    options.defaultRoute = "home";
    Router router(options);

    router.addRoute("home", "/");
    router.addRoute("users", "/users");
    router.addRoute("users.view", "/:id");
    router.addRoute("admin", "/admin");

    router.addEventListener(RouterEvent::TransitionSuccess, [](const RouterNotification &n) {
        std::cout << "  " << toString(n.event) << ": " << n.toState->path << "\n";
    });
    router.addEventListener(RouterEvent::TransitionBlocked, [](const RouterNotification &n) {
        std::cout << "  " << toString(n.event) << ": " << n.error->what() << "\n";
    });

    // Admin area stays closed
    router.registerGuard(GuardKind::Activate, "admin", false);

    router.start([](const NavigationResult &result) {
        std::cout << "  Started: " << (result.success ? result.state->name : result.error->what()) << "\n";
    });

    router.navigate("users.view", {{"id", "42"}, {"tab", "posts"}});
    router.navigate("admin");

    std::cout << "\nCurrent state:\n" << JsonUtils::toPrettyString(JsonUtils::toJson(*router.getState())) << "\n";

    router.stop();
    return 0;
}
