#include "roster/SignalShutdownNotifier.hpp"

#include <catch2/catch.hpp>

#include <csignal>

using namespace roster;

TEST_CASE("Signal shutdown notifier", "[SignalShutdownNotifier]") {
    SignalShutdownNotifier notifier;
    int calls = 0;
    auto subscription = notifier.subscribe([&] { ++calls; });

    // The signals are blocked, so raising one leaves it pending for the signal fd to pick up.
    SECTION("should notify on SIGTERM") {
        REQUIRE(raise(SIGTERM) == 0);
        CHECK(notifier.wait() == SIGTERM);
        CHECK(calls == 1);
        CHECK(notifier.notified());
    }
    SECTION("should notify on SIGINT") {
        REQUIRE(raise(SIGINT) == 0);
        CHECK(notifier.wait() == SIGINT);
        CHECK(calls == 1);
    }
}
