#include <catch2/catch_test_macros.hpp>

#include "watchers/idle_transition.hpp"

using namespace std::chrono_literals;

namespace {

const Timestamp NOW = std::chrono::sys_days{std::chrono::year{2024} / 3 / 1} + 10h;

IdleSample sample(uint32_t seconds) { return {.seconds_since_input = seconds, .now = NOW}; }

} // namespace

TEST_CASE("Idle transition", "[idle]") {
    constexpr auto timeout = 300s;

    SECTION("LastInputIsNowMinusIdleSeconds") {
        REQUIRE(sample(0).last_input() == NOW);
        REQUIRE(sample(42).last_input() == NOW - 42s);
    }

    SECTION("ActiveBelowTimeout") {
        auto next = next_idle_state(false, sample(299), timeout);
        REQUIRE_FALSE(next.is_idle);
        REQUIRE(next.pings == std::vector<Ping>{{false, NOW - 299s, 0ms}});
    }

    SECTION("GoesIdleAtTimeout") {
        auto next = next_idle_state(false, sample(300), timeout);
        REQUIRE(next.is_idle);
        REQUIRE(next.pings == std::vector<Ping>{
                                  {false, NOW - 300s, 0ms},
                                  {false, NOW - 300s + 1ms, 300s},
                              });
    }

    SECTION("StaysIdleAndReportsDuration") {
        auto next = next_idle_state(true, sample(420), timeout);
        REQUIRE(next.is_idle);
        REQUIRE(next.pings == std::vector<Ping>{{true, NOW - 420s, 420s}});
    }

    SECTION("ReturnsFromIdle") {
        auto next = next_idle_state(true, sample(5), timeout);
        REQUIRE_FALSE(next.is_idle);
        REQUIRE(next.pings == std::vector<Ping>{
                                  {true, NOW - 5s, 0ms},
                                  {true, NOW - 5s + 1ms, 0ms},
                              });
    }

    SECTION("FullCycle") {
        bool is_idle = false;

        auto t1 = next_idle_state(is_idle, sample(299), timeout);
        REQUIRE(t1.pings.size() == 1);
        is_idle = t1.is_idle;
        REQUIRE_FALSE(is_idle);

        auto t2 = next_idle_state(is_idle, sample(300), timeout);
        REQUIRE(t2.pings.size() == 2);
        is_idle = t2.is_idle;
        REQUIRE(is_idle);

        auto t3 = next_idle_state(is_idle, sample(5), timeout);
        REQUIRE(t3.pings.size() == 2);
        REQUIRE(t3.pings[0].was_idle);
        REQUIRE(t3.pings[1].timestamp - t3.pings[0].timestamp == STATE_CHANGE_OFFSET);
        REQUIRE_FALSE(t3.is_idle);
    }

    SECTION("RepeatedTicksWithoutTransitionAreStable") {
        for (bool is_idle : {false, true}) {
            uint32_t seconds = is_idle ? 600 : 10;
            for (int i = 0; i < 5; i++) {
                auto next = next_idle_state(is_idle, sample(seconds), timeout);
                REQUIRE(next.is_idle == is_idle);
                REQUIRE(next.pings.size() == 1);
                REQUIRE(next.pings[0].was_idle == is_idle);
            }
        }
    }

    SECTION("SkippedPollsStillTransitionOnce") {
        // A late poll that sees a long idle period goes idle directly with
        // the whole idle span as duration.
        auto next = next_idle_state(false, sample(3600), timeout);
        REQUIRE(next.is_idle);
        REQUIRE(next.pings.size() == 2);
        REQUIRE(next.pings[1].duration == 3600s);
    }
}
