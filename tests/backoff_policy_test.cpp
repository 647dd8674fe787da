#include <catch2/catch_test_macros.hpp>

#include "relaypp/transport/backoff_policy.hpp"

using namespace relaypp;
using namespace std::chrono_literals;

// ─────────────────────────────────────────────────────────────────────────────
// SteppedBackoff
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("SteppedBackoff walks the default table", "[backoff]") {
    SteppedBackoff backoff;

    const std::vector<std::chrono::milliseconds> expected{
        10ms, 50ms, 100ms, 150ms, 200ms, 250ms, 500ms, 1000ms, 2000ms, 5000ms
    };
    for (std::size_t attempt = 0; attempt < expected.size(); ++attempt) {
        REQUIRE(backoff.next_delay(attempt) == expected[attempt]);
    }
}

TEST_CASE("SteppedBackoff repeats the last entry", "[backoff]") {
    SteppedBackoff backoff;

    REQUIRE(backoff.next_delay(10) == 5000ms);
    REQUIRE(backoff.next_delay(1000) == 5000ms);
}

TEST_CASE("SteppedBackoff accepts a custom table", "[backoff]") {
    SteppedBackoff backoff({1ms, 2ms});

    REQUIRE(backoff.steps().size() == 2);
    REQUIRE(backoff.next_delay(0) == 1ms);
    REQUIRE(backoff.next_delay(7) == 2ms);
}

TEST_CASE("SteppedBackoff rejects an empty table", "[backoff]") {
    REQUIRE_THROWS_AS(SteppedBackoff(std::vector<std::chrono::milliseconds>{}), std::invalid_argument);
}

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ExponentialBackoff without jitter doubles up to the cap", "[backoff]") {
    ExponentialBackoff backoff(100ms, 2.0, 1000ms, 0.0);

    REQUIRE(backoff.next_delay(0) == 100ms);
    REQUIRE(backoff.next_delay(1) == 200ms);
    REQUIRE(backoff.next_delay(2) == 400ms);
    REQUIRE(backoff.next_delay(3) == 800ms);
    REQUIRE(backoff.next_delay(4) == 1000ms);
    REQUIRE(backoff.next_delay(20) == 1000ms);
}

TEST_CASE("ExponentialBackoff jitter stays within bounds", "[backoff]") {
    ExponentialBackoff backoff(1000ms, 1.0, 10'000ms, 0.25);

    for (int i = 0; i < 100; ++i) {
        const auto delay = backoff.next_delay(0);
        REQUIRE(delay >= 750ms);
        REQUIRE(delay <= 1250ms);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Constant / None
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ConstantBackoff and NoBackoff ignore the attempt", "[backoff]") {
    ConstantBackoff constant(250ms);
    NoBackoff none;

    REQUIRE(constant.next_delay(0) == 250ms);
    REQUIRE(constant.next_delay(9) == 250ms);
    REQUIRE(none.next_delay(3) == 0ms);
}
