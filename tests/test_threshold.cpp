#include <chtest.hpp>

#include <tripwire/resilience/threshold.h>

using tripwire::resilience::ThresholdPolicy;

TEST_CASE("ConsecutiveFailures trips at the threshold") {
    auto p = ThresholdPolicy::ConsecutiveFailures(3);
    auto window = std::chrono::milliseconds(0);

    REQUIRE(!p.ShouldTrip(0, 0, 0, window));
    REQUIRE(!p.ShouldTrip(1, 0, 0, window));
    REQUIRE(!p.ShouldTrip(2, 0, 0, window));
    REQUIRE(p.ShouldTrip(3, 0, 0, window));
    REQUIRE(p.ShouldTrip(4, 0, 0, window));

    // Only the failure count matters.
    REQUIRE(!p.ShouldTrip(2, 100, 102, std::chrono::seconds(10)));
}

TEST_CASE("FailureRate needs the minimum sample count") {
    auto p = ThresholdPolicy::FailureRate(0.5, 10);
    auto window = std::chrono::seconds(10);

    REQUIRE(!p.ShouldTrip(9, 0, 9, window));
    REQUIRE(!p.ShouldTrip(5, 4, 9, window));

    REQUIRE(!p.ShouldTrip(4, 6, 10, window));
    REQUIRE(p.ShouldTrip(5, 5, 10, window));
    REQUIRE(p.ShouldTrip(10, 0, 10, window));
}

TEST_CASE("FailureRate with zero samples never divides by zero") {
    auto p = ThresholdPolicy::FailureRate(0.0, 0);
    REQUIRE(!p.ShouldTrip(0, 0, 0, std::chrono::seconds(1)));
    REQUIRE(p.ShouldTrip(0, 1, 1, std::chrono::seconds(1)));
}

TEST_CASE("ThresholdPolicy exposes its variant") {
    auto c = ThresholdPolicy::ConsecutiveFailures(7);
    REQUIRE(c.kind() == ThresholdPolicy::Kind::consecutive_failures);
    REQUIRE(!c.rate_based());
    REQUIRE(c.Name() == "ConsecutiveFailures");
    REQUIRE(c.consecutive() != nullptr);
    REQUIRE(c.consecutive()->threshold == 7);
    REQUIRE(c.failure_rate() == nullptr);

    auto r = ThresholdPolicy::FailureRate(0.25, 4);
    REQUIRE(r.kind() == ThresholdPolicy::Kind::failure_rate);
    REQUIRE(r.rate_based());
    REQUIRE(r.Name() == "FailureRate");
    REQUIRE(r.failure_rate() != nullptr);
    REQUIRE(r.failure_rate()->rate == 0.25);
    REQUIRE(r.failure_rate()->min_samples == 4);
    REQUIRE(r.consecutive() == nullptr);
}
