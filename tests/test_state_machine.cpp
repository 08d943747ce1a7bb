#include <chtest.hpp>

#include <tripwire/resilience/state_machine.h>

#include <thread>
#include <utility>
#include <vector>

using tripwire::resilience::CircuitState;
using tripwire::resilience::IsValidTransition;
using tripwire::resilience::StateMachine;

TEST_CASE("StateMachine starts closed") {
    StateMachine sm;
    REQUIRE(sm.Current() == CircuitState::closed);
    REQUIRE(sm.IsClosed());
    REQUIRE(!sm.IsOpen());
    REQUIRE(!sm.IsHalfOpen());
}

TEST_CASE("StateMachine invokes hook with previous and new state") {
    std::vector<std::pair<CircuitState, CircuitState>> seen;
    StateMachine sm([&](CircuitState from, CircuitState to) { seen.emplace_back(from, to); });

    REQUIRE(sm.TransitionTo(CircuitState::open));
    REQUIRE(sm.TransitionTo(CircuitState::half_open));
    REQUIRE(sm.TransitionTo(CircuitState::closed));

    REQUIRE(seen.size() == 3);
    REQUIRE(seen[0].first == CircuitState::closed);
    REQUIRE(seen[0].second == CircuitState::open);
    REQUIRE(seen[1].first == CircuitState::open);
    REQUIRE(seen[1].second == CircuitState::half_open);
    REQUIRE(seen[2].first == CircuitState::half_open);
    REQUIRE(seen[2].second == CircuitState::closed);
}

TEST_CASE("StateMachine same-state transition is a no-op") {
    int calls = 0;
    StateMachine sm([&](CircuitState, CircuitState) { ++calls; });

    auto before = sm.LastChange();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));

    REQUIRE(!sm.TransitionTo(CircuitState::closed));
    REQUIRE(calls == 0);
    REQUIRE(sm.LastChange() == before);

    REQUIRE(sm.TransitionTo(CircuitState::open));
    REQUIRE(!sm.TransitionTo(CircuitState::open));
    REQUIRE(calls == 1);
}

TEST_CASE("StateMachine stamps the change time") {
    StateMachine sm;
    auto before = sm.LastChange();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    REQUIRE(sm.TransitionTo(CircuitState::open));
    REQUIRE(sm.LastChange() > before);
    REQUIRE(sm.TimeInState() < std::chrono::milliseconds(5));

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(sm.TimeInState() >= std::chrono::milliseconds(20));
}

TEST_CASE("StateMachine TransitionFrom only applies from the expected state") {
    int calls = 0;
    StateMachine sm([&](CircuitState, CircuitState) { ++calls; });

    REQUIRE(!sm.TransitionFrom(CircuitState::half_open, CircuitState::closed));
    REQUIRE(sm.IsClosed());

    REQUIRE(sm.TransitionFrom(CircuitState::closed, CircuitState::open));
    REQUIRE(sm.IsOpen());
    REQUIRE(!sm.TransitionFrom(CircuitState::open, CircuitState::open));
    REQUIRE(calls == 1);
}

TEST_CASE("StateMachine TransitionFrom refuses illegal transitions") {
    int calls = 0;
    StateMachine sm([&](CircuitState, CircuitState) { ++calls; });

    REQUIRE(!sm.TransitionFrom(CircuitState::closed, CircuitState::half_open));
    REQUIRE(sm.IsClosed());

    REQUIRE(sm.TransitionFrom(CircuitState::closed, CircuitState::open));
    REQUIRE(!sm.TransitionFrom(CircuitState::open, CircuitState::closed));
    REQUIRE(sm.IsOpen());
    REQUIRE(calls == 1);

    // TransitionTo does not check legality.
    REQUIRE(sm.TransitionTo(CircuitState::closed));
    REQUIRE(sm.IsClosed());
    REQUIRE(calls == 2);
}

TEST_CASE("StateMachine state is readable from inside the hook") {
    CircuitState observed = CircuitState::closed;
    StateMachine* self = nullptr;
    StateMachine sm([&](CircuitState, CircuitState) { observed = self->Current(); });
    self = &sm;

    sm.TransitionTo(CircuitState::open);
    REQUIRE(observed == CircuitState::open);
}

TEST_CASE("Only the four breaker transitions are valid") {
    REQUIRE(IsValidTransition(CircuitState::closed, CircuitState::open));
    REQUIRE(IsValidTransition(CircuitState::open, CircuitState::half_open));
    REQUIRE(IsValidTransition(CircuitState::half_open, CircuitState::closed));
    REQUIRE(IsValidTransition(CircuitState::half_open, CircuitState::open));

    REQUIRE(!IsValidTransition(CircuitState::closed, CircuitState::half_open));
    REQUIRE(!IsValidTransition(CircuitState::open, CircuitState::closed));
    REQUIRE(!IsValidTransition(CircuitState::closed, CircuitState::closed));
    REQUIRE(!IsValidTransition(CircuitState::open, CircuitState::open));
}

TEST_CASE("CircuitState names") {
    REQUIRE(tripwire::resilience::ToString(CircuitState::closed) == "Closed");
    REQUIRE(tripwire::resilience::ToString(CircuitState::open) == "Open");
    REQUIRE(tripwire::resilience::ToString(CircuitState::half_open) == "HalfOpen");
    REQUIRE(tripwire::resilience::ToString(static_cast<CircuitState>(42)) == "Unknown State(42)");
}
