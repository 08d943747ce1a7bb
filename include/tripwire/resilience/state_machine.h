#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>

#include <tripwire/resilience/state.h>

namespace tripwire::resilience {

// Holds the breaker state and the time of the last change.
//
// Writers are serialized by an internal mutex that is also held while the
// transition hook runs, so transitions and their notifications never
// interleave. Readers never block: state and timestamps are atomics and may
// be read from inside the hook.
class StateMachine {
public:
    using TransitionHook = std::function<void(CircuitState from, CircuitState to)>;

    explicit StateMachine(TransitionHook hook = {});

    StateMachine(const StateMachine&) = delete;
    StateMachine& operator=(const StateMachine&) = delete;

    CircuitState Current() const { return state_.load(std::memory_order_acquire); }

    bool IsClosed() const { return Current() == CircuitState::closed; }
    bool IsOpen() const { return Current() == CircuitState::open; }
    bool IsHalfOpen() const { return Current() == CircuitState::half_open; }

    // Thread-safe. Applies the change iff target differs from the current
    // state; returns whether it did. Legality is the caller's business.
    bool TransitionTo(CircuitState target);

    // Thread-safe. Like TransitionTo(), but only when the current state is
    // still `expected` and the change is one of the four breaker transitions.
    bool TransitionFrom(CircuitState expected, CircuitState target);

    std::chrono::system_clock::time_point LastChange() const;
    std::chrono::steady_clock::duration TimeInState() const;

private:
    void ApplyLocked(CircuitState from, CircuitState to);

    std::mutex mu_;
    std::atomic<CircuitState> state_{CircuitState::closed};
    std::atomic<std::chrono::system_clock::rep> changed_wall_;
    std::atomic<std::chrono::steady_clock::rep> changed_mono_;
    TransitionHook hook_;
};

} // namespace tripwire::resilience
