#include <tripwire/resilience/state_machine.h>

namespace tripwire::resilience {

StateMachine::StateMachine(TransitionHook hook)
    : changed_wall_(std::chrono::system_clock::now().time_since_epoch().count()),
      changed_mono_(std::chrono::steady_clock::now().time_since_epoch().count()),
      hook_(std::move(hook)) {}

bool StateMachine::TransitionTo(CircuitState target) {
    std::lock_guard<std::mutex> lk(mu_);
    auto from = state_.load(std::memory_order_relaxed);
    if (from == target) {
        return false;
    }
    ApplyLocked(from, target);
    return true;
}

bool StateMachine::TransitionFrom(CircuitState expected, CircuitState target) {
    std::lock_guard<std::mutex> lk(mu_);
    auto from = state_.load(std::memory_order_relaxed);
    if (from != expected || !IsValidTransition(from, target)) {
        return false;
    }
    ApplyLocked(from, target);
    return true;
}

void StateMachine::ApplyLocked(CircuitState from, CircuitState to) {
    changed_wall_.store(std::chrono::system_clock::now().time_since_epoch().count(), std::memory_order_release);
    changed_mono_.store(std::chrono::steady_clock::now().time_since_epoch().count(), std::memory_order_release);
    state_.store(to, std::memory_order_release);

    if (hook_) {
        hook_(from, to);
    }
}

std::chrono::system_clock::time_point StateMachine::LastChange() const {
    return std::chrono::system_clock::time_point(
        std::chrono::system_clock::duration(changed_wall_.load(std::memory_order_acquire)));
}

std::chrono::steady_clock::duration StateMachine::TimeInState() const {
    auto changed = std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(changed_mono_.load(std::memory_order_acquire)));
    return std::chrono::steady_clock::now() - changed;
}

} // namespace tripwire::resilience
