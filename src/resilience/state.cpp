#include <tripwire/resilience/state.h>

namespace tripwire::resilience {

std::string ToString(CircuitState state) {
    switch (state) {
        case CircuitState::closed: return "Closed";
        case CircuitState::open: return "Open";
        case CircuitState::half_open: return "HalfOpen";
    }
    return "Unknown State(" + std::to_string(static_cast<int>(state)) + ")";
}

bool IsValidTransition(CircuitState from, CircuitState to) {
    switch (from) {
        case CircuitState::closed: return to == CircuitState::open;
        case CircuitState::open: return to == CircuitState::half_open;
        case CircuitState::half_open: return to == CircuitState::closed || to == CircuitState::open;
    }
    return false;
}

} // namespace tripwire::resilience
