#pragma once

#include <string>

namespace tripwire::resilience {

enum class CircuitState {
    closed = 0,
    open,
    half_open,
};

// "Closed", "Open", "HalfOpen"
std::string ToString(CircuitState state);

// Closed->Open, Open->HalfOpen, HalfOpen->Closed and HalfOpen->Open only.
bool IsValidTransition(CircuitState from, CircuitState to);

} // namespace tripwire::resilience
