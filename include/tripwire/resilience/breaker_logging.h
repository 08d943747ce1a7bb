#pragma once

#include <tripwire/resilience/circuit_breaker.h>

namespace tripwire::resilience {

// Registers observers that write every breaker event to tripwire::log:
// state changes, trips and resets at info/warn, per-call outcomes at debug.
void AttachLogging(CircuitBreaker& breaker);

// Debug-level dump of a snapshot.
void LogMetrics(const Metrics& m);

} // namespace tripwire::resilience
