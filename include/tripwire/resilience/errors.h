#pragma once

#include <string>
#include <utility>

#include <tripwire/core/status.h>

namespace tripwire::resilience {

// Returned, without running the operation, while the circuit is open.
tripwire::Status ErrCircuitOpen();

// A status raised by a named breaker.
class CircuitError {
public:
    CircuitError(std::string name, tripwire::Status cause)
        : name_(std::move(name)), cause_(std::move(cause)) {}

    const std::string& name() const { return name_; }
    const tripwire::Status& cause() const { return cause_; }

    // "circuit breaker '<name>': <cause message>", carrying the cause's code.
    std::string Message() const;
    tripwire::Status ToStatus() const;

private:
    std::string name_;
    tripwire::Status cause_;
};

// True for ErrCircuitOpen() and anything wrapping it.
bool IsCircuitOpen(const tripwire::Status& status);
bool IsCircuitOpen(const CircuitError& error);

} // namespace tripwire::resilience
