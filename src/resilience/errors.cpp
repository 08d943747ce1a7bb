#include <tripwire/resilience/errors.h>

namespace tripwire::resilience {

tripwire::Status ErrCircuitOpen() {
    return tripwire::Status(tripwire::StatusCode::circuit_open, "circuit breaker is open");
}

std::string CircuitError::Message() const {
    return "circuit breaker '" + name_ + "': " + cause_.message();
}

tripwire::Status CircuitError::ToStatus() const {
    return tripwire::Status(cause_.code(), Message());
}

bool IsCircuitOpen(const tripwire::Status& status) {
    return status.code() == tripwire::StatusCode::circuit_open;
}

bool IsCircuitOpen(const CircuitError& error) {
    return IsCircuitOpen(error.cause());
}

} // namespace tripwire::resilience
