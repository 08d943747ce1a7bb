#include <tripwire/resilience/breaker_logging.h>

#include <tripwire/core/log.h>

namespace tripwire::resilience {

void AttachLogging(CircuitBreaker& breaker) {
    breaker.OnStateChange([](const std::string& name, CircuitState from, CircuitState to) {
        tripwire::log::info("circuit breaker state changed circuit={} from={} to={}", name, ToString(from), ToString(to));
    });

    breaker.OnTrip([](const std::string& name, const tripwire::Status& err) {
        if (err.ok()) {
            tripwire::log::warn("circuit breaker tripped circuit={}", name);
        } else {
            tripwire::log::warn("circuit breaker tripped circuit={} error=\"{}\"", name, err.ToString());
        }
    });

    breaker.OnReset([](const std::string& name) {
        tripwire::log::info("circuit breaker reset circuit={}", name);
    });

    breaker.OnSuccess([](const std::string& name) {
        tripwire::log::debug("circuit breaker request succeeded circuit={}", name);
    });

    breaker.OnFailure([](const std::string& name, const tripwire::Status& err) {
        tripwire::log::debug("circuit breaker request failed circuit={} error=\"{}\"", name, err.ToString());
    });

    breaker.OnRejection([](const std::string& name) {
        tripwire::log::debug("circuit breaker request rejected circuit={}", name);
    });
}

void LogMetrics(const Metrics& m) {
    auto in_state_ms = std::chrono::duration_cast<std::chrono::milliseconds>(m.time_in_state).count();
    tripwire::log::debug(
        "circuit breaker metrics circuit={} state={} total_requests={} total_failures={} "
        "consecutive_failures={} consecutive_successes={} time_in_state_ms={}",
        m.name, ToString(m.state), m.total_requests, m.total_failures,
        m.consecutive_failures, m.consecutive_successes, in_state_ms);
}

} // namespace tripwire::resilience
