#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <variant>

namespace tripwire::resilience {

// Trips once `threshold` failures happened in a row.
struct ConsecutiveFailuresThreshold {
    std::uint64_t threshold = 5;

    bool ShouldTrip(std::uint64_t failures, std::uint64_t successes, std::uint64_t total,
                    std::chrono::milliseconds window) const;
};

// Trips once at least `min_samples` requests were seen in the window and the
// failure ratio reached `rate`.
struct FailureRateThreshold {
    double rate = 0.5;
    std::uint64_t min_samples = 10;

    bool ShouldTrip(std::uint64_t failures, std::uint64_t successes, std::uint64_t total,
                    std::chrono::milliseconds window) const;
};

// Immutable value; cheap to copy.
class ThresholdPolicy {
public:
    enum class Kind {
        consecutive_failures = 0,
        failure_rate,
    };

    static ThresholdPolicy ConsecutiveFailures(std::uint64_t threshold);
    static ThresholdPolicy FailureRate(double rate, std::uint64_t min_samples);

    Kind kind() const;
    bool rate_based() const { return kind() == Kind::failure_rate; }

    // "ConsecutiveFailures" / "FailureRate"
    std::string_view Name() const;

    bool ShouldTrip(std::uint64_t failures, std::uint64_t successes, std::uint64_t total,
                    std::chrono::milliseconds window) const;

    // Null when the policy is of the other kind.
    const ConsecutiveFailuresThreshold* consecutive() const { return std::get_if<ConsecutiveFailuresThreshold>(&v_); }
    const FailureRateThreshold* failure_rate() const { return std::get_if<FailureRateThreshold>(&v_); }

private:
    using Variant = std::variant<ConsecutiveFailuresThreshold, FailureRateThreshold>;

    explicit ThresholdPolicy(Variant v) : v_(v) {}

    Variant v_;
};

} // namespace tripwire::resilience
