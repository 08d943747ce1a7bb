#include <tripwire/resilience/threshold.h>

namespace tripwire::resilience {

bool ConsecutiveFailuresThreshold::ShouldTrip(std::uint64_t failures, std::uint64_t, std::uint64_t,
                                              std::chrono::milliseconds) const {
    return failures >= threshold;
}

bool FailureRateThreshold::ShouldTrip(std::uint64_t failures, std::uint64_t, std::uint64_t total,
                                      std::chrono::milliseconds) const {
    if (total < min_samples || total == 0) {
        return false;
    }
    return static_cast<double>(failures) / static_cast<double>(total) >= rate;
}

ThresholdPolicy ThresholdPolicy::ConsecutiveFailures(std::uint64_t threshold) {
    return ThresholdPolicy(ConsecutiveFailuresThreshold{threshold});
}

ThresholdPolicy ThresholdPolicy::FailureRate(double rate, std::uint64_t min_samples) {
    return ThresholdPolicy(FailureRateThreshold{rate, min_samples});
}

ThresholdPolicy::Kind ThresholdPolicy::kind() const {
    return v_.index() == 0 ? Kind::consecutive_failures : Kind::failure_rate;
}

std::string_view ThresholdPolicy::Name() const {
    return rate_based() ? "FailureRate" : "ConsecutiveFailures";
}

bool ThresholdPolicy::ShouldTrip(std::uint64_t failures, std::uint64_t successes, std::uint64_t total,
                                 std::chrono::milliseconds window) const {
    return std::visit(
        [&](const auto& t) { return t.ShouldTrip(failures, successes, total, window); }, v_);
}

} // namespace tripwire::resilience
