#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <tripwire/core/status.h>
#include <tripwire/resilience/threshold.h>

namespace tripwire::config {
class Config;
} // namespace tripwire::config

namespace tripwire::resilience {

struct Settings {
    // Identifies the breaker in notifications. Blank becomes "default".
    std::string name = "default";

    ThresholdPolicy failure_threshold = ThresholdPolicy::ConsecutiveFailures(5);

    // Consecutive successes needed to close from half-open.
    std::uint64_t success_threshold = 1;

    // How long the circuit stays open before probing.
    std::chrono::milliseconds timeout{60000};

    // Window for the failure-rate policy, split into window_buckets buckets.
    std::chrono::milliseconds rolling_window{10000};
    int window_buckets = 10;

    // Requests needed in the window before the failure rate is evaluated.
    std::uint64_t minimum_request_volume = 3;

    // Quiet time in closed state after which counters are cleared. 0 disables.
    std::chrono::milliseconds reset_timeout{0};

    // Overrides the default classification (any non-ok status is a failure).
    std::function<bool(const tripwire::Status&)> is_failure;

    // Statuses that never count as failures. Matched on code and message.
    std::vector<tripwire::Status> ignored_errors;
};

Settings DefaultSettings();

// Blank name -> "default", success_threshold 0 -> 1, window_buckets <= 0 -> 10.
Settings Normalize(Settings settings);

// Reads a flat object:
//   name, threshold ("consecutive_failures" | "failure_rate"),
//   consecutive_failures, failure_rate, min_samples, success_threshold,
//   timeout_ms, rolling_window_ms, window_buckets, minimum_request_volume,
//   reset_timeout_ms
// Absent keys keep their defaults.
tripwire::Result<Settings> SettingsFromConfig(const tripwire::config::Config& cfg);

} // namespace tripwire::resilience
