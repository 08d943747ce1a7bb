#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

namespace tripwire::resilience {

// Run-length counter: a success ends a run of failures and vice versa.
// Lifetime totals only go back to zero on Reset().
class ConsecutiveCounter {
public:
    // Thread-safe
    void RecordSuccess();
    void RecordFailure();
    void Reset();

    std::uint64_t ConsecutiveSuccesses() const;
    std::uint64_t ConsecutiveFailures() const;

    // (successes, failures)
    std::pair<std::uint64_t, std::uint64_t> Totals() const;

private:
    mutable std::mutex mu_;
    std::uint64_t consecutive_successes_ = 0;
    std::uint64_t consecutive_failures_ = 0;
    std::uint64_t total_successes_ = 0;
    std::uint64_t total_failures_ = 0;
};

struct WindowCounts {
    std::uint64_t requests = 0;
    std::uint64_t failures = 0;
};

// Request/failure totals over a trailing window, kept in a ring of buckets.
//
// The head bucket receives new events. Every time a whole bucket duration
// has elapsed the head moves forward by one and the bucket it lands on is
// evicted from the running totals, so the totals cover the last `window`
// (to bucket granularity) and reach zero after a full idle window.
class RollingWindowCounter {
public:
    static constexpr std::size_t kDefaultBuckets = 10;

    // buckets <= 0 falls back to kDefaultBuckets; bucket duration is at least 1ms.
    RollingWindowCounter(std::chrono::milliseconds window, int buckets);

    // Thread-safe
    void RecordSuccess();
    void RecordFailure();
    WindowCounts Counts();
    void Reset();

    std::chrono::milliseconds window() const { return window_; }
    std::chrono::milliseconds bucket_duration() const { return bucket_duration_; }
    std::size_t bucket_count() const { return buckets_.size(); }

private:
    using Clock = std::chrono::steady_clock;

    void AdvanceLocked(Clock::time_point now);

    const std::chrono::milliseconds window_;
    std::chrono::milliseconds bucket_duration_;

    std::mutex mu_;
    std::vector<WindowCounts> buckets_;
    std::size_t head_ = 0;
    Clock::time_point head_started_;
    WindowCounts totals_;
};

} // namespace tripwire::resilience
