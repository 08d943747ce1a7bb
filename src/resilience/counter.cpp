#include <tripwire/resilience/counter.h>

#include <algorithm>

namespace tripwire::resilience {

void ConsecutiveCounter::RecordSuccess() {
    std::lock_guard<std::mutex> lk(mu_);
    ++consecutive_successes_;
    consecutive_failures_ = 0;
    ++total_successes_;
}

void ConsecutiveCounter::RecordFailure() {
    std::lock_guard<std::mutex> lk(mu_);
    ++consecutive_failures_;
    consecutive_successes_ = 0;
    ++total_failures_;
}

void ConsecutiveCounter::Reset() {
    std::lock_guard<std::mutex> lk(mu_);
    consecutive_successes_ = 0;
    consecutive_failures_ = 0;
    total_successes_ = 0;
    total_failures_ = 0;
}

std::uint64_t ConsecutiveCounter::ConsecutiveSuccesses() const {
    std::lock_guard<std::mutex> lk(mu_);
    return consecutive_successes_;
}

std::uint64_t ConsecutiveCounter::ConsecutiveFailures() const {
    std::lock_guard<std::mutex> lk(mu_);
    return consecutive_failures_;
}

std::pair<std::uint64_t, std::uint64_t> ConsecutiveCounter::Totals() const {
    std::lock_guard<std::mutex> lk(mu_);
    return {total_successes_, total_failures_};
}

RollingWindowCounter::RollingWindowCounter(std::chrono::milliseconds window, int buckets)
    : window_(window),
      buckets_(buckets <= 0 ? kDefaultBuckets : static_cast<std::size_t>(buckets)),
      head_started_(Clock::now()) {
    auto per_bucket = window_.count() / static_cast<std::chrono::milliseconds::rep>(buckets_.size());
    bucket_duration_ = std::max<std::chrono::milliseconds>(std::chrono::milliseconds(per_bucket), std::chrono::milliseconds(1));
}

void RollingWindowCounter::AdvanceLocked(Clock::time_point now) {
    auto elapsed = now - head_started_;
    if (elapsed < bucket_duration_) {
        return;
    }

    auto steps = static_cast<std::uint64_t>(elapsed / bucket_duration_);
    auto evict = std::min<std::uint64_t>(steps, buckets_.size());
    for (std::uint64_t i = 0; i < evict; ++i) {
        head_ = (head_ + 1) % buckets_.size();
        auto& b = buckets_[head_];
        totals_.requests -= b.requests;
        totals_.failures -= b.failures;
        b = WindowCounts{};
    }

    // Keep the partial bucket interval for the next advance.
    head_started_ += static_cast<Clock::rep>(steps) * std::chrono::duration_cast<Clock::duration>(bucket_duration_);
}

void RollingWindowCounter::RecordSuccess() {
    std::lock_guard<std::mutex> lk(mu_);
    AdvanceLocked(Clock::now());
    ++buckets_[head_].requests;
    ++totals_.requests;
}

void RollingWindowCounter::RecordFailure() {
    std::lock_guard<std::mutex> lk(mu_);
    AdvanceLocked(Clock::now());
    ++buckets_[head_].requests;
    ++buckets_[head_].failures;
    ++totals_.requests;
    ++totals_.failures;
}

WindowCounts RollingWindowCounter::Counts() {
    std::lock_guard<std::mutex> lk(mu_);
    AdvanceLocked(Clock::now());
    return totals_;
}

void RollingWindowCounter::Reset() {
    std::lock_guard<std::mutex> lk(mu_);
    std::fill(buckets_.begin(), buckets_.end(), WindowCounts{});
    totals_ = WindowCounts{};
    head_ = 0;
    head_started_ = Clock::now();
}

} // namespace tripwire::resilience
