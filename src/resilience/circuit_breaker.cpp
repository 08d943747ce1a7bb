#include <tripwire/resilience/circuit_breaker.h>

#include <algorithm>

namespace tripwire::resilience {

std::shared_ptr<CircuitBreaker> CircuitBreaker::Create(Settings settings, std::shared_ptr<TimerService> timers) {
    if (!timers) {
        timers = std::make_shared<TimerService>(1);
    }
    timers->Start();

    std::shared_ptr<CircuitBreaker> cb(new CircuitBreaker(std::move(settings), std::move(timers)));

    // Timer callbacks need weak_from_this(), which is only usable now.
    if (cb->settings_.reset_timeout.count() > 0) {
        cb->ArmResetTimer();
    }
    return cb;
}

CircuitBreaker::CircuitBreaker(Settings settings, std::shared_ptr<TimerService> timers)
    : settings_(Normalize(std::move(settings))),
      timers_(std::move(timers)),
      state_machine_([this](CircuitState from, CircuitState to) { OnTransition(from, to); }) {
    if (settings_.failure_threshold.rate_based()) {
        window_ = std::make_unique<RollingWindowCounter>(settings_.rolling_window, settings_.window_buckets);
    }
    open_timer_ = DelayedTask::Create(timers_->Next());
    reset_timer_ = DelayedTask::Create(timers_->Next());
}

CircuitBreaker::~CircuitBreaker() {
    Shutdown();
}

tripwire::Status CircuitBreaker::Admit(const Context& ctx, std::unique_lock<std::mutex>& probe) {
    if (auto err = ctx.Err(); !err.ok()) {
        return err;
    }

    switch (state_machine_.Current()) {
        case CircuitState::open:
            callbacks_.NotifyRejection(settings_.name);
            return ErrCircuitOpen();

        case CircuitState::half_open:
            // One probe at a time; the rest queue here.
            probe = std::unique_lock<std::mutex>(probe_mu_);
            return tripwire::Status::Ok();

        case CircuitState::closed:
            return tripwire::Status::Ok();
    }
    return tripwire::Status::Ok();
}

void CircuitBreaker::Record(const tripwire::Status& st) {
    if (st.ok()) {
        RecordSuccess();
        return;
    }
    if (IsFailure(st)) {
        RecordFailure(st);
    }
}

bool CircuitBreaker::IsFailure(const tripwire::Status& st) const {
    if (st.ok()) {
        return false;
    }
    if (settings_.is_failure) {
        return settings_.is_failure(st);
    }
    const auto& ignored = settings_.ignored_errors;
    return std::find(ignored.begin(), ignored.end(), st) == ignored.end();
}

void CircuitBreaker::RecordSuccess() {
    callbacks_.NotifySuccess(settings_.name);

    consecutive_.RecordSuccess();
    if (window_) {
        window_->RecordSuccess();
    }

    if (state_machine_.IsHalfOpen() && consecutive_.ConsecutiveSuccesses() >= settings_.success_threshold) {
        if (state_machine_.TransitionFrom(CircuitState::half_open, CircuitState::closed)) {
            ResetCounters();
        }
    }
}

void CircuitBreaker::RecordFailure(const tripwire::Status& err) {
    callbacks_.NotifyFailure(settings_.name, err);

    consecutive_.RecordFailure();
    if (window_) {
        window_->RecordFailure();
    }

    switch (state_machine_.Current()) {
        case CircuitState::half_open:
            // A single failed probe is enough.
            state_machine_.TransitionFrom(CircuitState::half_open, CircuitState::open);
            return;

        case CircuitState::closed:
            if (EvaluatePolicy() && state_machine_.TransitionFrom(CircuitState::closed, CircuitState::open)) {
                callbacks_.NotifyTrip(settings_.name, err);
            }
            return;

        case CircuitState::open:
            // A queued probe that ran after another one reopened the circuit.
            return;
    }
}

bool CircuitBreaker::EvaluatePolicy() {
    const auto& policy = settings_.failure_threshold;

    if (!policy.rate_based()) {
        auto [successes, failures] = consecutive_.Totals();
        return policy.ShouldTrip(consecutive_.ConsecutiveFailures(), consecutive_.ConsecutiveSuccesses(),
                                 successes + failures, settings_.rolling_window);
    }

    if (!window_) {
        return false;
    }
    auto counts = window_->Counts();
    if (counts.requests < settings_.minimum_request_volume) {
        return false;
    }
    return policy.ShouldTrip(counts.failures, counts.requests - counts.failures, counts.requests,
                             settings_.rolling_window);
}

void CircuitBreaker::ResetCounters() {
    consecutive_.Reset();
    if (window_) {
        window_->Reset();
    }
}

// Runs under the state machine's lock.
void CircuitBreaker::OnTransition(CircuitState from, CircuitState to) {
    callbacks_.NotifyStateChange(settings_.name, from, to);

    if (from == CircuitState::closed && to == CircuitState::open) {
        callbacks_.NotifyTrip(settings_.name, tripwire::Status::Ok());
    } else if ((from == CircuitState::open || from == CircuitState::half_open) && to == CircuitState::closed) {
        callbacks_.NotifyReset(settings_.name);
    }

    // The decay timer only means something while closed.
    if (from == CircuitState::closed) {
        reset_timer_->Cancel();
    }

    if (to == CircuitState::open) {
        ArmOpenTimer();
    } else if (to == CircuitState::closed && settings_.reset_timeout.count() > 0) {
        ArmResetTimer();
    }
}

void CircuitBreaker::ArmOpenTimer() {
    if (shut_down_.load(std::memory_order_acquire)) {
        return;
    }
    open_timer_->Schedule(settings_.timeout, [weak = weak_from_this()] {
        if (auto self = weak.lock()) {
            self->OnOpenTimeout();
        }
    });
}

void CircuitBreaker::ArmResetTimer() {
    if (shut_down_.load(std::memory_order_acquire)) {
        return;
    }
    reset_timer_->Schedule(settings_.reset_timeout, [weak = weak_from_this()] {
        if (auto self = weak.lock()) {
            self->OnResetTimeout();
        }
    });
}

void CircuitBreaker::OnOpenTimeout() {
    if (shut_down_.load(std::memory_order_acquire)) {
        return;
    }
    state_machine_.TransitionFrom(CircuitState::open, CircuitState::half_open);
}

void CircuitBreaker::OnResetTimeout() {
    if (shut_down_.load(std::memory_order_acquire)) {
        return;
    }

    if (!state_machine_.IsClosed()) {
        return;
    }

    // Same lock as a half-open call, so a probe's bookkeeping is never cut in
    // half. This runs on a shared timer thread and must not wait out a probe:
    // when one still holds the lock, try again one period later.
    std::unique_lock<std::mutex> lk(probe_mu_, std::try_to_lock);
    if (!lk.owns_lock()) {
        ArmResetTimer();
        return;
    }
    if (state_machine_.IsClosed()) {
        ResetCounters();
    }
}

Metrics CircuitBreaker::GetMetrics() const {
    Metrics m;
    m.name = settings_.name;
    m.state = state_machine_.Current();

    if (window_) {
        auto counts = window_->Counts();
        m.total_requests = counts.requests;
        m.total_failures = counts.failures;
    } else {
        auto [successes, failures] = consecutive_.Totals();
        m.total_requests = successes + failures;
        m.total_failures = failures;
    }

    m.consecutive_failures = consecutive_.ConsecutiveFailures();
    m.consecutive_successes = consecutive_.ConsecutiveSuccesses();
    m.last_state_change = state_machine_.LastChange();
    m.time_in_state = state_machine_.TimeInState();
    return m;
}

void CircuitBreaker::Shutdown() {
    if (shut_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    open_timer_->Cancel();
    reset_timer_->Cancel();
}

} // namespace tripwire::resilience
