#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

#include <tripwire/core/context.h>
#include <tripwire/core/status.h>
#include <tripwire/resilience/callbacks.h>
#include <tripwire/resilience/counter.h>
#include <tripwire/resilience/errors.h>
#include <tripwire/resilience/settings.h>
#include <tripwire/resilience/state_machine.h>
#include <tripwire/runtime/timer_service.h>

namespace tripwire::resilience {

struct Metrics {
    std::string name;
    CircuitState state = CircuitState::closed;
    std::uint64_t total_requests = 0;
    std::uint64_t total_failures = 0;
    std::uint64_t consecutive_failures = 0;
    std::uint64_t consecutive_successes = 0;
    std::chrono::system_clock::time_point last_state_change;
    std::chrono::steady_clock::duration time_in_state{};
};

namespace detail {

inline const tripwire::Status& StatusOf(const tripwire::Status& s) { return s; }

template <class T>
const tripwire::Status& StatusOf(const tripwire::Result<T>& r) { return r.status(); }

} // namespace detail

// Circuit breaker guarding calls to one dependency.
//
// Closed: calls run, failures are counted against the threshold policy.
// Open: calls are rejected with ErrCircuitOpen() until `timeout` elapses and
//       a timer moves the breaker to half-open.
// HalfOpen: calls run one at a time (later callers wait, they are not
//       rejected); a failure reopens, `success_threshold` consecutive
//       successes close and clear the counters.
//
// Operations return tripwire::Status or tripwire::Result<T>; the breaker
// hands back exactly what the operation returned. Always create through
// Create(): timer callbacks only hold a weak reference to the breaker.
class CircuitBreaker : public std::enable_shared_from_this<CircuitBreaker> {
public:
    // A null `timers` gives the breaker a private single-threaded TimerService.
    static std::shared_ptr<CircuitBreaker> Create(Settings settings, std::shared_ptr<TimerService> timers = nullptr);

    ~CircuitBreaker();

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    template <class Fn>
    auto Execute(Fn&& op) -> std::invoke_result_t<Fn&> {
        return ExecuteContext(Context(), [&op](const Context&) { return op(); });
    }

    // Thread-safe. `op` is called as op(ctx) and must honour ctx itself; the
    // breaker only checks it once, before admission.
    template <class Fn>
    auto ExecuteContext(const Context& ctx, Fn&& op) -> std::invoke_result_t<Fn&, const Context&> {
        using R = std::invoke_result_t<Fn&, const Context&>;

        std::unique_lock<std::mutex> probe;
        if (auto st = Admit(ctx, probe); !st.ok()) {
            return R(std::move(st));
        }

        R result = op(ctx);
        Record(detail::StatusOf(result));
        return result;
    }

    // On any error, rejection included, returns fallback(status) instead.
    template <class Fn, class Fallback>
    auto ExecuteWithFallback(Fn&& op, Fallback&& fallback) -> std::invoke_result_t<Fn&> {
        auto result = Execute(std::forward<Fn>(op));
        if (detail::StatusOf(result).ok()) {
            return result;
        }
        return fallback(detail::StatusOf(result));
    }

    template <class Fn, class Fallback>
    auto ExecuteWithFallbackContext(const Context& ctx, Fn&& op, Fallback&& fallback)
        -> std::invoke_result_t<Fn&, const Context&> {
        auto result = ExecuteContext(ctx, std::forward<Fn>(op));
        if (detail::StatusOf(result).ok()) {
            return result;
        }
        return fallback(ctx, detail::StatusOf(result));
    }

    // Registration is thread-safe; see Callbacks for delivery rules.
    void OnStateChange(StateChangeCallback cb) { callbacks_.AddOnStateChange(std::move(cb)); }
    void OnTrip(TripCallback cb) { callbacks_.AddOnTrip(std::move(cb)); }
    void OnReset(ResetCallback cb) { callbacks_.AddOnReset(std::move(cb)); }
    void OnSuccess(SuccessCallback cb) { callbacks_.AddOnSuccess(std::move(cb)); }
    void OnFailure(FailureCallback cb) { callbacks_.AddOnFailure(std::move(cb)); }
    void OnRejection(RejectionCallback cb) { callbacks_.AddOnRejection(std::move(cb)); }

    const std::string& name() const { return settings_.name; }
    const Settings& settings() const { return settings_; }
    CircuitState state() const { return state_machine_.Current(); }

    // Thread-safe; may be called from inside an observer.
    Metrics GetMetrics() const;

    // Stops both timers for good. Idempotent. Execute() keeps working on the
    // current state afterwards, but nothing changes state on its own.
    void Shutdown();

private:
    CircuitBreaker(Settings settings, std::shared_ptr<TimerService> timers);

    // Ok when the call may proceed; `probe` is locked for half-open calls.
    tripwire::Status Admit(const Context& ctx, std::unique_lock<std::mutex>& probe);
    void Record(const tripwire::Status& st);

    bool IsFailure(const tripwire::Status& st) const;
    void RecordSuccess();
    void RecordFailure(const tripwire::Status& err);
    bool EvaluatePolicy();
    void ResetCounters();

    void OnTransition(CircuitState from, CircuitState to);
    void ArmOpenTimer();
    void ArmResetTimer();
    void OnOpenTimeout();
    void OnResetTimeout();

    const Settings settings_;
    std::shared_ptr<TimerService> timers_;

    Callbacks callbacks_;
    ConsecutiveCounter consecutive_;
    std::unique_ptr<RollingWindowCounter> window_; // rate policy only
    StateMachine state_machine_;

    // Held across a whole half-open call.
    std::mutex probe_mu_;

    std::shared_ptr<DelayedTask> open_timer_;
    std::shared_ptr<DelayedTask> reset_timer_;
    std::atomic<bool> shut_down_{false};
};

} // namespace tripwire::resilience
