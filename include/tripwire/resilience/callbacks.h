#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <tripwire/core/status.h>
#include <tripwire/resilience/state.h>

namespace tripwire::resilience {

using StateChangeCallback = std::function<void(const std::string& name, CircuitState from, CircuitState to)>;
// `err` is ok() when the trip was not caused by a specific failure.
using TripCallback = std::function<void(const std::string& name, const tripwire::Status& err)>;
using ResetCallback = std::function<void(const std::string& name)>;
using SuccessCallback = std::function<void(const std::string& name)>;
using FailureCallback = std::function<void(const std::string& name, const tripwire::Status& err)>;
using RejectionCallback = std::function<void(const std::string& name)>;

// Observer lists, one per event kind.
//
// Observers run synchronously on the notifying thread, in registration order.
// Registration is thread-safe and may happen while notifications are in
// flight: a notification walks the list as it was when it started.
class Callbacks {
public:
    void AddOnStateChange(StateChangeCallback cb) { Add(on_state_change_, std::move(cb)); }
    void AddOnTrip(TripCallback cb) { Add(on_trip_, std::move(cb)); }
    void AddOnReset(ResetCallback cb) { Add(on_reset_, std::move(cb)); }
    void AddOnSuccess(SuccessCallback cb) { Add(on_success_, std::move(cb)); }
    void AddOnFailure(FailureCallback cb) { Add(on_failure_, std::move(cb)); }
    void AddOnRejection(RejectionCallback cb) { Add(on_rejection_, std::move(cb)); }

    void NotifyStateChange(const std::string& name, CircuitState from, CircuitState to) const;
    void NotifyTrip(const std::string& name, const tripwire::Status& err) const;
    void NotifyReset(const std::string& name) const;
    void NotifySuccess(const std::string& name) const;
    void NotifyFailure(const std::string& name, const tripwire::Status& err) const;
    void NotifyRejection(const std::string& name) const;

private:
    template <class Fn>
    using List = std::shared_ptr<const std::vector<Fn>>;

    template <class Fn>
    void Add(List<Fn>& list, Fn cb) {
        if (!cb) {
            return;
        }
        std::lock_guard<std::mutex> lk(mu_);
        auto next = list ? std::make_shared<std::vector<Fn>>(*list) : std::make_shared<std::vector<Fn>>();
        next->push_back(std::move(cb));
        list = std::move(next);
    }

    template <class Fn>
    List<Fn> Snapshot(const List<Fn>& list) const {
        std::lock_guard<std::mutex> lk(mu_);
        return list;
    }

    mutable std::mutex mu_;
    List<StateChangeCallback> on_state_change_;
    List<TripCallback> on_trip_;
    List<ResetCallback> on_reset_;
    List<SuccessCallback> on_success_;
    List<FailureCallback> on_failure_;
    List<RejectionCallback> on_rejection_;
};

} // namespace tripwire::resilience
