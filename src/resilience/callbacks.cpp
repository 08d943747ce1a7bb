#include <tripwire/resilience/callbacks.h>

namespace tripwire::resilience {

void Callbacks::NotifyStateChange(const std::string& name, CircuitState from, CircuitState to) const {
    if (auto list = Snapshot(on_state_change_)) {
        for (const auto& cb : *list) {
            cb(name, from, to);
        }
    }
}

void Callbacks::NotifyTrip(const std::string& name, const tripwire::Status& err) const {
    if (auto list = Snapshot(on_trip_)) {
        for (const auto& cb : *list) {
            cb(name, err);
        }
    }
}

void Callbacks::NotifyReset(const std::string& name) const {
    if (auto list = Snapshot(on_reset_)) {
        for (const auto& cb : *list) {
            cb(name);
        }
    }
}

void Callbacks::NotifySuccess(const std::string& name) const {
    if (auto list = Snapshot(on_success_)) {
        for (const auto& cb : *list) {
            cb(name);
        }
    }
}

void Callbacks::NotifyFailure(const std::string& name, const tripwire::Status& err) const {
    if (auto list = Snapshot(on_failure_)) {
        for (const auto& cb : *list) {
            cb(name, err);
        }
    }
}

void Callbacks::NotifyRejection(const std::string& name) const {
    if (auto list = Snapshot(on_rejection_)) {
        for (const auto& cb : *list) {
            cb(name);
        }
    }
}

} // namespace tripwire::resilience
