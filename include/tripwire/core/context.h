#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include <tripwire/core/status.h>

namespace tripwire {

// Cancellation / deadline signal handed to wrapped operations.
// Copies share the same underlying state: cancelling one cancels all.
class Context {
public:
    using Clock = std::chrono::steady_clock;

    // Never cancelled, no deadline.
    Context() = default;

    static Context WithCancel();
    static Context WithDeadline(Clock::time_point deadline);
    static Context WithTimeout(Clock::duration timeout);

    // Thread-safe. No-op on a background context.
    void Cancel() const;

    // Thread-safe
    bool Done() const;

    // Ok while live; cancelled ("context canceled") after Cancel();
    // timeout ("context deadline exceeded") once the deadline has passed.
    Status Err() const;

    std::optional<Clock::time_point> Deadline() const;

    // Sleeps for up to `d`. Returns false early if the context ends first.
    bool WaitFor(Clock::duration d) const;

private:
    struct State {
        std::mutex mu;
        std::condition_variable cv;
        bool cancelled = false;
        std::optional<Clock::time_point> deadline;
    };

    explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

} // namespace tripwire
