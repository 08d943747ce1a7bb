#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace tripwire {

// Runs delayed work for breakers. One io_context per worker thread.
class TimerService {
public:
    explicit TimerService(std::size_t threads = 1);
    ~TimerService();

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    // Thread-safe
    boost::asio::io_context& Next();

    // Idempotent
    void Start();
    void Stop();

    bool running() const { return started_.load(std::memory_order_acquire); }

private:
    std::size_t threads_{0};
    // Workers share ownership so a context outlives a worker that got detached.
    std::vector<std::shared_ptr<boost::asio::io_context>> contexts_;
    std::vector<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guards_;
    std::vector<std::thread> workers_;
    std::atomic<std::size_t> rr_{0};
    std::atomic<bool> started_{false};
};

// A single re-armable, cancellable one-shot timer.
//
// Schedule() replaces whatever run is pending; Cancel() drops it. A completion
// that was already queued when it got replaced or cancelled is recognised by
// its generation and discarded, so `fn` runs at most once per Schedule().
// The callback runs on a TimerService thread with no DelayedTask lock held.
class DelayedTask : public std::enable_shared_from_this<DelayedTask> {
public:
    static std::shared_ptr<DelayedTask> Create(boost::asio::io_context& ioc);

    DelayedTask(const DelayedTask&) = delete;
    DelayedTask& operator=(const DelayedTask&) = delete;

    // Thread-safe
    void Schedule(std::chrono::milliseconds delay, std::function<void()> fn);

    // Thread-safe
    void Cancel();

    bool pending() const;

private:
    explicit DelayedTask(boost::asio::io_context& ioc) : timer_(ioc) {}

    void OnFire(const boost::system::error_code& ec, std::uint64_t generation);

    mutable std::mutex mu_;
    boost::asio::steady_timer timer_;
    std::function<void()> fn_;
    std::uint64_t generation_ = 0;
};

} // namespace tripwire
