#include <chtest.hpp>

#include <tripwire/runtime/timer_service.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using tripwire::DelayedTask;
using tripwire::TimerService;

TEST_CASE("TimerService rejects zero threads") {
    bool threw = false;
    try {
        TimerService ts(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    REQUIRE(threw);
}

TEST_CASE("TimerService start and stop are idempotent") {
    TimerService ts(2);
    REQUIRE(!ts.running());
    ts.Start();
    ts.Start();
    REQUIRE(ts.running());
    ts.Stop();
    ts.Stop();
    REQUIRE(!ts.running());
}

TEST_CASE("DelayedTask fires once after the delay") {
    TimerService ts(1);
    ts.Start();

    std::atomic<int> fired{0};
    auto task = DelayedTask::Create(ts.Next());
    task->Schedule(std::chrono::milliseconds(20), [&] { fired.fetch_add(1); });
    REQUIRE(task->pending());
    REQUIRE(fired.load() == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    REQUIRE(fired.load() == 1);
    REQUIRE(!task->pending());
}

TEST_CASE("DelayedTask reschedule replaces the pending run") {
    TimerService ts(1);
    ts.Start();

    std::atomic<int> first{0};
    std::atomic<int> second{0};
    auto task = DelayedTask::Create(ts.Next());
    task->Schedule(std::chrono::milliseconds(30), [&] { first.fetch_add(1); });
    task->Schedule(std::chrono::milliseconds(60), [&] { second.fetch_add(1); });

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    REQUIRE(first.load() == 0);
    REQUIRE(second.load() == 1);
}

TEST_CASE("DelayedTask cancel prevents the run") {
    TimerService ts(1);
    ts.Start();

    std::atomic<int> fired{0};
    auto task = DelayedTask::Create(ts.Next());
    task->Schedule(std::chrono::milliseconds(20), [&] { fired.fetch_add(1); });
    task->Cancel();
    REQUIRE(!task->pending());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(fired.load() == 0);
}
