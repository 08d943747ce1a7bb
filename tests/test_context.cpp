#include <chtest.hpp>

#include <tripwire/core/context.h>

#include <chrono>
#include <thread>

using tripwire::Context;
using tripwire::StatusCode;

TEST_CASE("Background context never ends") {
    Context ctx;
    REQUIRE(!ctx.Done());
    REQUIRE(ctx.Err().ok());
    REQUIRE(!ctx.Deadline().has_value());

    ctx.Cancel();
    REQUIRE(!ctx.Done());
    REQUIRE(ctx.WaitFor(std::chrono::milliseconds(1)));
}

TEST_CASE("Cancel is shared between copies") {
    auto ctx = Context::WithCancel();
    auto copy = ctx;
    REQUIRE(!copy.Done());

    ctx.Cancel();
    REQUIRE(copy.Done());
    REQUIRE(copy.Err().code() == StatusCode::cancelled);
    REQUIRE(copy.Err().message() == "context canceled");
}

TEST_CASE("Deadline expiry reports timeout") {
    auto ctx = Context::WithTimeout(std::chrono::milliseconds(20));
    REQUIRE(ctx.Deadline().has_value());
    REQUIRE(!ctx.Done());

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    REQUIRE(ctx.Done());
    REQUIRE(ctx.Err().code() == StatusCode::timeout);
    REQUIRE(ctx.Err().message() == "context deadline exceeded");
}

TEST_CASE("WaitFor returns early on cancel") {
    auto ctx = Context::WithCancel();
    std::thread canceller([ctx] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ctx.Cancel();
    });

    auto start = std::chrono::steady_clock::now();
    bool completed = ctx.WaitFor(std::chrono::seconds(5));
    auto waited = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(!completed);
    REQUIRE(waited < std::chrono::seconds(2));
}

TEST_CASE("WaitFor stops at the deadline") {
    auto ctx = Context::WithTimeout(std::chrono::milliseconds(20));
    REQUIRE(!ctx.WaitFor(std::chrono::seconds(5)));

    auto roomy = Context::WithTimeout(std::chrono::seconds(5));
    REQUIRE(roomy.WaitFor(std::chrono::milliseconds(5)));
}
