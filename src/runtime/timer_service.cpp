#include <tripwire/runtime/timer_service.h>

#include <tripwire/core/log.h>

#include <stdexcept>

namespace tripwire {

TimerService::TimerService(std::size_t threads) : threads_(threads) {
    if (threads_ == 0) {
        throw std::invalid_argument("TimerService threads must be > 0");
    }

    contexts_.reserve(threads_);
    guards_.reserve(threads_);

    for (std::size_t i = 0; i < threads_; ++i) {
        auto ctx = std::make_shared<boost::asio::io_context>(1);
        guards_.push_back(boost::asio::make_work_guard(*ctx));
        contexts_.push_back(std::move(ctx));
    }
}

TimerService::~TimerService() {
    Stop();
}

boost::asio::io_context& TimerService::Next() {
    auto idx = rr_.fetch_add(1, std::memory_order_relaxed) % contexts_.size();
    return *contexts_[idx];
}

void TimerService::Start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }

    for (auto& ctx : contexts_) {
        if (ctx->stopped()) {
            ctx->restart();
        }
    }

    workers_.reserve(contexts_.size());
    for (auto& ctx : contexts_) {
        workers_.emplace_back([c = ctx] { c->run(); });
    }
}

void TimerService::Stop() {
    bool expected = true;
    if (!started_.compare_exchange_strong(expected, false)) {
        return;
    }

    for (auto& ctx : contexts_) {
        ctx->stop();
    }
    for (auto& t : workers_) {
        if (!t.joinable()) {
            continue;
        }
        // The last owner can be released from inside a timer callback.
        if (t.get_id() == std::this_thread::get_id()) {
            tripwire::log::warn("TimerService stopped from its own worker thread; detaching it");
            t.detach();
            continue;
        }
        t.join();
    }
    workers_.clear();
}

std::shared_ptr<DelayedTask> DelayedTask::Create(boost::asio::io_context& ioc) {
    return std::shared_ptr<DelayedTask>(new DelayedTask(ioc));
}

void DelayedTask::Schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mu_);
    auto gen = ++generation_;
    fn_ = std::move(fn);

    // expires_after() aborts the previous wait, if any.
    timer_.expires_after(delay);
    timer_.async_wait([self = shared_from_this(), gen](const boost::system::error_code& ec) {
        self->OnFire(ec, gen);
    });
}

void DelayedTask::Cancel() {
    std::lock_guard<std::mutex> lk(mu_);
    ++generation_;
    fn_ = nullptr;
    timer_.cancel();
}

bool DelayedTask::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<bool>(fn_);
}

void DelayedTask::OnFire(const boost::system::error_code& ec, std::uint64_t generation) {
    if (ec) {
        return;
    }

    std::function<void()> fn;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (generation != generation_ || !fn_) {
            return;
        }
        fn = std::move(fn_);
        fn_ = nullptr;
    }
    fn();
}

} // namespace tripwire
