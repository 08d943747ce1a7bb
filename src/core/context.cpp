#include <tripwire/core/context.h>

#include <thread>

namespace tripwire {

Context Context::WithCancel() {
    return Context(std::make_shared<State>());
}

Context Context::WithDeadline(Clock::time_point deadline) {
    auto st = std::make_shared<State>();
    st->deadline = deadline;
    return Context(std::move(st));
}

Context Context::WithTimeout(Clock::duration timeout) {
    return WithDeadline(Clock::now() + timeout);
}

void Context::Cancel() const {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(state_->mu);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool Context::Done() const {
    return !Err().ok();
}

Status Context::Err() const {
    if (!state_) {
        return Status::Ok();
    }
    std::lock_guard<std::mutex> lk(state_->mu);
    if (state_->cancelled) {
        return Status(StatusCode::cancelled, "context canceled");
    }
    if (state_->deadline && Clock::now() >= *state_->deadline) {
        return Status(StatusCode::timeout, "context deadline exceeded");
    }
    return Status::Ok();
}

std::optional<Context::Clock::time_point> Context::Deadline() const {
    if (!state_) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->deadline;
}

bool Context::WaitFor(Clock::duration d) const {
    if (!state_) {
        std::this_thread::sleep_for(d);
        return true;
    }

    auto until = Clock::now() + d;
    std::unique_lock<std::mutex> lk(state_->mu);
    bool hit_deadline = false;
    if (state_->deadline && *state_->deadline < until) {
        until = *state_->deadline;
        hit_deadline = true;
    }
    bool cancelled = state_->cv.wait_until(lk, until, [&] { return state_->cancelled; });
    if (cancelled) {
        return false;
    }
    return !hit_deadline;
}

} // namespace tripwire
