#include "cancel_token.hpp"
#include <algorithm>
#include <thread>

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken::CancelToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

CancelToken CancelToken::withDeadline(Clock::time_point deadline) {
    auto state = std::make_shared<State>();
    state->hasDeadline = true;
    state->deadline = deadline;
    return CancelToken(state);
}

CancelToken CancelToken::withTimeout(std::chrono::milliseconds timeout) {
    return withDeadline(Clock::now() + timeout);
}

CancelToken CancelToken::child() const {
    auto state = std::make_shared<State>();
    state->parent = state_;
    return CancelToken(state);
}

void CancelToken::cancel() const {
    state_->cancelled.store(true);
}

bool CancelToken::isCancelled() const {
    return reason() != ErrorCode::None;
}

ErrorCode CancelToken::reason() const {
    // walk towards the root; the nearest fired signal wins
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load()) return ErrorCode::Cancelled;
        if (s->hasDeadline && Clock::now() >= s->deadline) return ErrorCode::DeadlineExceeded;
    }
    return ErrorCode::None;
}

Result<void> CancelToken::status() const {
    ErrorCode code = reason();
    if (code == ErrorCode::None) return Result<void>::Ok();
    if (code == ErrorCode::DeadlineExceeded) {
        return Result<void>::Error("deadline exceeded", code);
    }
    return Result<void>::Error("operation cancelled", code);
}

bool CancelToken::sleepFor(std::chrono::milliseconds delay) const {
    const auto step = std::chrono::milliseconds(20);
    auto until = Clock::now() + delay;
    while (Clock::now() < until) {
        if (isCancelled()) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now());
        std::this_thread::sleep_for(std::min(step, left));
    }
    return !isCancelled();
}
