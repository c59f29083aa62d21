#pragma once
#include "result.hpp"
#include <atomic>
#include <chrono>
#include <memory>

// Cooperative cancellation shared between a caller, the worker pool and
// every task it runs. Copies share state. A child is cancelled whenever its
// parent is, and can also be cancelled on its own without touching the parent.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken();

    static CancelToken withDeadline(Clock::time_point deadline);
    static CancelToken withTimeout(std::chrono::milliseconds timeout);

    CancelToken child() const;

    void cancel() const;
    bool isCancelled() const;

    // Cancelled, DeadlineExceeded, or None while still live
    ErrorCode reason() const;

    // Ok while live, otherwise an error carrying reason()
    Result<void> status() const;

    // false when the token fired before the delay elapsed
    bool sleepFor(std::chrono::milliseconds delay) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        bool hasDeadline = false;
        Clock::time_point deadline;
        std::shared_ptr<State> parent;
    };

    explicit CancelToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};
