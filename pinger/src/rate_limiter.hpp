
#pragma once
#include "cancel_token.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

// Leaky bucket fed by a ticker thread: one token every 1/rate seconds into a
// buffer of 2*rate slots. Ticks that find the buffer full are dropped.
// A rate of 0 disables limiting entirely.
class RateLimiter {
public:
    explicit RateLimiter(int requests_per_second);
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Blocks until a token is drawn. Returns false if cancelled first.
    bool acquire(const CancelToken& cancel);

    // Draws a token if one is buffered right now
    bool try_acquire();

    // Stop the ticker; buffered tokens remain drawable
    void stop();

    bool enabled() const { return rate_ > 0; }
    size_t capacity() const { return capacity_; }
    size_t available() const;
    std::chrono::nanoseconds tick_interval() const { return tick_interval_; }

private:
    void tick_loop();

    const int rate_;
    const size_t capacity_;
    const std::chrono::nanoseconds tick_interval_;

    mutable std::mutex mutex_;
    std::condition_variable tokens_cv_;
    std::condition_variable ticker_cv_;
    size_t tokens_ = 0;
    bool stopping_ = false;
    std::thread ticker_;
};
