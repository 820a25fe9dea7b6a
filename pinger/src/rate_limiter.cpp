#include "rate_limiter.hpp"
#include <spdlog/spdlog.h>

namespace {

std::chrono::nanoseconds interval_for_rate(int requests_per_second) {
    if (requests_per_second <= 0) {
        return std::chrono::nanoseconds(0);
    }
    return std::chrono::nanoseconds(std::chrono::seconds(1)) / requests_per_second;
}

} // namespace

RateLimiter::RateLimiter(int requests_per_second)
    : rate_(requests_per_second),
      capacity_(requests_per_second > 0 ? static_cast<size_t>(requests_per_second) * 2 : 0),
      tick_interval_(interval_for_rate(requests_per_second)) {
    if (enabled()) {
        ticker_ = std::thread([this]() { tick_loop(); });
        spdlog::debug("Rate limiter started: {} tokens/s, burst {}", rate_, capacity_);
    }
}

RateLimiter::~RateLimiter() {
    stop();
}

bool RateLimiter::acquire(const CancelToken& cancel) {
    if (!enabled()) {
        return !cancel.is_cancelled();
    }

    CancelToken::Subscription wake(cancel, [this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens_cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    tokens_cv_.wait(lock, [&]() { return tokens_ > 0 || cancel.is_cancelled(); });

    if (cancel.is_cancelled()) {
        return false;
    }
    --tokens_;
    return true;
}

bool RateLimiter::try_acquire() {
    if (!enabled()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (tokens_ == 0) {
        return false;
    }
    --tokens_;
    return true;
}

void RateLimiter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    ticker_cv_.notify_all();
    if (ticker_.joinable()) {
        ticker_.join();
    }
}

size_t RateLimiter::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_;
}

void RateLimiter::tick_loop() {
    auto next_tick = std::chrono::steady_clock::now() + tick_interval_;
    size_t dropped = 0;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (ticker_cv_.wait_until(lock, next_tick, [this]() { return stopping_; })) {
            break;
        }
        next_tick += tick_interval_;

        // Non-blocking deposit
        if (tokens_ < capacity_) {
            ++tokens_;
            tokens_cv_.notify_one();
        } else {
            ++dropped;
        }
    }

    spdlog::debug("Rate limiter ticker stopped ({} ticks dropped on a full bucket)", dropped);
}
