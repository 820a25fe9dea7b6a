
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

// One-shot cancellation signal shared by everything that can block.
// Blocking primitives subscribe a wake-up callback for the duration of a wait.
class CancelToken {
public:
    using Callback = std::function<void()>;

    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Only the first call has any effect; later calls return false.
    bool cancel(const std::string& reason = "operation cancelled");

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    std::string reason() const;

    // Returns true if the full duration elapsed, false if cancelled first.
    bool sleep_for(std::chrono::nanoseconds duration) const;

    // RAII registration of a wake-up callback. The callback runs at most once,
    // from the cancelling thread, and never after the subscription is destroyed.
    class Subscription {
    public:
        Subscription(const CancelToken& token, Callback callback);
        ~Subscription();

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

    private:
        const CancelToken& token_;
        uint64_t id_;
    };

private:
    uint64_t add_callback(Callback callback) const;
    void remove_callback(uint64_t id) const;

    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::string reason_;

    // Held while callbacks run so removal waits for an in-progress cancel()
    mutable std::mutex callbacks_mutex_;
    mutable std::map<uint64_t, Callback> callbacks_;
    mutable uint64_t next_id_ = 1;
};
