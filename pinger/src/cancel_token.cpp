#include "cancel_token.hpp"
#include <spdlog/spdlog.h>

bool CancelToken::cancel(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_relaxed)) {
            return false;
        }
        reason_ = reason;
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();

    spdlog::debug("Cancellation requested: {}", reason);

    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (auto& [id, callback] : callbacks_) {
        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::warn("Cancellation callback {} failed: {}", id, e.what());
        }
    }
    return true;
}

std::string CancelToken::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

bool CancelToken::sleep_for(std::chrono::nanoseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    bool cancelled = cv_.wait_for(lock, duration, [this]() {
        return cancelled_.load(std::memory_order_relaxed);
    });
    return !cancelled;
}

uint64_t CancelToken::add_callback(Callback callback) const {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    uint64_t id = next_id_++;
    callbacks_.emplace(id, std::move(callback));
    return id;
}

void CancelToken::remove_callback(uint64_t id) const {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.erase(id);
}

CancelToken::Subscription::Subscription(const CancelToken& token, Callback callback)
    : token_(token), id_(token.add_callback(std::move(callback))) {
}

CancelToken::Subscription::~Subscription() {
    token_.remove_callback(id_);
}
