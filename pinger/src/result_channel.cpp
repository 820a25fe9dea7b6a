#include "result_channel.hpp"
#include <spdlog/spdlog.h>

ResultChannel::ResultChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

bool ResultChannel::push(ProbeResult result) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() { return closed_ || queue_.size() < capacity_; });

    if (closed_) {
        spdlog::warn("Dropping result for {}: result channel closed", result.url);
        return false;
    }

    queue_.push_back(std::move(result));
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

std::optional<ProbeResult> ResultChannel::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });

    if (queue_.empty()) {
        return std::nullopt;
    }

    ProbeResult result = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return result;
}

void ResultChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}
