
#pragma once
#include "types.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// Bounded many-producer / single-consumer queue of probe results.
class ResultChannel {
public:
    explicit ResultChannel(size_t capacity = 1000);

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    // Blocks while full. Returns false if the channel was closed.
    bool push(ProbeResult result);

    // Blocks until a result arrives; nullopt once closed and drained.
    std::optional<ProbeResult> pop();

    // No further pushes are accepted; pop() drains what is queued.
    void close();

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<ProbeResult> queue_;
    bool closed_ = false;
};
