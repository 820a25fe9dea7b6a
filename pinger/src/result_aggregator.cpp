#include "result_aggregator.hpp"
#include <spdlog/spdlog.h>

ResultAggregator::ResultAggregator(ResultChannel& channel, ResultSink sink)
    : channel_(channel), sink_(std::move(sink)) {
}

ResultAggregator::~ResultAggregator() {
    if (consumer_.joinable()) {
        // Unblock pop() so the consumer can exit
        channel_.close();
        consumer_.join();
    }
}

void ResultAggregator::start() {
    if (consumer_.joinable()) {
        spdlog::warn("Result aggregator already running");
        return;
    }
    consumer_ = std::thread([this]() { run(); });
}

void ResultAggregator::join() {
    if (consumer_.joinable()) {
        consumer_.join();
    }
}

void ResultAggregator::consume(const ProbeResult& result) {
    record(result);

    if (!sink_) {
        return;
    }
    try {
        sink_(result);
    } catch (const std::exception& e) {
        spdlog::error("Result sink failed for {}: {}", result.url, e.what());
    }
}

AggregateStats ResultAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void ResultAggregator::record(const ProbeResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);

    ++stats_.total;
    if (result.counts_as_success()) {
        ++stats_.success_count;
    } else {
        ++stats_.failed_count;
    }

    if (result.has_error()) {
        return;
    }

    auto latency = result.duration;
    if (stats_.latency_samples == 0) {
        stats_.min_latency = latency;
        stats_.max_latency = latency;
    } else {
        if (latency < stats_.min_latency) stats_.min_latency = latency;
        if (latency > stats_.max_latency) stats_.max_latency = latency;
    }
    stats_.sum_latency += latency;
    ++stats_.latency_samples;
}

void ResultAggregator::run() {
    spdlog::debug("Result aggregator started");

    while (auto result = channel_.pop()) {
        consume(*result);
    }

    auto stats = snapshot();
    spdlog::debug("Result aggregator drained: {} results ({} ok, {} failed)",
                  stats.total, stats.success_count, stats.failed_count);
}
