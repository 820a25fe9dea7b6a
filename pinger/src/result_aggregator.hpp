#pragma once
#include "result_channel.hpp"
#include "types.hpp"
#include <functional>
#include <mutex>
#include <thread>

using ResultSink = std::function<void(const ProbeResult&)>;

class ResultAggregator {
public:
    ResultAggregator(ResultChannel& channel, ResultSink sink);
    ~ResultAggregator();

    ResultAggregator(const ResultAggregator&) = delete;
    ResultAggregator& operator=(const ResultAggregator&) = delete;

    // Start the consumer thread draining the channel
    void start();

    // Wait until the channel is closed and fully drained
    void join();

    // Fold one result into the stats and forward it to the sink
    void consume(const ProbeResult& result);

    // Consistent copy of the running totals
    AggregateStats snapshot() const;

private:
    void record(const ProbeResult& result);
    void run();

    ResultChannel& channel_;
    ResultSink sink_;

    mutable std::mutex mutex_;
    AggregateStats stats_;
    std::thread consumer_;
};
