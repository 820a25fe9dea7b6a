#pragma once

#include "cancel_token.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "http_client.hpp"
#include "result_aggregator.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

struct RunSummary {
    AggregateStats stats;
    DispatchReport dispatch;
    std::chrono::nanoseconds runtime{0};
};

class Service {
public:
    Service(const Config& config, HttpTransport& transport, ResultSink sink);

    // Probe every url `count` times. Returns once all results are aggregated,
    // also when stopped early.
    RunSummary run(const std::vector<std::string>& urls);

    // Safe to call any number of times, from any thread, before or after run()
    void stop(const std::string& reason = "shutdown requested");

    bool stopped() const { return cancel_.is_cancelled(); }

private:
    const Config& config_;
    HttpTransport& transport_;
    ResultSink sink_;
    CancelToken cancel_;
    std::atomic<bool> running_{false};
};
