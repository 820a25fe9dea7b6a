
#pragma once

#include "admission_gate.hpp"
#include "rate_limiter.hpp"
#include "result_channel.hpp"
#include "retry_policy.hpp"
#include <chrono>
#include <string>
#include <vector>

struct DispatchReport {
    int rounds_started = 0;
    int tasks_spawned = 0;
    bool aborted = false;
};

// Schedules one probe task per (round, url), each on its own thread. Rounds are
// spaced by `interval` but never wait for earlier rounds to finish; only the
// gate and the rate limiter bound how much runs at once.
class Dispatcher {
public:
    Dispatcher(const RetryPolicy& retry_policy,
               RateLimiter& rate_limiter,
               AdmissionGate& gate,
               ResultChannel& results,
               int count,
               std::chrono::milliseconds interval);

    // Blocks until every spawned task finished, then closes the result channel.
    DispatchReport run(const std::vector<std::string>& urls, const CancelToken& cancel);

private:
    void run_task(const std::string& url, int round, const CancelToken& cancel);

    const RetryPolicy& retry_policy_;
    RateLimiter& rate_limiter_;
    AdmissionGate& gate_;
    ResultChannel& results_;
    int count_;
    std::chrono::milliseconds interval_;
};
