
#pragma once

#include "prober.hpp"
#include "types.hpp"
#include <chrono>
#include <string>

class RetryPolicy {
public:
    RetryPolicy(const Prober& prober,
                int max_retries,
                std::chrono::milliseconds base_delay = std::chrono::milliseconds(100));

    // Up to max_retries + 1 attempts. Returns the first non-retryable result,
    // a cancellation result, or the last result once attempts run out.
    ProbeResult run(const std::string& url, const CancelToken& cancel) const;

    // Delay before the attempt following attempt index `attempt` (0-based):
    // base * 2^attempt scaled by (1 + fraction), fraction in [0, 1).
    static std::chrono::milliseconds backoff_delay(int attempt,
                                                   double fraction,
                                                   std::chrono::milliseconds base_delay);

private:
    const Prober& prober_;
    int max_retries_;
    std::chrono::milliseconds base_delay_;
};

ProbeResult make_cancelled_result(const std::string& url, const CancelToken& cancel);
