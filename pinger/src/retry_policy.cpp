#include "retry_policy.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

RetryPolicy::RetryPolicy(const Prober& prober, int max_retries, std::chrono::milliseconds base_delay)
    : prober_(prober),
      max_retries_(max_retries < 0 ? 0 : max_retries),
      base_delay_(base_delay) {
}

ProbeResult RetryPolicy::run(const std::string& url, const CancelToken& cancel) const {
    ProbeResult last;
    last.url = url;

    for (int attempt = 0; attempt <= max_retries_; ++attempt) {
        if (cancel.is_cancelled()) {
            ProbeResult cancelled = make_cancelled_result(url, cancel);
            cancelled.attempts = attempt;
            return cancelled;
        }

        last = prober_.probe_once(url, cancel);
        last.attempts = attempt + 1;

        if (!last.is_retryable() || last.is_cancelled()) {
            return last;
        }

        if (attempt < max_retries_) {
            auto delay = backoff_delay(attempt, util::random_fraction(), base_delay_);
            spdlog::debug("{} attempt {}/{} failed ({}), backing off for {} ms",
                          url, attempt + 1, max_retries_ + 1,
                          last.error ? *last.error : std::to_string(last.status_code),
                          delay.count());

            if (!cancel.sleep_for(delay)) {
                ProbeResult cancelled = make_cancelled_result(url, cancel);
                cancelled.attempts = attempt + 1;
                return cancelled;
            }
        }
    }

    return last;
}

std::chrono::milliseconds RetryPolicy::backoff_delay(int attempt,
                                                     double fraction,
                                                     std::chrono::milliseconds base_delay) {
    fraction = std::clamp(fraction, 0.0, std::nextafter(1.0, 0.0));
    double base_ms = static_cast<double>(base_delay.count()) * std::pow(2.0, attempt);
    double jitter_ms = base_ms * fraction;
    return std::chrono::milliseconds(static_cast<int64_t>(std::floor(base_ms + jitter_ms)));
}

ProbeResult make_cancelled_result(const std::string& url, const CancelToken& cancel) {
    ProbeResult result;
    result.url = url;
    result.timestamp = std::chrono::system_clock::now();
    result.error = cancel.is_cancelled() ? cancel.reason() : std::string("operation cancelled");
    result.error_kind = ProbeErrorKind::Cancelled;
    return result;
}
