
#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <optional>

enum class ProbeErrorKind {
    None,
    Transport,
    Cancelled
};

struct ProbeResult {
    std::string url;
    int status_code = 0;                     // 0 when no HTTP response was obtained
    std::chrono::nanoseconds duration{0};
    std::optional<std::string> error;
    ProbeErrorKind error_kind = ProbeErrorKind::None;
    std::chrono::system_clock::time_point timestamp;  // start of the attempt
    int round = 0;
    int attempts = 0;

    bool has_error() const { return error.has_value(); }
    bool is_cancelled() const { return error_kind == ProbeErrorKind::Cancelled; }

    // Transport failures and 5xx get another attempt; everything else is final.
    bool is_retryable() const { return has_error() || status_code >= 500; }

    // Tally rule, deliberately stricter than is_retryable(): 4xx is final but failed.
    bool counts_as_success() const {
        return !has_error() && (status_code == 0 || status_code < 400);
    }
};

struct AggregateStats {
    int64_t total = 0;
    int64_t success_count = 0;
    int64_t failed_count = 0;

    // Latency figures only cover error-free results
    int64_t latency_samples = 0;
    std::chrono::nanoseconds sum_latency{0};
    std::chrono::nanoseconds min_latency{0};
    std::chrono::nanoseconds max_latency{0};

    bool has_latency() const { return latency_samples > 0; }

    // Sum over error-free results divided by every result counted
    std::chrono::nanoseconds average_latency() const {
        if (total == 0 || latency_samples == 0) {
            return std::chrono::nanoseconds(0);
        }
        return sum_latency / total;
    }
};
