#include "service.hpp"
#include "admission_gate.hpp"
#include "prober.hpp"
#include "rate_limiter.hpp"
#include "result_channel.hpp"
#include "retry_policy.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

Service::Service(const Config& config, HttpTransport& transport, ResultSink sink)
    : config_(config),
      transport_(transport),
      sink_(std::move(sink)) {
}

RunSummary Service::run(const std::vector<std::string>& urls) {
    if (running_.exchange(true)) {
        throw std::logic_error("Service::run called twice");
    }

    RunSummary summary;
    auto start_time = std::chrono::steady_clock::now();

    spdlog::info("Probing {} urls: {} round(s), concurrency {}, rate {}, timeout {} ms, retries {}",
                 urls.size(), config_.count, config_.concurrency,
                 config_.rate > 0 ? std::to_string(config_.rate) + "/s" : std::string("unlimited"),
                 config_.timeout.count(), config_.retries);

    Prober prober(transport_, config_.timeout);
    RetryPolicy retry_policy(prober, config_.retries);
    RateLimiter rate_limiter(config_.rate);
    AdmissionGate gate(config_.concurrency);
    ResultChannel results;

    ResultAggregator aggregator(results, sink_);
    aggregator.start();

    Dispatcher dispatcher(retry_policy, rate_limiter, gate, results, config_.count, config_.interval);
    summary.dispatch = dispatcher.run(urls, cancel_);

    rate_limiter.stop();
    aggregator.join();

    summary.stats = aggregator.snapshot();
    summary.runtime = std::chrono::steady_clock::now() - start_time;

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(summary.runtime).count();
    spdlog::info("Run finished in {} ms: {} requests, {} ok, {} failed{}",
                 elapsed_ms, summary.stats.total, summary.stats.success_count,
                 summary.stats.failed_count, summary.dispatch.aborted ? " (interrupted)" : "");
    return summary;
}

void Service::stop(const std::string& reason) {
    if (cancel_.cancel(reason)) {
        spdlog::info("Stopping pinger service: {}", reason);
    }
}
