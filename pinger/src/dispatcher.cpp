#include "dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <system_error>
#include <thread>

Dispatcher::Dispatcher(const RetryPolicy& retry_policy,
                       RateLimiter& rate_limiter,
                       AdmissionGate& gate,
                       ResultChannel& results,
                       int count,
                       std::chrono::milliseconds interval)
    : retry_policy_(retry_policy),
      rate_limiter_(rate_limiter),
      gate_(gate),
      results_(results),
      count_(count),
      interval_(interval) {
}

DispatchReport Dispatcher::run(const std::vector<std::string>& urls, const CancelToken& cancel) {
    DispatchReport report;
    std::vector<std::thread> tasks;
    tasks.reserve(urls.size() * static_cast<size_t>(count_));

    for (int round = 0; round < count_ && !report.aborted; ++round) {
        ++report.rounds_started;
        spdlog::debug("Starting round {}/{} over {} urls", round + 1, count_, urls.size());

        for (const auto& url : urls) {
            if (cancel.is_cancelled()) {
                report.aborted = true;
                break;
            }
            try {
                tasks.emplace_back([this, url, round, &cancel]() { run_task(url, round, cancel); });
            } catch (const std::system_error& e) {
                spdlog::error("Could not start probe task for {}: {}", url, e.what());
                report.aborted = true;
                break;
            }
            ++report.tasks_spawned;
        }

        if (report.aborted) {
            break;
        }

        if (round < count_ - 1 && !cancel.sleep_for(interval_)) {
            report.aborted = true;
        }
    }

    if (report.aborted) {
        spdlog::info("Schedule aborted after {} round(s): {}", report.rounds_started,
                     cancel.is_cancelled() ? cancel.reason() : std::string("task start failed"));
    }

    for (auto& task : tasks) {
        task.join();
    }

    results_.close();
    spdlog::debug("Dispatcher finished: {} tasks over {} round(s)", report.tasks_spawned, report.rounds_started);
    return report;
}

void Dispatcher::run_task(const std::string& url, int round, const CancelToken& cancel) {
    ProbeResult result;
    AdmissionGate::Permit permit;

    try {
        if (!rate_limiter_.acquire(cancel)) {
            result = make_cancelled_result(url, cancel);
        } else if (!(permit = gate_.acquire(cancel))) {
            result = make_cancelled_result(url, cancel);
        } else {
            result = retry_policy_.run(url, cancel);
        }
    } catch (const std::exception& e) {
        spdlog::error("Probe task for {} failed: {}", url, e.what());
        result = ProbeResult{};
        result.url = url;
        result.timestamp = std::chrono::system_clock::now();
        result.error = e.what();
        result.error_kind = ProbeErrorKind::Transport;
    }

    result.round = round;
    results_.push(std::move(result));
    // permit goes back to the gate here
}
