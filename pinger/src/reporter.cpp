#include "reporter.hpp"
#include "util.hpp"
#include <fmt/format.h>

namespace {

double to_millis(std::chrono::nanoseconds duration) {
    return std::chrono::duration<double, std::milli>(duration).count();
}

} // namespace

std::string format_result_line(const ProbeResult& result) {
    std::string when = util::format_clock_time(result.timestamp);
    if (result.has_error()) {
        return fmt::format("[{}] {} ERROR: {}", when, result.url, *result.error);
    }
    return fmt::format("[{}] {} {} in {}", when, result.url, result.status_code,
                       util::format_duration(result.duration));
}

std::string format_summary(const AggregateStats& stats, std::chrono::nanoseconds runtime) {
    std::string summary = "---- summary ----\n";
    summary += fmt::format("requests: {}, success: {}, failed: {}\n",
                           stats.total, stats.success_count, stats.failed_count);
    if (stats.total > 0) {
        summary += fmt::format("avg latency: {}, min: {}, max: {}\n",
                               util::format_duration(stats.average_latency()),
                               util::format_duration(stats.min_latency),
                               util::format_duration(stats.max_latency));
    }
    summary += fmt::format("total runtime: {}\n", util::format_duration(runtime));
    return summary;
}

nlohmann::json result_to_json(const ProbeResult& result) {
    nlohmann::json j;
    j["url"] = result.url;
    j["status"] = result.status_code;
    j["duration_ms"] = to_millis(result.duration);
    j["error"] = result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr);
    j["cancelled"] = result.is_cancelled();
    j["timestamp"] = util::format_timestamp(result.timestamp);
    j["round"] = result.round;
    j["attempts"] = result.attempts;
    return j;
}

nlohmann::json summary_to_json(const AggregateStats& stats, std::chrono::nanoseconds runtime) {
    nlohmann::json j;
    j["type"] = "summary";
    j["requests"] = stats.total;
    j["success"] = stats.success_count;
    j["failed"] = stats.failed_count;
    if (stats.has_latency()) {
        j["avg_latency_ms"] = to_millis(stats.average_latency());
        j["min_latency_ms"] = to_millis(stats.min_latency);
        j["max_latency_ms"] = to_millis(stats.max_latency);
    }
    j["runtime_ms"] = to_millis(runtime);
    return j;
}

Reporter::Reporter(std::ostream& out, bool json_output)
    : out_(out), json_output_(json_output) {
}

void Reporter::on_result(const ProbeResult& result) {
    std::string line = json_output_ ? result_to_json(result).dump() : format_result_line(result);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
}

void Reporter::print_summary(const AggregateStats& stats, std::chrono::nanoseconds runtime) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (json_output_) {
        out_ << summary_to_json(stats, runtime).dump() << '\n';
    } else {
        out_ << format_summary(stats, runtime);
    }
    out_.flush();
}
