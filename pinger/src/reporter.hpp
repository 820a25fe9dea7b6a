
#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>
#include <ostream>
#include <string>

std::string format_result_line(const ProbeResult& result);
std::string format_summary(const AggregateStats& stats, std::chrono::nanoseconds runtime);

nlohmann::json result_to_json(const ProbeResult& result);
nlohmann::json summary_to_json(const AggregateStats& stats, std::chrono::nanoseconds runtime);

// Writes results and the final summary either as text lines or as JSON lines.
class Reporter {
public:
    Reporter(std::ostream& out, bool json_output);

    void on_result(const ProbeResult& result);
    void print_summary(const AggregateStats& stats, std::chrono::nanoseconds runtime);

private:
    std::ostream& out_;
    bool json_output_;
    std::mutex mutex_;
};
