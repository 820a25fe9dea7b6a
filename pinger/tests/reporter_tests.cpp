#include <chrono>
#include <sstream>
#include <string>

#include "reporter.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

static bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

static ProbeResult sample_ok()
{
    ProbeResult r;
    r.url = "https://a.example";
    r.status_code = 200;
    r.duration = 10ms;
    r.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    r.round = 1;
    r.attempts = 2;
    return r;
}

static ProbeResult sample_error()
{
    ProbeResult r = sample_ok();
    r.url = "https://b.example";
    r.status_code = 0;
    r.error = "connection refused";
    r.error_kind = ProbeErrorKind::Transport;
    return r;
}

static void test_result_lines()
{
    std::string ok = format_result_line(sample_ok());
    assert_true(ok.size() > 11 && ok[0] == '[' && ok[9] == ']', "[HH:MM:SS] prefix");
    assert_true(contains(ok, "] https://a.example 200 in 10ms"), "status and latency");

    std::string err = format_result_line(sample_error());
    assert_true(contains(err, "] https://b.example ERROR: connection refused"), "error line");
}

static void test_summary_text()
{
    AggregateStats s;
    s.total = 2;
    s.success_count = 1;
    s.failed_count = 1;
    s.latency_samples = 1;
    s.sum_latency = 10ms;
    s.min_latency = 10ms;
    s.max_latency = 10ms;

    std::string text = format_summary(s, 1500ms);
    assert_true(contains(text, "---- summary ----\n"), "header");
    assert_true(contains(text, "requests: 2, success: 1, failed: 1\n"), "counts");
    assert_true(contains(text, "avg latency: 5ms, min: 10ms, max: 10ms\n"), "latency line");
    assert_true(contains(text, "total runtime: 1.5s\n"), "runtime");

    std::string empty = format_summary(AggregateStats{}, 1ms);
    assert_true(!contains(empty, "avg latency"), "no latency line without requests");
}

static void test_json_output()
{
    auto j = result_to_json(sample_ok());
    assert_true(j["url"] == "https://a.example", "url");
    assert_true(j["status"] == 200, "status");
    assert_true(j["duration_ms"].get<double>() == 10.0, "duration in ms");
    assert_true(j["error"].is_null(), "null error");
    assert_true(j["cancelled"] == false, "not cancelled");
    assert_true(j["timestamp"] == "2023-11-14T22:13:20.000Z", "ISO-8601 UTC timestamp");
    assert_true(j["round"] == 1 && j["attempts"] == 2, "round and attempts");

    auto e = result_to_json(sample_error());
    assert_true(e["error"] == "connection refused", "error text");

    AggregateStats s;
    s.total = 1;
    s.failed_count = 1;
    auto sj = summary_to_json(s, 2s);
    assert_true(sj["type"] == "summary" && sj["requests"] == 1 && sj["failed"] == 1, "summary counts");
    assert_true(!sj.contains("min_latency_ms"), "no latency fields without samples");
    assert_true(sj["runtime_ms"].get<double>() == 2000.0, "runtime");
}

static void test_reporter_stream()
{
    std::ostringstream text_out;
    Reporter text(text_out, false);
    text.on_result(sample_ok());
    text.on_result(sample_error());
    assert_true(contains(text_out.str(), "200 in 10ms\n"), "text line written");
    assert_true(contains(text_out.str(), "ERROR: connection refused\n"), "error line written");

    std::ostringstream json_out;
    Reporter json(json_out, true);
    json.on_result(sample_ok());
    json.print_summary(AggregateStats{}, 1s);
    std::string out = json_out.str();
    auto first = nlohmann::json::parse(out.substr(0, out.find('\n')));
    assert_true(first["url"] == "https://a.example", "NDJSON result line");
    assert_true(contains(out, "\"type\":\"summary\""), "summary object");
}

int main()
{
    test_result_lines();
    test_summary_text();
    test_json_output();
    test_reporter_stream();
    std::cout << "reporter_tests: OK" << std::endl;
    return 0;
}
