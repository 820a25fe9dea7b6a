#include <atomic>
#include <chrono>
#include <thread>

#include "retry_policy.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

static const std::string kUrl = "https://flaky.example";

static void test_backoff_delay_bounds()
{
    for (int a = 0; a < 6; ++a)
    {
        long long base = 100LL << a;
        auto lo = RetryPolicy::backoff_delay(a, 0.0, 100ms);
        auto hi = RetryPolicy::backoff_delay(a, 0.999999, 100ms);
        auto edge = RetryPolicy::backoff_delay(a, 1.0, 100ms);
        assert_true(lo.count() == base, "zero jitter gives exactly the base delay");
        assert_true(hi.count() >= base && hi.count() < 2 * base, "max jitter stays below twice the base");
        assert_true(edge.count() < 2 * base, "fraction of 1.0 is clamped below twice the base");
    }
    assert_true(RetryPolicy::backoff_delay(2, 0.5, 100ms).count() == 600, "400ms base plus half jitter");
}

static void test_always_failing_makes_all_attempts()
{
    FakeTransport transport([](HttpMethod, const std::string&, const CancelToken&) {
        return reply_error("connection refused");
    });
    Prober prober(transport, 1000ms);
    RetryPolicy policy(prober, 3, 1ms);
    CancelToken cancel;

    ProbeResult r = policy.run(kUrl, cancel);
    assert_true(transport.calls(HttpMethod::Head, kUrl) == 4, "retries=3 makes 4 HEAD attempts");
    assert_true(transport.calls(HttpMethod::Get, kUrl) == 4, "each failed HEAD falls back to GET");
    assert_true(r.has_error(), "final result keeps the transport error");
    assert_true(r.error_kind == ProbeErrorKind::Transport, "transport error kind");
    assert_true(r.attempts == 4, "attempt count recorded");
    assert_true(!r.counts_as_success(), "failure in the tally");
}

static void test_server_errors_are_retried()
{
    FakeTransport transport([](HttpMethod, const std::string&, const CancelToken&) {
        return reply_status(503);
    });
    Prober prober(transport, 1000ms);
    RetryPolicy policy(prober, 2, 1ms);
    CancelToken cancel;

    ProbeResult r = policy.run(kUrl, cancel);
    assert_true(transport.calls(HttpMethod::Head, kUrl) == 3, "503 retried up to R+1 attempts");
    assert_true(transport.calls(HttpMethod::Get, kUrl) == 0, "HEAD got a response so no GET fallback");
    assert_true(!r.has_error() && r.status_code == 503, "last 503 returned as is");
}

static void test_success_short_circuits()
{
    std::atomic<int> n{0};
    FakeTransport transport([&](HttpMethod, const std::string&, const CancelToken&) {
        return n.fetch_add(1) < 2 ? reply_status(500) : reply_status(200);
    });
    Prober prober(transport, 1000ms);
    RetryPolicy policy(prober, 5, 1ms);
    CancelToken cancel;

    ProbeResult r = policy.run(kUrl, cancel);
    assert_true(transport.calls(HttpMethod::Head, kUrl) == 3, "stops at the first success");
    assert_true(r.status_code == 200 && r.attempts == 3, "success on attempt 3");
}

static void test_client_error_is_terminal()
{
    FakeTransport transport([](HttpMethod, const std::string&, const CancelToken&) {
        return reply_status(430);
    });
    Prober prober(transport, 1000ms);
    RetryPolicy policy(prober, 4, 1ms);
    CancelToken cancel;

    ProbeResult r = policy.run(kUrl, cancel);
    assert_true(transport.calls(HttpMethod::Head, kUrl) == 1, "430 is never retried");
    assert_true(r.status_code == 430 && !r.has_error(), "430 returned without error");
    assert_true(!r.is_retryable(), "430 not retry-worthy");
    assert_true(!r.counts_as_success(), "430 still counts as failed");
}

static void test_cancelled_before_first_attempt()
{
    FakeTransport transport([](HttpMethod, const std::string&, const CancelToken&) {
        return reply_status(200);
    });
    Prober prober(transport, 1000ms);
    RetryPolicy policy(prober, 2, 1ms);
    CancelToken cancel;
    cancel.cancel("test shutdown");

    ProbeResult r = policy.run(kUrl, cancel);
    assert_true(transport.total_calls(HttpMethod::Head) == 0, "no network work after cancellation");
    assert_true(r.is_cancelled(), "cancelled result");
    assert_true(r.error && *r.error == "test shutdown", "carries the cancellation cause");
    assert_true(r.status_code == 0, "no HTTP data");
}

static void test_cancel_interrupts_backoff()
{
    FakeTransport transport([](HttpMethod, const std::string&, const CancelToken&) {
        return reply_status(502);
    });
    Prober prober(transport, 1000ms);
    RetryPolicy policy(prober, 3, 500ms);
    CancelToken cancel;

    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        cancel.cancel("stop");
    });

    auto start = std::chrono::steady_clock::now();
    ProbeResult r = policy.run(kUrl, cancel);
    auto took = elapsed_ms(start);
    canceller.join();

    assert_true(r.is_cancelled(), "backoff wait resolves in favour of cancellation");
    assert_true(transport.calls(HttpMethod::Head, kUrl) == 1, "no attempt after the cancelled wait");
    assert_true(took < 450, "did not sleep out the 500ms backoff");
}

static void test_cancel_aborts_in_flight_attempt()
{
    FakeTransport transport([](HttpMethod, const std::string&, const CancelToken& c) {
        return delayed(reply_status(200), 5000ms, c);
    });
    Prober prober(transport, 10000ms);
    RetryPolicy policy(prober, 3, 1ms);
    CancelToken cancel;

    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        cancel.cancel("stop");
    });

    auto start = std::chrono::steady_clock::now();
    ProbeResult r = policy.run(kUrl, cancel);
    canceller.join();

    assert_true(r.is_cancelled(), "aborted request reported as cancelled");
    assert_true(transport.calls(HttpMethod::Get, kUrl) == 0, "no GET fallback after an abort");
    assert_true(transport.calls(HttpMethod::Head, kUrl) == 1, "no retry after an abort");
    assert_true(elapsed_ms(start) < 2000, "in-flight call released promptly");
}

int main()
{
    test_backoff_delay_bounds();
    test_always_failing_makes_all_attempts();
    test_server_errors_are_retried();
    test_success_short_circuits();
    test_client_error_is_terminal();
    test_cancelled_before_first_attempt();
    test_cancel_interrupts_backoff();
    test_cancel_aborts_in_flight_attempt();
    std::cout << "retry_policy_tests: OK" << std::endl;
    return 0;
}
