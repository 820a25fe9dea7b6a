#include <atomic>
#include <chrono>
#include <thread>

#include "rate_limiter.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

static void test_disabled_never_blocks()
{
    RateLimiter limiter(0);
    CancelToken cancel;
    assert_true(!limiter.enabled(), "rate 0 disables limiting");

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 1000; ++i)
    {
        assert_true(limiter.acquire(cancel), "always admitted");
    }
    assert_true(elapsed_ms(start) < 200, "no waiting when disabled");

    cancel.cancel();
    assert_true(!limiter.acquire(cancel), "still honours cancellation");
}

static void test_starts_empty()
{
    RateLimiter limiter(2);
    assert_true(limiter.capacity() == 4, "capacity is twice the rate");
    assert_true(limiter.tick_interval() == 500ms, "one tick per 1/rate seconds");
    assert_true(!limiter.try_acquire(), "no token before the first tick");
}

static void test_burst_is_capped()
{
    RateLimiter limiter(20);
    std::this_thread::sleep_for(2500ms);
    assert_true(limiter.available() == limiter.capacity(), "bucket fills up to 2*rate");

    std::this_thread::sleep_for(300ms);
    assert_true(limiter.available() == limiter.capacity(), "extra ticks are dropped, not accumulated");
}

static void test_throughput_tracks_rate()
{
    RateLimiter limiter(20);
    CancelToken cancel;
    std::atomic<int> admitted{0};

    std::thread consumer([&] {
        while (limiter.acquire(cancel)) admitted.fetch_add(1);
    });

    std::this_thread::sleep_for(1000ms);
    cancel.cancel();
    consumer.join();

    int n = admitted.load();
    assert_true(n >= 10 && n <= 40, "about 20 tokens per second, within the 2x burst window");
}

static void test_cancel_unblocks_waiter()
{
    RateLimiter limiter(1);
    CancelToken cancel;
    std::atomic<bool> result{true};

    auto start = std::chrono::steady_clock::now();
    std::thread waiter([&] { result = limiter.acquire(cancel); });
    std::this_thread::sleep_for(50ms);
    cancel.cancel();
    waiter.join();

    assert_true(!result.load(), "acquire reports cancellation");
    assert_true(elapsed_ms(start) < 500, "woke before the first 1s tick");
}

static void test_stop_halts_ticker()
{
    RateLimiter limiter(100);
    std::this_thread::sleep_for(100ms);
    limiter.stop();
    size_t before = limiter.available();
    std::this_thread::sleep_for(100ms);
    assert_true(limiter.available() == before, "no deposits after stop");
    limiter.stop();
}

int main()
{
    test_disabled_never_blocks();
    test_starts_empty();
    test_burst_is_capped();
    test_throughput_tracks_rate();
    test_cancel_unblocks_waiter();
    test_stop_halts_ticker();
    std::cout << "rate_limiter_tests: OK" << std::endl;
    return 0;
}
