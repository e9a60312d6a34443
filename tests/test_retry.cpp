#include <gtest/gtest.h>
#include <thread>

#include "util/retry.hpp"

using ferry::CancelToken;
using ferry::Errc;
using ferry::RetryPolicy;
using namespace std::chrono_literals;

TEST(Retry, DelayGrowsAndCaps)
{
    RetryPolicy p;
    p.delay      = 100ms;
    p.multiplier = 2.0;
    p.max_delay  = 350ms;
    EXPECT_EQ(p.delay_for(1), 100ms);
    EXPECT_EQ(p.delay_for(2), 200ms);
    EXPECT_EQ(p.delay_for(3), 350ms);
    EXPECT_EQ(p.delay_for(10), 350ms);

    p.multiplier = 1.0;
    EXPECT_EQ(p.delay_for(5), 100ms);
}

TEST(Retry, StopsOnSuccess)
{
    RetryPolicy p;
    p.delay = 1ms;
    int  calls    = 0;
    int  attempts = 0;
    Errc rc       = ferry::retry_with_backoff(
        p, nullptr, [&] { return ++calls < 3 ? Errc::chunk_not_ready : Errc::ok; }, &attempts);
    EXPECT_EQ(rc, Errc::ok);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(attempts, 3);
}

TEST(Retry, FatalCodeIsNotRetried)
{
    RetryPolicy p;
    p.delay   = 1ms;
    int  calls = 0;
    Errc rc    = ferry::retry_with_backoff(p, nullptr, [&] {
        ++calls;
        return Errc::transfer_not_found;
    });
    EXPECT_EQ(rc, Errc::transfer_not_found);
    EXPECT_EQ(calls, 1);
}

TEST(Retry, ExhaustionReturnsLastRetryableCode)
{
    RetryPolicy p;
    p.max_attempts = 4;
    p.delay        = 1ms;
    p.max_delay    = 2ms;
    int  calls     = 0;
    Errc rc        = ferry::retry_with_backoff(p, nullptr, [&] {
        ++calls;
        return Errc::unreachable;
    });
    EXPECT_EQ(rc, Errc::unreachable);
    EXPECT_TRUE(ferry::is_retryable(rc));
    EXPECT_EQ(calls, 4);
}

TEST(Retry, EmptyBudgetStillTriesOnce)
{
    RetryPolicy p;
    p.max_attempts = 0;
    int  calls     = 0;
    int  attempts  = 0;
    Errc rc        = ferry::retry_with_backoff(
        p, nullptr,
        [&] {
            ++calls;
            return Errc::chunk_not_ready;
        },
        &attempts);
    EXPECT_EQ(rc, Errc::chunk_not_ready);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(attempts, 1);

    p.max_attempts = -3;
    rc             = ferry::retry_with_backoff(p, nullptr, [] { return Errc::ok; });
    EXPECT_EQ(rc, Errc::ok);
}

TEST(Retry, CancelInterruptsBackoff)
{
    RetryPolicy p;
    p.delay     = 10s;
    p.max_delay = 10s;
    CancelToken token;
    std::thread t([&] {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    Errc       rc    = ferry::retry_with_backoff(p, &token, [] { return Errc::chunk_not_ready; });
    t.join();
    EXPECT_EQ(rc, Errc::cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(CancelToken, WaitReportsState)
{
    CancelToken token;
    EXPECT_TRUE(token.wait_for(1ms));
    token.cancel();
    EXPECT_TRUE(token.cancelled());
    EXPECT_FALSE(token.wait_for(1s));
}
