#include "../src/errors/exchange_errors.hpp"
#include "../src/retry/retry_engine.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

class RetryEngineTest : public ::testing::Test {
protected:
    ManualClock clock;
    // No jitter unless a test asks for it.
    RetryEngine engine{"binance", RetryPolicy{3, 1000}, clock, [] { return 0.0; }};
};

TEST_F(RetryEngineTest, SuccessFirstTry)
{
    int calls = 0;
    int v = engine.execute([&] { ++calls; return 7; }, "op");
    EXPECT_EQ(7, v);
    EXPECT_EQ(1, calls);
    EXPECT_TRUE(clock.sleeps().empty());
    EXPECT_EQ(RetryOutcome::Success, engine.last_outcome());
}

TEST_F(RetryEngineTest, RecoversAfterTransientFailure)
{
    int calls = 0;
    std::vector<RetryEvent> events;
    engine.set_retry_hook([&](const RetryEvent& ev) { events.push_back(ev); });

    std::string v = engine.execute([&]() -> std::string {
        if (++calls < 3) throw RequestTimeout("timed out");
        return "ok";
    }, "fetch ticker");

    EXPECT_EQ("ok", v);
    EXPECT_EQ(3, calls);
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(1, events[0].attempt);
    EXPECT_EQ(1000, events[0].delay_ms);
    EXPECT_EQ(2000, events[1].delay_ms);
    EXPECT_EQ("fetch ticker", events[1].operation);
    EXPECT_EQ("timed out", events[1].error);
    EXPECT_EQ(3, events[1].max_retries);
}

TEST_F(RetryEngineTest, ExhaustionIsNotRetryable)
{
    int calls = 0;
    int failures = 0;
    engine.set_failure_hook([&](const NormalizedError&) { ++failures; });

    try {
        engine.execute([&]() -> int { ++calls; throw NetworkError("socket reset"); }, "fetch balance");
        FAIL() << "expected NormalizedError";
    } catch (const NormalizedError& e) {
        EXPECT_EQ(ErrorKind::NetworkError, e.kind());
        EXPECT_FALSE(e.retryable());
        EXPECT_EQ("fetch balance", e.operation());
        EXPECT_EQ("binance", e.exchange());
    }
    EXPECT_EQ(3, calls);
    auto sleeps = clock.sleeps();
    ASSERT_EQ(2u, sleeps.size());
    EXPECT_LT(sleeps[0], sleeps[1]);
    EXPECT_EQ(1, failures);
    EXPECT_EQ(RetryOutcome::Exhausted, engine.last_outcome());
}

TEST_F(RetryEngineTest, FatalErrorThrowsImmediately)
{
    int calls = 0;
    EXPECT_THROW(engine.execute([&]() -> int {
        ++calls;
        throw AuthenticationError("bad key");
    }, "fetch balance"), NormalizedError);

    EXPECT_EQ(1, calls);
    EXPECT_TRUE(clock.sleeps().empty());
    EXPECT_EQ(RetryOutcome::NonRetryable, engine.last_outcome());
}

TEST_F(RetryEngineTest, ZeroRetriesStillRunsOnce)
{
    RetryEngine once{"okx", RetryPolicy{0, 1000}, clock};
    int calls = 0;
    EXPECT_THROW(once.execute([&]() -> int { ++calls; throw NetworkError("x"); }, "op"),
        NormalizedError);
    EXPECT_EQ(1, calls);
    EXPECT_TRUE(clock.sleeps().empty());
}

TEST_F(RetryEngineTest, VoidCallables)
{
    int calls = 0;
    engine.execute([&] { ++calls; }, "noop");
    EXPECT_EQ(1, calls);
}

TEST(RetryBackoffTest, NonDecreasingAndCapped)
{
    RetryPolicy policy{20, 1000};
    std::int64_t prev = 0;
    for (int attempt = 1; attempt <= 20; ++attempt) {
        auto d = RetryEngine::base_backoff(policy, attempt);
        EXPECT_GE(d, prev);
        EXPECT_LE(d, kMaxBackoffMs);
        prev = d;
    }
    EXPECT_EQ(kMaxBackoffMs, RetryEngine::base_backoff(policy, 20));
}

TEST(RetryBackoffTest, JitterStaysWithinQuarter)
{
    ManualClock clock;
    RetryEngine high{"x", RetryPolicy{3, 1000}, clock, [] { return 0.999; }};
    EXPECT_GE(high.jittered_backoff(2), 2000);
    EXPECT_LE(high.jittered_backoff(2), 2500);

    RetryEngine low{"x", RetryPolicy{3, 1000}, clock, [] { return 0.0; }};
    EXPECT_EQ(2000, low.jittered_backoff(2));

    RetryEngine big{"x", RetryPolicy{3, 1000}, clock, [] { return 0.999; }};
    EXPECT_EQ(kMaxBackoffMs, big.jittered_backoff(15));
}
