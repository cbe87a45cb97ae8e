#include "auth/RateLimiter.h"

#include <gtest/gtest.h>

#include <chrono>

using pairlink::auth::RateLimiter;
using namespace std::chrono_literals;

namespace {

RateLimiter make_limiter(double conn_cap, double conn_refill, double msg_cap = 5, double msg_refill = 1) {
    return RateLimiter({conn_cap, conn_refill}, {msg_cap, msg_refill});
}

} // namespace

TEST(RateLimiter, FiftyAttemptsCapacityTenAdmitsExactlyTen) {
    auto limiter = make_limiter(10, 0.1);
    auto now = RateLimiter::Clock::now();

    int admitted = 0;
    for (int i = 0; i < 50; ++i) {
        if (limiter.admit("addr:10.0.0.1", RateLimiter::Kind::Connection, now)) ++admitted;
    }
    EXPECT_EQ(admitted, 10);
}

TEST(RateLimiter, RefillsOverTime) {
    auto limiter = make_limiter(2, 1);
    auto t0 = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.admit("k", RateLimiter::Kind::Connection, t0));
    EXPECT_TRUE(limiter.admit("k", RateLimiter::Kind::Connection, t0));
    EXPECT_FALSE(limiter.admit("k", RateLimiter::Kind::Connection, t0));

    EXPECT_FALSE(limiter.admit("k", RateLimiter::Kind::Connection, t0 + 500ms));
    EXPECT_TRUE(limiter.admit("k", RateLimiter::Kind::Connection, t0 + 1500ms));
}

TEST(RateLimiter, RefillNeverExceedsCapacity) {
    auto limiter = make_limiter(3, 100);
    auto t0 = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.admit("k", RateLimiter::Kind::Connection, t0));
    auto later = t0 + 1h;
    int admitted = 0;
    for (int i = 0; i < 10; ++i) {
        if (limiter.admit("k", RateLimiter::Kind::Connection, later)) ++admitted;
    }
    EXPECT_EQ(admitted, 3);
}

TEST(RateLimiter, KeysAreIndependent) {
    auto limiter = make_limiter(1, 0);
    auto now = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.admit("a", RateLimiter::Kind::Connection, now));
    EXPECT_FALSE(limiter.admit("a", RateLimiter::Kind::Connection, now));
    EXPECT_TRUE(limiter.admit("b", RateLimiter::Kind::Connection, now));
}

TEST(RateLimiter, MessageFloodDoesNotConsumeConnectionBudget) {
    auto limiter = make_limiter(2, 0, 3, 0);
    auto now = RateLimiter::Clock::now();

    for (int i = 0; i < 100; ++i) limiter.admit("alice", RateLimiter::Kind::Message, now);
    EXPECT_FALSE(limiter.admit("alice", RateLimiter::Kind::Message, now));

    EXPECT_TRUE(limiter.admit("alice", RateLimiter::Kind::Connection, now));
    EXPECT_TRUE(limiter.admit("alice", RateLimiter::Kind::Connection, now));
    EXPECT_FALSE(limiter.admit("alice", RateLimiter::Kind::Connection, now));
}

TEST(RateLimiter, OneSendersFloodLeavesOthersAlone) {
    auto limiter = make_limiter(1, 0, 3, 0);
    auto now = RateLimiter::Clock::now();

    for (int i = 0; i < 100; ++i) limiter.admit("flooder", RateLimiter::Kind::Message, now);
    EXPECT_TRUE(limiter.admit("bob", RateLimiter::Kind::Message, now));
}

TEST(RateLimiter, PruneDropsOnlyIdleFullBuckets) {
    auto limiter = make_limiter(2, 1);
    auto t0 = RateLimiter::Clock::now();

    limiter.admit("idle", RateLimiter::Kind::Connection, t0);
    limiter.admit("busy", RateLimiter::Kind::Connection, t0 + 595s);
    limiter.admit("busy", RateLimiter::Kind::Connection, t0 + 595s);
    EXPECT_EQ(limiter.bucket_count(), 2u);

    EXPECT_EQ(limiter.prune(600s, t0 + 600s), 1u);
    EXPECT_EQ(limiter.bucket_count(), 1u);
}
