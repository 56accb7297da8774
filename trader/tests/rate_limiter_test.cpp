#include "config.hpp"
#include "polymarket_client.hpp"
#include "rate_limiter.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(RateLimiterTest, BurstThenRefill) {
    RateLimiter limiter(RateLimit{2.0, 3});
    auto now = RateLimiter::SteadyClock::now();

    EXPECT_TRUE(limiter.try_acquire("reads", now));
    EXPECT_TRUE(limiter.try_acquire("reads", now));
    EXPECT_TRUE(limiter.try_acquire("reads", now));
    EXPECT_FALSE(limiter.try_acquire("reads", now));
    EXPECT_EQ(limiter.wait_time("reads", now).count(), 500);

    EXPECT_TRUE(limiter.try_acquire("reads", now + 500ms));
    EXPECT_FALSE(limiter.try_acquire("reads", now + 500ms));
}

TEST(RateLimiterTest, RefillNeverExceedsBurst) {
    RateLimiter limiter(RateLimit{100.0, 2});
    auto now = RateLimiter::SteadyClock::now();
    limiter.try_acquire("reads", now);

    auto later = now + 10s;
    EXPECT_TRUE(limiter.try_acquire("reads", later));
    EXPECT_TRUE(limiter.try_acquire("reads", later));
    EXPECT_FALSE(limiter.try_acquire("reads", later));
}

TEST(RateLimiterTest, BucketsAreIndependent) {
    RateLimiter limiter(RateLimit{1.0, 1});
    auto now = RateLimiter::SteadyClock::now();

    EXPECT_TRUE(limiter.try_acquire("reads", now));
    EXPECT_FALSE(limiter.try_acquire("reads", now));
    EXPECT_TRUE(limiter.try_acquire("orders", now));
}

TEST(RateLimiterTest, SetLimitClampsTokens) {
    RateLimiter limiter(RateLimit{1.0, 5});
    auto now = RateLimiter::SteadyClock::now();
    EXPECT_TRUE(limiter.try_acquire("orders", now));

    limiter.set_limit("orders", RateLimit{1.0, 1});
    EXPECT_TRUE(limiter.try_acquire("orders", now));
    EXPECT_FALSE(limiter.try_acquire("orders", now));
}

TEST(RateLimiterTest, AcquireGivesUpPastMaxWait) {
    RateLimiter limiter(RateLimit{0.1, 1});
    EXPECT_TRUE(limiter.acquire("orders", 0ms));

    auto started = RateLimiter::SteadyClock::now();
    EXPECT_FALSE(limiter.acquire("orders", 50ms));
    EXPECT_LT(RateLimiter::SteadyClock::now() - started, 1s);
}

TEST(RateLimiterTest, AcquireWaitsForRefill) {
    RateLimiter limiter(RateLimit{50.0, 1});
    EXPECT_TRUE(limiter.acquire("reads", 0ms));

    auto started = RateLimiter::SteadyClock::now();
    EXPECT_TRUE(limiter.acquire("reads", 500ms));
    EXPECT_GE(RateLimiter::SteadyClock::now() - started, 10ms);
}

TEST(RateLimiterTest, ConcurrentCallersShareTheBurst) {
    RateLimiter limiter(RateLimit{0.001, 10});
    auto now = RateLimiter::SteadyClock::now();
    std::atomic<int> granted{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 10; ++i) {
                if (limiter.try_acquire("reads", now)) {
                    granted++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(granted.load(), 10);
}

TEST(RateLimiterTest, VenueRejectsOrdersOverTheLimit) {
    Config config;
    config.polymarket_api_url = "http://127.0.0.1:1";
    config.venue_timeout_ms = 50;
    config.venue_rate_per_sec = 0.01;
    config.venue_rate_burst = 1;
    PolymarketClient client(config);

    OrderRequest request;
    request.client_order_id = "PAPER_20260101_0001";
    request.market_id = "m1";
    request.direction = Direction::Yes;
    request.size_usd = 1.0;
    request.limit_price = 0.5;

    auto first = client.submit_order(request);
    EXPECT_NE(first.status, OrderStatus::Accepted);
    EXPECT_NE(first.cause, "order rate limit reached");

    auto second = client.submit_order(request);
    EXPECT_EQ(second.status, OrderStatus::Rejected);
    EXPECT_EQ(second.cause, "order rate limit reached");
}
