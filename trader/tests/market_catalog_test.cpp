#include "market_catalog.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using testing_support::FakeVenue;
using testing_support::make_market;

class MarketCatalogTest : public ::testing::Test {
protected:
    FakeVenue venue_;
    Config config_;
    CachedMarketCatalog catalog_{config_, venue_};
};

TEST_F(MarketCatalogTest, CachesWithinTtl) {
    venue_.markets = {make_market("m1", 95000.0, 0.5)};

    EXPECT_EQ(catalog_.active_markets().size(), 1u);
    EXPECT_EQ(catalog_.active_markets().size(), 1u);
    EXPECT_EQ(venue_.listings, 1);
}

TEST_F(MarketCatalogTest, ZeroTtlRefreshesEveryCall) {
    config_.market_cache_ttl_sec = 0;
    venue_.markets = {make_market("m1", 95000.0, 0.5)};

    catalog_.active_markets();
    catalog_.active_markets();
    EXPECT_EQ(venue_.listings, 2);
}

TEST_F(MarketCatalogTest, FailedRefreshServesUnexpiredCache) {
    auto now = Clock::now();
    venue_.markets = {
        make_market("live", 95000.0, 0.5, now, std::chrono::minutes(10)),
        make_market("ending", 95000.0, 0.5, now, std::chrono::seconds(0)),
    };
    catalog_.active_markets();

    venue_.listing_fails = true;
    config_.market_cache_ttl_sec = 0;
    auto markets = catalog_.active_markets();

    ASSERT_EQ(markets.size(), 1u);
    EXPECT_EQ(markets[0].market_id, "live");
    EXPECT_TRUE(catalog_.last_refresh_failed());
}
