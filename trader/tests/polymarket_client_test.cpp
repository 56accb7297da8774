#include "polymarket_client.hpp"
#include "util.hpp"
#include <gtest/gtest.h>

class PolymarketParseTest : public ::testing::Test {
protected:
    nlohmann::json market_json(const std::string& question) const {
        return {
            {"id", "0xabc"},
            {"question", question},
            {"outcomePrices", "[\"0.45\", \"0.55\"]"},
            {"createdAt", util::format_timestamp(now_ - std::chrono::minutes(1))},
            {"endDate", util::format_timestamp(now_ + std::chrono::minutes(4))},
            {"closed", false}
        };
    }

    TimePoint now_ = Clock::now();
};

TEST_F(PolymarketParseTest, ParsesShortBitcoinMarket) {
    auto market = PolymarketClient::parse_market(
        market_json("Will Bitcoin be above $95,000.50 in 5 minutes?"), "btcusdt", now_);

    ASSERT_TRUE(market.has_value());
    EXPECT_EQ(market->market_id, "0xabc");
    EXPECT_DOUBLE_EQ(market->baseline_price, 95000.50);
    EXPECT_DOUBLE_EQ(market->yes_price, 0.45);
    EXPECT_FALSE(market->is_expired(now_));
}

TEST_F(PolymarketParseTest, AcceptsOutcomePricesArray) {
    auto j = market_json("BTC above $94000 in 5 min?");
    j["outcomePrices"] = {0.61, 0.39};

    auto market = PolymarketClient::parse_market(j, "btcusdt", now_);
    ASSERT_TRUE(market.has_value());
    EXPECT_DOUBLE_EQ(market->yes_price, 0.61);
}

TEST_F(PolymarketParseTest, SkipsOtherAssetsAndWindows) {
    EXPECT_FALSE(PolymarketClient::parse_market(
        market_json("Will ETH be above $3,000 in 5 minutes?"), "btcusdt", now_));
    EXPECT_FALSE(PolymarketClient::parse_market(
        market_json("Will Bitcoin be above $95,000 by Friday?"), "btcusdt", now_));
    EXPECT_FALSE(PolymarketClient::parse_market(
        market_json("Will Bitcoin go up in 5 minutes?"), "btcusdt", now_));
}

TEST_F(PolymarketParseTest, SkipsClosedAndExpiredMarkets) {
    auto closed = market_json("Will Bitcoin be above $95,000 in 5 minutes?");
    closed["closed"] = true;
    EXPECT_FALSE(PolymarketClient::parse_market(closed, "btcusdt", now_));

    auto expired = market_json("Will Bitcoin be above $95,000 in 5 minutes?");
    expired["endDate"] = util::format_timestamp(now_ - std::chrono::seconds(5));
    EXPECT_FALSE(PolymarketClient::parse_market(expired, "btcusdt", now_));
}

TEST(PolymarketSettlementTest, OpenMarketIsPending) {
    auto settlement = PolymarketClient::parse_settlement({{"closed", false}});
    EXPECT_EQ(settlement.status, SettlementStatus::Pending);
}

TEST(PolymarketSettlementTest, ReadsWinningOutcomeLabel) {
    auto settlement = PolymarketClient::parse_settlement({{"closed", true}, {"outcome", "No"}});
    EXPECT_EQ(settlement.status, SettlementStatus::Resolved);
    EXPECT_EQ(settlement.winner, MarketSide::No);
}

TEST(PolymarketSettlementTest, ReadsFinalOutcomePrices) {
    auto yes = PolymarketClient::parse_settlement({{"closed", true}, {"outcomePrices", "[\"1\", \"0\"]"}});
    EXPECT_EQ(yes.status, SettlementStatus::Resolved);
    EXPECT_EQ(yes.winner, MarketSide::Yes);

    auto split = PolymarketClient::parse_settlement({{"closed", true}, {"outcomePrices", {0.5, 0.5}}});
    EXPECT_EQ(split.status, SettlementStatus::Resolved);
    EXPECT_EQ(split.winner, MarketSide::Void);
}

TEST(PolymarketSettlementTest, ClosedWithoutWinnerStaysPending) {
    auto settlement = PolymarketClient::parse_settlement({{"closed", true}, {"outcomePrices", {0.7, 0.3}}});
    EXPECT_EQ(settlement.status, SettlementStatus::Pending);
}
