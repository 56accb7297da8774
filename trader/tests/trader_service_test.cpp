#include "trader_service.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using testing_support::FakeVenue;
using testing_support::TempDatabase;
using testing_support::make_market;
using testing_support::make_tick;

class TraderServiceTest : public ::testing::Test {
protected:
    TraderServiceTest() {
        config_.db_path = db_.path();
        config_.settlement_oracle = "simulated";
        config_.health_port = 18090;
    }

    std::unique_ptr<TraderService> make_service(std::unique_ptr<TradeStore> store = nullptr) {
        auto venue = std::make_unique<FakeVenue>();
        venue_ = venue.get();
        if (!store) {
            store = std::make_unique<TradeStore>(config_);
        }
        return std::make_unique<TraderService>(config_, std::move(venue), std::move(store),
                                               [] { return std::optional<double>(20.0); });
    }

    static Trade losing_trade(int n, TimePoint at) {
        Trade trade;
        trade.id = "PAPER_20260101_000" + std::to_string(n);
        trade.market_id = "old-" + std::to_string(n);
        trade.entry_price = 0.5;
        trade.yes_price_at_entry = 0.5;
        trade.size = 5.0;
        trade.shares = 10.0;
        trade.opened_at = at;
        trade.expires_at = at + std::chrono::minutes(5);
        trade.status = TradeStatus::Resolved;
        trade.outcome = Outcome::Loss;
        trade.pnl = -5.0;
        trade.resolution_price = 0.0;
        trade.resolved_at = at + std::chrono::minutes(6 + n);
        return trade;
    }

    TempDatabase db_;
    Config config_;
    FakeVenue* venue_ = nullptr;
};

TEST_F(TraderServiceTest, TickWithEdgeOpensPaperTrade) {
    auto service = make_service();
    venue_->markets = {make_market("m1", 95000.0, 0.45), make_market("flat", 95000.0, 0.50)};

    service->process_tick(make_tick(95500.0));

    EXPECT_EQ(service->executor().open_positions(), 1);
    EXPECT_EQ(service->executor().name(), "paper");
    EXPECT_LT(service->executor().available_capital(), config_.initial_capital);
}

TEST_F(TraderServiceTest, StaleTickOpensNothing) {
    auto service = make_service();
    venue_->markets = {make_market("m1", 95000.0, 0.45)};

    auto tick = make_tick(95500.0);
    tick.stale = true;
    service->process_tick(tick);

    EXPECT_EQ(service->executor().open_positions(), 0);
}

TEST_F(TraderServiceTest, ResolveCycleSettlesExpiredTrades) {
    auto service = make_service();
    auto now = Clock::now();
    venue_->markets = {make_market("m1", 95000.0, 0.45, now, std::chrono::minutes(5))};
    service->process_tick(make_tick(95500.0));
    ASSERT_EQ(service->executor().open_positions(), 1);

    service->resolve_cycle(now + std::chrono::minutes(10));

    EXPECT_EQ(service->executor().open_positions(), 0);
    EXPECT_EQ(service->brain().snapshot().history.size(), 1u);
}

TEST_F(TraderServiceTest, StartupReplaysResolvedHistoryIntoBrain) {
    auto store = std::make_unique<TradeStore>(config_);
    auto base = Clock::now() - std::chrono::hours(2);
    for (int i = 1; i <= 4; ++i) {
        ASSERT_TRUE(store->record_resolution(losing_trade(i, base)));
    }

    auto service = make_service(std::move(store));
    service->startup();

    auto state = service->brain().snapshot();
    EXPECT_EQ(state.tier, Tier::Wounded);
    EXPECT_EQ(state.history.size(), 4u);
    EXPECT_EQ(service->summary()["stats"]["losses"].get<int>(), 4);
}

TEST_F(TraderServiceTest, StartupReportsPreviousRunSummary) {
    auto store = std::make_unique<TradeStore>(config_);
    ASSERT_TRUE(store->record_summary("run-1", {{"total_trades", 3}, {"net_pnl", -1.5}}));

    auto service = make_service(std::move(store));
    EXPECT_TRUE(service->status()["previous_run"].is_null());

    service->startup();
    auto previous = service->status()["previous_run"];
    ASSERT_TRUE(previous.is_object());
    EXPECT_EQ(previous["total_trades"].get<int>(), 3);
}

TEST_F(TraderServiceTest, RejectedLiveCredentialsAreFatal) {
    config_.mode = TradingMode::Live;
    config_.polymarket_api_key = "revoked";
    auto service = make_service();
    venue_->auth = AuthStatus::Unauthorized;

    EXPECT_THROW(service->startup(), std::runtime_error);
}

TEST_F(TraderServiceTest, AbortedRunLeavesNoRunState) {
    config_.mode = TradingMode::Live;
    config_.polymarket_api_key = "revoked";
    {
        auto service = make_service();
        venue_->auth = AuthStatus::Unauthorized;
        EXPECT_THROW(service->run(), std::runtime_error);
    }

    TradeStore store(config_);
    EXPECT_FALSE(store.latest_summary().has_value());
}

TEST_F(TraderServiceTest, StatusReportsComponents) {
    auto service = make_service();
    auto status = service->status();

    EXPECT_EQ(status["status"], "healthy");
    EXPECT_EQ(status["mode"], "paper");
    EXPECT_EQ(status["tier"], "HEALTHY");
    EXPECT_FALSE(status["components"]["price_feed"]["connected"].get<bool>());
}
