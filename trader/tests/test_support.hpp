#pragma once

#include "config.hpp"
#include "types.hpp"
#include "venue.hpp"
#include <atomic>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>
#include <unistd.h>
#include <vector>

namespace testing_support {

// Scriptable in-memory venue
class FakeVenue : public Venue {
public:
    std::optional<std::vector<MarketDescriptor>> list_active_markets(const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        listings++;
        if (listing_fails) {
            return std::nullopt;
        }
        return markets;
    }

    OrderAck submit_order(const OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        orders.push_back(request);
        OrderAck ack = next_ack;
        if (ack.status == OrderStatus::Accepted && ack.order_id.empty()) {
            ack.order_id = "ORD-" + std::to_string(orders.size());
        }
        return ack;
    }

    Settlement query_settlement(const std::string& market_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        settlement_queries++;
        auto it = settlements.find(market_id);
        return it != settlements.end() ? it->second : default_settlement;
    }

    AuthStatus check_credentials() override {
        return auth;
    }

    void settle(const std::string& market_id, MarketSide winner) {
        std::lock_guard<std::mutex> lock(mutex_);
        settlements[market_id] = Settlement{SettlementStatus::Resolved, winner, ""};
    }

    std::size_t order_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders.size();
    }

    std::vector<MarketDescriptor> markets;
    bool listing_fails = false;
    OrderAck next_ack{OrderStatus::Accepted, "", 0.0, ""};
    std::map<std::string, Settlement> settlements;
    Settlement default_settlement{SettlementStatus::Pending, MarketSide::Void, "open"};
    AuthStatus auth = AuthStatus::Ok;

    std::vector<OrderRequest> orders;
    int listings = 0;
    int settlement_queries = 0;

private:
    std::mutex mutex_;
};

inline MarketDescriptor make_market(const std::string& id, double baseline, double yes_price,
                                    TimePoint now = Clock::now(),
                                    std::chrono::seconds ttl = std::chrono::minutes(15)) {
    MarketDescriptor market;
    market.market_id = id;
    market.question = "Will BTC be above $" + std::to_string(static_cast<int>(baseline)) + " in 15 minutes?";
    market.baseline_price = baseline;
    market.yes_price = yes_price;
    market.created_at = now - std::chrono::minutes(1);
    market.expires_at = now + ttl;
    return market;
}

inline PriceTick make_tick(double price, double latency_ms = 20.0, TimePoint receipt = Clock::now()) {
    PriceTick tick;
    tick.price = price;
    tick.receipt_time = receipt;
    tick.source_time = receipt - std::chrono::microseconds(static_cast<int64_t>(latency_ms * 1000.0));
    tick.stale = false;
    return tick;
}

inline EdgeSignal make_signal(const std::string& market_id, double edge_pct, double yes_price = 0.45,
                              double confidence = 0.8, TimePoint expires_at = Clock::now() + std::chrono::minutes(15)) {
    EdgeSignal signal;
    signal.market_id = market_id;
    signal.direction = edge_pct > 0.0 ? Direction::Yes : Direction::No;
    signal.edge_pct = edge_pct;
    signal.confidence = confidence;
    signal.btc_price = 95500.0;
    signal.yes_price = yes_price;
    signal.expires_at = expires_at;
    signal.observed_at = Clock::now();
    return signal;
}

// Unique sqlite path removed on destruction, WAL side files included
class TempDatabase {
public:
    TempDatabase() {
        static std::atomic<int> counter{0};
        path_ = "/tmp/speedscout_test_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter++) + ".db";
        remove_files();
    }

    ~TempDatabase() {
        remove_files();
    }

    const std::string& path() const { return path_; }

private:
    void remove_files() {
        std::remove(path_.c_str());
        std::remove((path_ + "-wal").c_str());
        std::remove((path_ + "-shm").c_str());
    }

    std::string path_;
};

}
