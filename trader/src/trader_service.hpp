#pragma once

#include "alert_sink.hpp"
#include "config.hpp"
#include "edge_detector.hpp"
#include "health.hpp"
#include "market_catalog.hpp"
#include "price_feed.hpp"
#include "settlement_oracle.hpp"
#include "survival_brain.hpp"
#include "tick_channel.hpp"
#include "trade_executor.hpp"
#include "trade_store.hpp"
#include "venue.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class PaperTrader;
class ExecutionEngine;

// Wires the feed, catalog, detector, brain and the configured execution
// path together. run() blocks on the decision loop until stop().
class TraderService {
public:
    explicit TraderService(const Config& config);

    // Injects the venue and the store; an empty source reads the price feed
    TraderService(const Config& config,
                  std::unique_ptr<Venue> venue,
                  std::unique_ptr<TradeStore> store,
                  LatencySource latency_source = {});

    ~TraderService();

    void run();

    // Safe to call from a signal handler context; run() does the teardown
    void stop();

    // Restores executor positions and brain history from the store.
    // Throws when live credentials are rejected.
    void startup();

    // One decision pass for a tick: scan, approve, submit
    void process_tick(const PriceTick& tick);

    // One resolver pass; also writes a summary when one is due
    void resolve_cycle(TimePoint now);

    nlohmann::json status() const;
    nlohmann::json summary() const;

    SurvivalBrain& brain() { return brain_; }
    TradeExecutor& executor() { return *executor_; }
    std::size_t ticks_dropped() const { return ticks_dropped_.load(); }

private:
    void decision_loop();
    void resolver_loop();
    void shutdown();
    void write_summary();
    void notify(const std::string& category, const std::string& text, bool force = false);
    std::optional<double> feed_latency() const;

    const Config& config_;
    std::string run_id_;

    std::unique_ptr<Venue> venue_;
    std::unique_ptr<TradeStore> store_;

    std::shared_ptr<AsyncAlertSink> async_alerts_;
    std::shared_ptr<ThrottledAlertSink> alerts_;

    SurvivalBrain brain_;
    CachedMarketCatalog catalog_;
    EdgeDetector detector_;
    PriceFeed feed_;
    TickChannel channel_;
    LatencySource latency_source_;

    std::unique_ptr<SettlementOracle> oracle_;
    std::unique_ptr<TradeExecutor> executor_;
    PaperTrader* paper_ = nullptr;
    ExecutionEngine* live_ = nullptr;

    std::unique_ptr<HealthServer> health_;

    // Last summary persisted by an earlier run; written once in startup()
    nlohmann::json previous_run_;

    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> shut_down_{false};
    std::atomic<std::size_t> ticks_dropped_{0};
    std::atomic<std::size_t> ticks_processed_{0};
    std::atomic<int> trades_opened_{0};

    std::mutex resolver_mutex_;
    std::condition_variable resolver_cv_;
    std::thread resolver_thread_;
    std::chrono::steady_clock::time_point last_summary_;
};
