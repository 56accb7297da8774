#pragma once

#include "alert_sink.hpp"
#include "config.hpp"
#include "position_book.hpp"
#include "settlement_oracle.hpp"
#include "survival_brain.hpp"
#include "trade_executor.hpp"
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

class TradeStore;

struct BucketStats {
    int trades = 0;
    int wins = 0;
    double pnl = 0.0;

    nlohmann::json to_json() const;
};

// Aggregates over resolved paper trades
struct PaperStats {
    int total_trades = 0;
    int wins = 0;
    int losses = 0;
    int pushes = 0;
    double total_pnl = 0.0;
    double total_wagered = 0.0;
    double sum_wins = 0.0;
    double sum_losses = 0.0;
    double largest_win = 0.0;
    double largest_loss = 0.0;
    std::map<std::string, BucketStats> by_edge;
    std::map<int, BucketStats> by_hour;

    void record(const Trade& trade);

    double win_rate() const;
    double avg_win() const;
    double avg_loss() const;
    double roi_pct() const;
    std::string recommendation() const;

    nlohmann::json to_json() const;
};

// Paper execution path: fills at the quoted price, settles through a
// SettlementOracle and feeds every outcome to the shared SurvivalBrain.
class PaperTrader : public TradeExecutor {
public:
    PaperTrader(const Config& config,
                SettlementOracle& oracle,
                SurvivalBrain& brain,
                TradeStore* store,
                AlertSink* alerts,
                LatencySource feed_latency);

    SubmitResult submit(const EdgeSignal& signal, double size_fraction) override;
    std::vector<Trade> resolve_due(TimePoint now) override;
    std::vector<Trade> recover() override;

    int open_positions() const override;
    double available_capital() const override;
    std::string name() const override { return "paper"; }

    std::vector<Trade> pending() const;
    PaperStats stats() const;

    // Run summary: capital, stats and the survival journey
    nlohmann::json summary() const;

    // Persists the summary and sends it as a daily_summary alert
    bool write_summary(const std::string& run_id);

private:
    void notify(const std::string& category, const std::string& text, bool force = false);

    const Config& config_;
    SettlementOracle& oracle_;
    SurvivalBrain& brain_;
    TradeStore* store_;
    AlertSink* alerts_;
    LatencySource feed_latency_;

    PositionBook book_;
    TradeIdGenerator ids_;

    mutable std::mutex ledger_mutex_;
    double capital_;
    PaperStats stats_;

    std::mutex resolve_mutex_;
};
