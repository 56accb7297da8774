#pragma once

#include "alert_sink.hpp"
#include "config.hpp"
#include "position_book.hpp"
#include "survival_brain.hpp"
#include "trade_executor.hpp"
#include "venue.hpp"
#include <deque>
#include <mutex>

class TradeStore;

// Live execution path: latency circuit breaker, venue orders,
// position bookkeeping and venue-settled resolution.
class ExecutionEngine : public TradeExecutor {
public:
    ExecutionEngine(const Config& config,
                    Venue& venue,
                    SurvivalBrain& brain,
                    TradeStore* store,
                    AlertSink* alerts,
                    LatencySource feed_latency);

    SubmitResult submit(const EdgeSignal& signal, double size_fraction) override;
    std::vector<Trade> resolve_due(TimePoint now) override;
    std::vector<Trade> recover() override;

    int open_positions() const override;
    double available_capital() const override;
    std::string name() const override { return "live"; }

    std::vector<Trade> pending() const;

    // Mean decision-to-acknowledgement latency over the last 100 orders
    double avg_execution_ms() const;
    int breaker_trips() const;

private:
    void record_execution_latency(double ms);
    void notify(const std::string& category, const std::string& text, bool force = false);

    const Config& config_;
    Venue& venue_;
    SurvivalBrain& brain_;
    TradeStore* store_;
    AlertSink* alerts_;
    LatencySource feed_latency_;

    PositionBook book_;
    TradeIdGenerator ids_;

    mutable std::mutex ledger_mutex_;
    double available_capital_;
    double realized_pnl_ = 0.0;
    std::deque<double> execution_latencies_;
    int breaker_trips_ = 0;

    std::mutex resolve_mutex_;
};
