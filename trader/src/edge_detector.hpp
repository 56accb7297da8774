#pragma once

#include "config.hpp"
#include "types.hpp"
#include <optional>
#include <vector>

// Scores (tick, market) pairs into signed edge signals.
// Stateless apart from configuration; safe to call from any thread.
class EdgeDetector {
public:
    explicit EdgeDetector(const Config& config);

    // nullopt for stale ticks, zero baselines, expired markets and sub-threshold edges
    std::optional<EdgeSignal> evaluate(const PriceTick& tick,
                                       const MarketDescriptor& market,
                                       double edge_threshold,
                                       TimePoint now) const;

    // All signals for the market set, strongest first
    std::vector<EdgeSignal> scan(const PriceTick& tick,
                                 const std::vector<MarketDescriptor>& markets,
                                 double edge_threshold,
                                 TimePoint now) const;

    // (price - baseline) / baseline in percent
    static double real_move_pct(double price, double baseline_price);

    // Linear mapping of the YES price's distance from 0.5
    double implied_move_pct(double yes_price) const;

    // In [0, 1]; grows with |edge| and with tick freshness
    double confidence(double edge_pct, double latency_ms) const;

private:
    const Config& config_;
};
