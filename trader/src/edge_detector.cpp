#include "edge_detector.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

EdgeDetector::EdgeDetector(const Config& config) : config_(config) {}

std::optional<EdgeSignal> EdgeDetector::evaluate(const PriceTick& tick,
                                                 const MarketDescriptor& market,
                                                 double edge_threshold,
                                                 TimePoint now) const {
    if (tick.stale) {
        return std::nullopt;
    }

    if (market.baseline_price == 0.0 || market.is_expired(now)) {
        return std::nullopt;
    }

    double real = real_move_pct(tick.price, market.baseline_price);
    double implied = implied_move_pct(market.yes_price);
    double edge = real - implied;

    if (std::fabs(edge) < edge_threshold) {
        spdlog::trace("Edge {:.3f}% on {} below threshold {:.2f}%", edge, market.market_id, edge_threshold);
        return std::nullopt;
    }

    EdgeSignal signal;
    signal.market_id = market.market_id;
    signal.direction = edge > 0.0 ? Direction::Yes : Direction::No;
    signal.edge_pct = edge;
    signal.real_move_pct = real;
    signal.implied_move_pct = implied;
    signal.confidence = confidence(edge, tick.latency_ms());
    signal.btc_price = tick.price;
    signal.yes_price = market.yes_price;
    signal.expires_at = market.expires_at;
    signal.observed_at = now;

    spdlog::debug("Edge detected on {}: {} edge={:.3f}% real={:.3f}% implied={:.3f}% conf={:.2f}",
                  market.market_id, to_string(signal.direction), edge, real, implied, signal.confidence);
    return signal;
}

std::vector<EdgeSignal> EdgeDetector::scan(const PriceTick& tick,
                                           const std::vector<MarketDescriptor>& markets,
                                           double edge_threshold,
                                           TimePoint now) const {
    std::vector<EdgeSignal> signals;
    for (const auto& market : markets) {
        auto signal = evaluate(tick, market, edge_threshold, now);
        if (signal) {
            signals.push_back(*signal);
        }
    }

    std::sort(signals.begin(), signals.end(), [](const EdgeSignal& a, const EdgeSignal& b) {
        return a.magnitude() * a.confidence > b.magnitude() * b.confidence;
    });
    return signals;
}

double EdgeDetector::real_move_pct(double price, double baseline_price) {
    return (price - baseline_price) / baseline_price * 100.0;
}

double EdgeDetector::implied_move_pct(double yes_price) const {
    return (yes_price - 0.5) * config_.implied_scale;
}

double EdgeDetector::confidence(double edge_pct, double latency_ms) const {
    double strength = std::clamp(std::fabs(edge_pct) / config_.confidence_edge_scale, 0.0, 1.0);
    double freshness = std::clamp(1.0 - std::max(latency_ms, 0.0) / config_.stale_tick_ms, 0.0, 1.0);
    return strength * freshness;
}
