#include "settlement_oracle.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <random>
#include <stdexcept>

VenueSettlementOracle::VenueSettlementOracle(Venue& venue) : venue_(venue) {}

std::optional<SettledOutcome> VenueSettlementOracle::settle(const Trade& trade, TimePoint) {
    auto settlement = venue_.query_settlement(trade.market_id);
    if (settlement.status == SettlementStatus::Resolved) {
        return SettledOutcome{settlement.winner, "venue"};
    }

    if (settlement.status == SettlementStatus::Unavailable ||
        settlement.status == SettlementStatus::Unknown) {
        spdlog::warn("Settlement for {} {}: {}", trade.market_id, to_string(settlement.status),
                     settlement.detail);
    } else {
        spdlog::debug("Market {} not yet resolved", trade.market_id);
    }
    return std::nullopt;
}

SimulatedSettlementOracle::SimulatedSettlementOracle(uint64_t seed) : seed_(seed) {}

std::optional<SettledOutcome> SimulatedSettlementOracle::settle(const Trade& trade, TimePoint) {
    double roll = draw(trade.id);
    MarketSide winner = roll < trade.yes_price_at_entry ? MarketSide::Yes : MarketSide::No;
    spdlog::debug("Simulated settlement for {}: roll={:.4f} p(yes)={:.4f} -> {}",
                  trade.id, roll, trade.yes_price_at_entry, to_string(winner));
    return SettledOutcome{winner, "simulated"};
}

double SimulatedSettlementOracle::draw(const std::string& trade_id) const {
    std::mt19937_64 rng(seed_ ^ util::stable_hash(trade_id));
    // Top 53 bits as a double; identical on every standard library
    return static_cast<double>(rng() >> 11) * (1.0 / 9007199254740992.0);
}

FallbackSettlementOracle::FallbackSettlementOracle(Venue& venue, uint64_t seed, std::chrono::seconds grace)
    : venue_(venue), simulated_(seed), grace_(grace) {}

std::optional<SettledOutcome> FallbackSettlementOracle::settle(const Trade& trade, TimePoint now) {
    auto settlement = venue_.query_settlement(trade.market_id);

    switch (settlement.status) {
        case SettlementStatus::Resolved:
            return SettledOutcome{settlement.winner, "venue"};
        case SettlementStatus::Unknown:
            spdlog::info("Venue does not list market {}, simulating", trade.market_id);
            return simulated_.settle(trade, now);
        case SettlementStatus::Unavailable:
        case SettlementStatus::Pending:
            if (now >= trade.expires_at + grace_) {
                spdlog::info("Market {} still {} {}s after expiry, simulating",
                             trade.market_id, to_string(settlement.status), grace_.count());
                return simulated_.settle(trade, now);
            }
            if (settlement.status == SettlementStatus::Unavailable) {
                spdlog::debug("Venue settlement for {} unavailable ({}), retrying next cycle",
                              trade.market_id, settlement.detail);
            }
            return std::nullopt;
    }
    return std::nullopt;
}

std::unique_ptr<SettlementOracle> make_settlement_oracle(const Config& config, Venue& venue) {
    if (config.settlement_oracle == "venue") {
        return std::make_unique<VenueSettlementOracle>(venue);
    }
    if (config.settlement_oracle == "simulated") {
        return std::make_unique<SimulatedSettlementOracle>(config.simulation_seed);
    }
    if (config.settlement_oracle == "fallback") {
        return std::make_unique<FallbackSettlementOracle>(
            venue, config.simulation_seed, std::chrono::seconds(config.settlement_grace_sec));
    }
    throw std::runtime_error("Unknown settlement oracle: " + config.settlement_oracle);
}
