#pragma once

#include "config.hpp"
#include "types.hpp"
#include "venue.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct SettledOutcome {
    MarketSide winner = MarketSide::Void;
    std::string source;
};

// Decides how an expired trade's market settled.
// nullopt means "not known yet, ask again next cycle".
class SettlementOracle {
public:
    virtual ~SettlementOracle() = default;

    virtual std::optional<SettledOutcome> settle(const Trade& trade, TimePoint now) = 0;
    virtual std::string name() const = 0;
};

// Venue-reported settlement only
class VenueSettlementOracle : public SettlementOracle {
public:
    explicit VenueSettlementOracle(Venue& venue);

    std::optional<SettledOutcome> settle(const Trade& trade, TimePoint now) override;
    std::string name() const override { return "venue"; }

private:
    Venue& venue_;
};

// YES wins with probability equal to the YES price at entry.
// The draw depends only on (seed, trade id), so a restarted run
// settles the same trade the same way.
class SimulatedSettlementOracle : public SettlementOracle {
public:
    explicit SimulatedSettlementOracle(uint64_t seed);

    std::optional<SettledOutcome> settle(const Trade& trade, TimePoint now) override;
    std::string name() const override { return "simulated"; }

    // Uniform draw in [0, 1) for a trade id
    double draw(const std::string& trade_id) const;

private:
    uint64_t seed_;
};

// Venue outcome when available. Simulated when the venue does not list the
// market, or has not produced an outcome within the grace period after
// expiry; transient venue errors inside the grace period just wait.
class FallbackSettlementOracle : public SettlementOracle {
public:
    FallbackSettlementOracle(Venue& venue, uint64_t seed, std::chrono::seconds grace);

    std::optional<SettledOutcome> settle(const Trade& trade, TimePoint now) override;
    std::string name() const override { return "fallback"; }

private:
    Venue& venue_;
    SimulatedSettlementOracle simulated_;
    std::chrono::seconds grace_;
};

// Builds the oracle named by config.settlement_oracle
std::unique_ptr<SettlementOracle> make_settlement_oracle(const Config& config, Venue& venue);
