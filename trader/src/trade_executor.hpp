#pragma once

#include "types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class TradeStore;

enum class SubmitStatus {
    Filled,
    LatencyBreach,
    DuplicateMarket,
    ConcurrencyLimit,
    InvalidSize,
    VenueRejected,
    VenueTimeout
};

std::string to_string(SubmitStatus status);

struct SubmitResult {
    SubmitStatus status = SubmitStatus::InvalidSize;
    std::optional<Trade> trade;
    std::string cause;

    bool filled() const { return status == SubmitStatus::Filled; }
};

// Current feed latency in ms; nullopt before the first tick
using LatencySource = std::function<std::optional<double>()>;

// Common contract of the live and paper execution paths
class TradeExecutor {
public:
    virtual ~TradeExecutor() = default;

    virtual SubmitResult submit(const EdgeSignal& signal, double size_fraction) = 0;

    // Resolves every PENDING trade whose market has settled; returns the newly resolved ones
    virtual std::vector<Trade> resolve_due(TimePoint now) = 0;

    // Reloads PENDING trades and resolved history from the store
    virtual std::vector<Trade> recover() = 0;

    virtual int open_positions() const = 0;
    virtual double available_capital() const = 0;
    virtual std::string name() const = 0;
};

// Fills in outcome, resolution price and pnl for a settled trade.
// A void market is a PUSH: the stake comes back and pnl is zero.
Trade settle_trade(const Trade& trade, MarketSide winner, TimePoint now, const std::string& source);

// "<PREFIX>_YYYYMMDD_NNNN", numbering continues across restarts
class TradeIdGenerator {
public:
    TradeIdGenerator(std::string prefix, TradeStore* store);

    std::string next(TimePoint now);

private:
    std::string prefix_;
    TradeStore* store_;
    std::mutex mutex_;
    std::string current_date_;
    int counter_ = 0;
};
