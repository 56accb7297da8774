#pragma once

#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Open-position set for one execution path. A market is first reserved
// (check and claim in one step), then either committed as a PENDING trade
// or released when the order does not go through.
class PositionBook {
public:
    enum class Reservation { Reserved, DuplicateMarket, ConcurrencyLimit };

    explicit PositionBook(int max_open);

    Reservation reserve(const std::string& market_id);
    void release(const std::string& market_id);
    void commit(const Trade& trade);

    // Restores a PENDING trade loaded from the store
    bool adopt(const Trade& trade);

    // Marks the trade resolved; nullopt if unknown or already resolved
    std::optional<Trade> resolve(const std::string& trade_id, const Trade& resolved);

    std::vector<Trade> pending() const;
    std::vector<Trade> due(TimePoint cutoff) const;
    int open_count() const;

private:
    const int max_open_;
    mutable std::mutex mutex_;
    std::unordered_set<std::string> reserved_markets_;
    std::unordered_map<std::string, Trade> open_by_id_;
    std::unordered_map<std::string, std::string> market_to_trade_;
};
