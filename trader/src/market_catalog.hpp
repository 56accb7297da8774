#pragma once

#include "config.hpp"
#include "types.hpp"
#include "venue.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Source of active market descriptors
class MarketCatalog {
public:
    virtual ~MarketCatalog() = default;

    virtual std::vector<MarketDescriptor> active_markets() = 0;
};

// Venue listing behind a TTL cache. A failed refresh keeps serving the
// previous snapshot (expired markets filtered out) instead of going empty.
class CachedMarketCatalog : public MarketCatalog {
public:
    CachedMarketCatalog(const Config& config, Venue& venue);

    std::vector<MarketDescriptor> active_markets() override;

    bool last_refresh_failed() const;

private:
    std::vector<MarketDescriptor> unexpired(TimePoint now) const;

    const Config& config_;
    Venue& venue_;

    mutable std::mutex mutex_;
    std::vector<MarketDescriptor> cached_;
    std::optional<std::chrono::steady_clock::time_point> fetched_at_;
    bool last_refresh_failed_ = false;
};
