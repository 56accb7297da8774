#include "market_catalog.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

CachedMarketCatalog::CachedMarketCatalog(const Config& config, Venue& venue)
    : config_(config), venue_(venue) {}

std::vector<MarketDescriptor> CachedMarketCatalog::active_markets() {
    auto now_steady = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fetched_at_ && now_steady - *fetched_at_ < std::chrono::seconds(config_.market_cache_ttl_sec)) {
            return unexpired(Clock::now());
        }
    }

    // Fetch outside the lock so readers of the cached snapshot are not held up
    auto fresh = venue_.list_active_markets(config_.symbol);

    std::lock_guard<std::mutex> lock(mutex_);
    fetched_at_ = now_steady;
    if (!fresh) {
        if (!last_refresh_failed_) {
            spdlog::warn("Market refresh failed, serving {} cached markets", cached_.size());
        }
        last_refresh_failed_ = true;
        return unexpired(Clock::now());
    }

    if (last_refresh_failed_) {
        spdlog::info("Market refresh recovered");
    }
    last_refresh_failed_ = false;
    cached_ = std::move(*fresh);
    spdlog::debug("Market cache refreshed: {} markets", cached_.size());
    return unexpired(Clock::now());
}

bool CachedMarketCatalog::last_refresh_failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_refresh_failed_;
}

std::vector<MarketDescriptor> CachedMarketCatalog::unexpired(TimePoint now) const {
    std::vector<MarketDescriptor> result;
    std::copy_if(cached_.begin(), cached_.end(), std::back_inserter(result),
                 [now](const MarketDescriptor& m) { return !m.is_expired(now); });
    return result;
}
