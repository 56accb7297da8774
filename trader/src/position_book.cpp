#include "position_book.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

PositionBook::PositionBook(int max_open) : max_open_(max_open) {}

PositionBook::Reservation PositionBook::reserve(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (reserved_markets_.count(market_id) > 0 || market_to_trade_.count(market_id) > 0) {
        return Reservation::DuplicateMarket;
    }

    int in_use = static_cast<int>(open_by_id_.size() + reserved_markets_.size());
    if (in_use >= max_open_) {
        return Reservation::ConcurrencyLimit;
    }

    reserved_markets_.insert(market_id);
    return Reservation::Reserved;
}

void PositionBook::release(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_markets_.erase(market_id);
}

void PositionBook::commit(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_markets_.erase(trade.market_id);
    open_by_id_[trade.id] = trade;
    market_to_trade_[trade.market_id] = trade.id;
}

bool PositionBook::adopt(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!trade.is_open() || open_by_id_.count(trade.id) > 0 || market_to_trade_.count(trade.market_id) > 0) {
        spdlog::warn("Not restoring trade {} on {}: already tracked or not pending", trade.id, trade.market_id);
        return false;
    }
    open_by_id_[trade.id] = trade;
    market_to_trade_[trade.market_id] = trade.id;
    return true;
}

std::optional<Trade> PositionBook::resolve(const std::string& trade_id, const Trade& resolved) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = open_by_id_.find(trade_id);
    if (it == open_by_id_.end()) {
        return std::nullopt;
    }

    Trade closed = resolved;
    closed.status = TradeStatus::Resolved;
    market_to_trade_.erase(it->second.market_id);
    open_by_id_.erase(it);
    return closed;
}

std::vector<Trade> PositionBook::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Trade> trades;
    trades.reserve(open_by_id_.size());
    for (const auto& [id, trade] : open_by_id_) {
        trades.push_back(trade);
    }
    std::sort(trades.begin(), trades.end(),
              [](const Trade& a, const Trade& b) { return a.opened_at < b.opened_at; });
    return trades;
}

std::vector<Trade> PositionBook::due(TimePoint cutoff) const {
    auto trades = pending();
    trades.erase(std::remove_if(trades.begin(), trades.end(),
                                [cutoff](const Trade& t) { return t.expires_at > cutoff; }),
                 trades.end());
    return trades;
}

int PositionBook::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(open_by_id_.size());
}
