#include "trade_executor.hpp"
#include "trade_store.hpp"
#include "util.hpp"
#include <fmt/format.h>

std::string to_string(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::Filled: return "filled";
        case SubmitStatus::LatencyBreach: return "latency_breach";
        case SubmitStatus::DuplicateMarket: return "duplicate_market";
        case SubmitStatus::ConcurrencyLimit: return "concurrency_limit";
        case SubmitStatus::InvalidSize: return "invalid_size";
        case SubmitStatus::VenueRejected: return "venue_rejected";
        case SubmitStatus::VenueTimeout: return "venue_timeout";
    }
    return "unknown";
}

Trade settle_trade(const Trade& trade, MarketSide winner, TimePoint now, const std::string& source) {
    Trade settled = trade;
    settled.status = TradeStatus::Resolved;
    settled.resolved_at = now;
    settled.settlement_source = source;

    if (winner == MarketSide::Void) {
        settled.outcome = Outcome::Push;
        settled.resolution_price = trade.entry_price;
        settled.pnl = 0.0;
        return settled;
    }

    bool won = (winner == MarketSide::Yes) == (trade.direction == Direction::Yes);
    double payout = won ? 1.0 : 0.0;
    settled.outcome = won ? Outcome::Win : Outcome::Loss;
    settled.resolution_price = payout;
    settled.pnl = (payout - trade.entry_price) * trade.shares;
    return settled;
}

TradeIdGenerator::TradeIdGenerator(std::string prefix, TradeStore* store)
    : prefix_(std::move(prefix)), store_(store) {}

std::string TradeIdGenerator::next(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string date = util::format_compact_date(now);
    if (date != current_date_) {
        current_date_ = date;
        counter_ = store_ ? store_->highest_trade_sequence(prefix_ + "_" + date + "_") : 0;
    }

    counter_++;
    return fmt::format("{}_{}_{:04d}", prefix_, date, counter_);
}
