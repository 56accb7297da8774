#include "execution_engine.hpp"
#include "trade_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <numeric>

namespace {
constexpr std::size_t kLatencyWindow = 100;
constexpr double kLimitSlippage = 0.01;
constexpr double kMaxLimitPrice = 0.99;
}

ExecutionEngine::ExecutionEngine(const Config& config,
                                 Venue& venue,
                                 SurvivalBrain& brain,
                                 TradeStore* store,
                                 AlertSink* alerts,
                                 LatencySource feed_latency)
    : config_(config),
      venue_(venue),
      brain_(brain),
      store_(store),
      alerts_(alerts),
      feed_latency_(std::move(feed_latency)),
      book_(config.max_concurrent_positions),
      ids_("LIVE", store),
      available_capital_(config.initial_capital) {}

SubmitResult ExecutionEngine::submit(const EdgeSignal& signal, double size_fraction) {
    auto decided_at = std::chrono::steady_clock::now();
    SubmitResult result;

    // Circuit breaker: no order on a slow or silent feed
    std::optional<double> latency;
    if (feed_latency_) {
        latency = feed_latency_();
    }
    if (!latency || *latency >= config_.max_latency_ms) {
        {
            std::lock_guard<std::mutex> lock(ledger_mutex_);
            breaker_trips_++;
        }
        result.status = SubmitStatus::LatencyBreach;
        result.cause = latency ? fmt::format("feed latency {:.0f}ms >= {}ms", *latency, config_.max_latency_ms)
                               : "no feed data";
        spdlog::info("Latency breaker tripped for {}: {}", signal.market_id, result.cause);
        return result;
    }

    if (size_fraction <= 0.0) {
        result.status = SubmitStatus::InvalidSize;
        result.cause = fmt::format("size fraction {:.4f} not positive", size_fraction);
        return result;
    }

    switch (book_.reserve(signal.market_id)) {
        case PositionBook::Reservation::DuplicateMarket:
            result.status = SubmitStatus::DuplicateMarket;
            result.cause = "position already open on " + signal.market_id;
            spdlog::debug("Rejected {}: {}", signal.market_id, result.cause);
            return result;
        case PositionBook::Reservation::ConcurrencyLimit:
            result.status = SubmitStatus::ConcurrencyLimit;
            result.cause = fmt::format("{} positions open", config_.max_concurrent_positions);
            spdlog::debug("Rejected {}: {}", signal.market_id, result.cause);
            return result;
        case PositionBook::Reservation::Reserved:
            break;
    }

    double size = 0.0;
    {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        size = size_fraction * available_capital_;
        if (size < config_.min_order_usd || size > available_capital_) {
            book_.release(signal.market_id);
            result.status = SubmitStatus::InvalidSize;
            result.cause = fmt::format("order size ${:.2f} outside [${:.2f}, ${:.2f}]",
                                       size, config_.min_order_usd, available_capital_);
            spdlog::debug("Rejected {}: {}", signal.market_id, result.cause);
            return result;
        }
        // Reserve the stake so concurrent submits see reduced capital
        available_capital_ -= size;
    }

    auto now = Clock::now();
    OrderRequest request;
    request.client_order_id = ids_.next(now);
    request.market_id = signal.market_id;
    request.direction = signal.direction;
    request.size_usd = size;
    request.limit_price = std::min(signal.entry_price() + kLimitSlippage, kMaxLimitPrice);

    OrderAck ack = venue_.submit_order(request);

    double execution_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - decided_at).count();
    record_execution_latency(execution_ms);
    if (execution_ms > config_.max_latency_ms) {
        spdlog::warn("Slow execution on {}: {:.1f}ms decision-to-ack (bound {}ms)",
                     signal.market_id, execution_ms, config_.max_latency_ms);
    }

    if (ack.status != OrderStatus::Accepted) {
        book_.release(signal.market_id);
        {
            std::lock_guard<std::mutex> lock(ledger_mutex_);
            available_capital_ += size;
        }
        result.status = ack.status == OrderStatus::Timeout ? SubmitStatus::VenueTimeout
                                                           : SubmitStatus::VenueRejected;
        result.cause = ack.cause;
        spdlog::error("Order {} on {} failed: status={} size=${:.2f} cause={}",
                      request.client_order_id, signal.market_id, to_string(ack.status), size, ack.cause);
        notify(alerts::kVenueError, fmt::format("Order on {} {} (${:.2f}): {}",
                                                signal.market_id, to_string(ack.status), size, ack.cause));
        return result;
    }

    Trade trade;
    trade.id = request.client_order_id;
    trade.market_id = signal.market_id;
    trade.direction = signal.direction;
    trade.entry_price = ack.fill_price > 0.0 ? ack.fill_price : signal.entry_price();
    trade.yes_price_at_entry = signal.yes_price;
    trade.size = size;
    trade.shares = size / trade.entry_price;
    trade.edge_pct = signal.edge_pct;
    trade.confidence = signal.confidence;
    trade.btc_price = signal.btc_price;
    trade.opened_at = now;
    trade.expires_at = signal.expires_at;
    trade.order_id = ack.order_id;
    trade.paper = false;

    book_.commit(trade);
    if (store_ && !store_->record_open(trade)) {
        spdlog::error("Failed to persist open position {}", trade.id);
    }

    spdlog::info("LIVE {} {} on {} @ {:.3f} size=${:.2f} edge={:+.2f}% exec={:.1f}ms order={}",
                 trade.id, to_string(trade.direction), trade.market_id, trade.entry_price,
                 trade.size, trade.edge_pct, execution_ms, trade.order_id);
    notify(alerts::kTradeOpen, fmt::format("LIVE {} {} ${:.2f} @ {:.3f} (edge {:+.2f}%)",
                                           trade.market_id, to_string(trade.direction),
                                           trade.size, trade.entry_price, trade.edge_pct));

    result.status = SubmitStatus::Filled;
    result.trade = trade;
    return result;
}

std::vector<Trade> ExecutionEngine::resolve_due(TimePoint now) {
    std::lock_guard<std::mutex> resolve_lock(resolve_mutex_);
    std::vector<Trade> resolved;

    for (const auto& trade : book_.due(now - std::chrono::seconds(config_.resolution_buffer_sec))) {
        auto settlement = venue_.query_settlement(trade.market_id);
        if (settlement.status == SettlementStatus::Pending) {
            spdlog::debug("Market {} for {} not yet resolved", trade.market_id, trade.id);
            continue;
        }
        if (settlement.status == SettlementStatus::Unavailable ||
            settlement.status == SettlementStatus::Unknown) {
            spdlog::warn("Settlement for {} {}, retrying next cycle: {}",
                         trade.market_id, to_string(settlement.status), settlement.detail);
            continue;
        }

        auto closed = book_.resolve(trade.id, settle_trade(trade, settlement.winner, now, "venue"));
        if (!closed) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(ledger_mutex_);
            available_capital_ += closed->size + *closed->pnl;
            realized_pnl_ += *closed->pnl;
        }

        if (store_ && !store_->record_resolution(*closed)) {
            spdlog::error("Failed to persist resolution of {}", closed->id);
        }

        if (*closed->outcome != Outcome::Push) {
            brain_.report_outcome(outcome_record(*closed));
        }

        spdlog::info("LIVE {} resolved {} pnl={:+.2f} (market {} settled {})",
                     closed->id, to_string(*closed->outcome), *closed->pnl,
                     closed->market_id, to_string(settlement.winner));
        notify(alerts::kTradeResolve, fmt::format("LIVE {} {} pnl ${:+.2f}",
                                                  closed->market_id, to_string(*closed->outcome), *closed->pnl));
        resolved.push_back(*closed);
    }

    return resolved;
}

std::vector<Trade> ExecutionEngine::recover() {
    if (!store_) {
        return {};
    }

    auto loaded = store_->load(false);
    {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        for (const auto& trade : loaded.resolved) {
            realized_pnl_ += trade.pnl.value_or(0.0);
        }
        available_capital_ = config_.initial_capital + realized_pnl_;
    }

    std::vector<Trade> restored;
    for (const auto& trade : loaded.pending) {
        if (book_.adopt(trade)) {
            std::lock_guard<std::mutex> lock(ledger_mutex_);
            available_capital_ -= trade.size;
            restored.push_back(trade);
        }
    }

    spdlog::info("Live engine recovered {} open positions, capital ${:.2f}",
                 restored.size(), available_capital());
    return loaded.resolved;
}

int ExecutionEngine::open_positions() const {
    return book_.open_count();
}

double ExecutionEngine::available_capital() const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    return available_capital_;
}

std::vector<Trade> ExecutionEngine::pending() const {
    return book_.pending();
}

double ExecutionEngine::avg_execution_ms() const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    if (execution_latencies_.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(execution_latencies_.begin(), execution_latencies_.end(), 0.0);
    return sum / static_cast<double>(execution_latencies_.size());
}

int ExecutionEngine::breaker_trips() const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    return breaker_trips_;
}

void ExecutionEngine::record_execution_latency(double ms) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    execution_latencies_.push_back(ms);
    while (execution_latencies_.size() > kLatencyWindow) {
        execution_latencies_.pop_front();
    }
}

void ExecutionEngine::notify(const std::string& category, const std::string& text, bool force) {
    if (alerts_) {
        Alert alert;
        alert.category = category;
        alert.text = text;
        alert.force = force;
        alerts_->send(alert);
    }
}
