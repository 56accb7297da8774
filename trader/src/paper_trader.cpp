#include "paper_trader.hpp"
#include "trade_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace {
constexpr int kMinTradesForVerdict = 20;
}

nlohmann::json BucketStats::to_json() const {
    return {
        {"trades", trades},
        {"wins", wins},
        {"win_rate", trades > 0 ? static_cast<double>(wins) / trades : 0.0},
        {"pnl", pnl}
    };
}

void PaperStats::record(const Trade& trade) {
    if (!trade.outcome || !trade.pnl) {
        return;
    }

    double pnl = *trade.pnl;
    total_trades++;
    total_pnl += pnl;
    total_wagered += trade.size;

    switch (*trade.outcome) {
        case Outcome::Win:
            wins++;
            sum_wins += pnl;
            largest_win = std::max(largest_win, pnl);
            break;
        case Outcome::Loss:
            losses++;
            sum_losses += pnl;
            largest_loss = std::min(largest_loss, pnl);
            break;
        case Outcome::Push:
            pushes++;
            break;
    }

    bool won = *trade.outcome == Outcome::Win;

    auto& edge = by_edge[edge_bucket(trade.edge_pct)];
    edge.trades++;
    edge.wins += won ? 1 : 0;
    edge.pnl += pnl;

    auto& hour = by_hour[util::utc_hour(trade.opened_at)];
    hour.trades++;
    hour.wins += won ? 1 : 0;
    hour.pnl += pnl;
}

double PaperStats::win_rate() const {
    int decided = wins + losses;
    return decided > 0 ? static_cast<double>(wins) / decided : 0.0;
}

double PaperStats::avg_win() const {
    return wins > 0 ? sum_wins / wins : 0.0;
}

double PaperStats::avg_loss() const {
    return losses > 0 ? sum_losses / losses : 0.0;
}

double PaperStats::roi_pct() const {
    return total_wagered > 0.0 ? total_pnl / total_wagered * 100.0 : 0.0;
}

std::string PaperStats::recommendation() const {
    if (total_trades < kMinTradesForVerdict) {
        return fmt::format("insufficient data: {}/{} trades", total_trades, kMinTradesForVerdict);
    }
    if (win_rate() >= 0.6 && total_pnl > 0.0) {
        return "ready for live trading";
    }
    if (win_rate() >= 0.5) {
        return "promising, continue paper trading";
    }
    return "strategy needs refinement";
}

nlohmann::json PaperStats::to_json() const {
    nlohmann::json edges = nlohmann::json::object();
    for (const auto& [bucket, stats] : by_edge) {
        edges[bucket] = stats.to_json();
    }

    nlohmann::json hours = nlohmann::json::object();
    for (const auto& [hour, stats] : by_hour) {
        hours[fmt::format("{:02d}", hour)] = stats.to_json();
    }

    return {
        {"total_trades", total_trades},
        {"wins", wins},
        {"losses", losses},
        {"pushes", pushes},
        {"win_rate", win_rate()},
        {"total_pnl", total_pnl},
        {"total_wagered", total_wagered},
        {"roi_pct", roi_pct()},
        {"avg_win", avg_win()},
        {"avg_loss", avg_loss()},
        {"largest_win", largest_win},
        {"largest_loss", largest_loss},
        {"by_edge", edges},
        {"by_hour", hours}
    };
}

PaperTrader::PaperTrader(const Config& config,
                         SettlementOracle& oracle,
                         SurvivalBrain& brain,
                         TradeStore* store,
                         AlertSink* alerts,
                         LatencySource feed_latency)
    : config_(config),
      oracle_(oracle),
      brain_(brain),
      store_(store),
      alerts_(alerts),
      feed_latency_(std::move(feed_latency)),
      book_(config.max_concurrent_positions),
      ids_("PAPER", store),
      capital_(config.initial_capital) {}

SubmitResult PaperTrader::submit(const EdgeSignal& signal, double size_fraction) {
    SubmitResult result;

    std::optional<double> latency;
    if (feed_latency_) {
        latency = feed_latency_();
    }
    if (!latency || *latency >= config_.max_latency_ms) {
        result.status = SubmitStatus::LatencyBreach;
        result.cause = latency ? fmt::format("feed latency {:.0f}ms >= {}ms", *latency, config_.max_latency_ms)
                               : "no feed data";
        spdlog::debug("Paper latency breaker for {}: {}", signal.market_id, result.cause);
        return result;
    }

    double entry_price = signal.entry_price();
    if (size_fraction <= 0.0 || entry_price <= 0.0 || entry_price >= 1.0) {
        result.status = SubmitStatus::InvalidSize;
        result.cause = fmt::format("size fraction {:.4f} at entry {:.3f}", size_fraction, entry_price);
        return result;
    }

    switch (book_.reserve(signal.market_id)) {
        case PositionBook::Reservation::DuplicateMarket:
            result.status = SubmitStatus::DuplicateMarket;
            result.cause = "paper trade already open on " + signal.market_id;
            spdlog::debug("Rejected {}: {}", signal.market_id, result.cause);
            return result;
        case PositionBook::Reservation::ConcurrencyLimit:
            result.status = SubmitStatus::ConcurrencyLimit;
            result.cause = fmt::format("{} paper trades open", config_.max_concurrent_positions);
            spdlog::debug("Rejected {}: {}", signal.market_id, result.cause);
            return result;
        case PositionBook::Reservation::Reserved:
            break;
    }

    double size = 0.0;
    {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        size = size_fraction * capital_;
        if (size < config_.min_order_usd || size > capital_) {
            book_.release(signal.market_id);
            result.status = SubmitStatus::InvalidSize;
            result.cause = fmt::format("paper size ${:.2f} outside [${:.2f}, ${:.2f}]",
                                       size, config_.min_order_usd, capital_);
            spdlog::debug("Rejected {}: {}", signal.market_id, result.cause);
            return result;
        }
        capital_ -= size;
    }

    auto now = Clock::now();
    Trade trade;
    trade.id = ids_.next(now);
    trade.market_id = signal.market_id;
    trade.direction = signal.direction;
    trade.entry_price = entry_price;
    trade.yes_price_at_entry = signal.yes_price;
    trade.size = size;
    trade.shares = size / entry_price;
    trade.edge_pct = signal.edge_pct;
    trade.confidence = signal.confidence;
    trade.btc_price = signal.btc_price;
    trade.opened_at = now;
    trade.expires_at = signal.expires_at;
    trade.paper = true;

    book_.commit(trade);
    if (store_ && !store_->record_open(trade)) {
        spdlog::error("Failed to persist paper trade {}", trade.id);
    }

    spdlog::info("PAPER {} {} on {} @ {:.3f} size=${:.2f} shares={:.2f} edge={:+.2f}% conf={:.2f}",
                 trade.id, to_string(trade.direction), trade.market_id, trade.entry_price,
                 trade.size, trade.shares, trade.edge_pct, trade.confidence);
    notify(alerts::kTradeOpen, fmt::format("PAPER {} {} ${:.2f} @ {:.3f} (edge {:+.2f}%, BTC ${:.2f})",
                                           trade.market_id, to_string(trade.direction), trade.size,
                                           trade.entry_price, trade.edge_pct, trade.btc_price));

    result.status = SubmitStatus::Filled;
    result.trade = trade;
    return result;
}

std::vector<Trade> PaperTrader::resolve_due(TimePoint now) {
    std::lock_guard<std::mutex> resolve_lock(resolve_mutex_);
    std::vector<Trade> resolved;

    for (const auto& trade : book_.due(now - std::chrono::seconds(config_.resolution_buffer_sec))) {
        std::optional<SettledOutcome> settled;
        try {
            settled = oracle_.settle(trade, now);
        } catch (const std::exception& e) {
            spdlog::warn("Settlement oracle {} failed for {}: {}", oracle_.name(), trade.id, e.what());
            continue;
        }
        if (!settled) {
            continue;
        }

        auto closed = book_.resolve(trade.id, settle_trade(trade, settled->winner, now, settled->source));
        if (!closed) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(ledger_mutex_);
            capital_ += closed->size + *closed->pnl;
            stats_.record(*closed);
        }

        if (store_ && !store_->record_resolution(*closed)) {
            spdlog::error("Failed to persist resolution of {}", closed->id);
        }

        if (*closed->outcome != Outcome::Push) {
            brain_.report_outcome(outcome_record(*closed));
        }

        spdlog::info("PAPER {} resolved {} via {}: pnl={:+.2f} capital=${:.2f}",
                     closed->id, to_string(*closed->outcome), settled->source,
                     *closed->pnl, available_capital());
        notify(alerts::kTradeResolve, fmt::format("PAPER {} {} pnl ${:+.2f} ({} settlement)",
                                                  closed->market_id, to_string(*closed->outcome),
                                                  *closed->pnl, settled->source));
        resolved.push_back(*closed);
    }

    return resolved;
}

std::vector<Trade> PaperTrader::recover() {
    if (!store_) {
        return {};
    }

    auto loaded = store_->load(true);
    {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        capital_ = config_.initial_capital;
        stats_ = PaperStats{};
        for (const auto& trade : loaded.resolved) {
            capital_ += trade.pnl.value_or(0.0);
            stats_.record(trade);
        }
    }

    int restored = 0;
    for (const auto& trade : loaded.pending) {
        if (book_.adopt(trade)) {
            std::lock_guard<std::mutex> lock(ledger_mutex_);
            capital_ -= trade.size;
            restored++;
        }
    }

    spdlog::info("Paper trader recovered {} pending and {} resolved trades, capital ${:.2f}",
                 restored, loaded.resolved.size(), available_capital());
    return loaded.resolved;
}

int PaperTrader::open_positions() const {
    return book_.open_count();
}

double PaperTrader::available_capital() const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    return capital_;
}

std::vector<Trade> PaperTrader::pending() const {
    return book_.pending();
}

PaperStats PaperTrader::stats() const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    return stats_;
}

nlohmann::json PaperTrader::summary() const {
    auto open = book_.pending();
    double at_risk = 0.0;
    for (const auto& trade : open) {
        at_risk += trade.size;
    }

    PaperStats stats;
    double capital = 0.0;
    {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        stats = stats_;
        capital = capital_;
    }

    nlohmann::json journey = nlohmann::json::array();
    for (const auto& transition : brain_.transitions()) {
        journey.push_back(transition.to_json());
    }

    return {
        {"generated_at", util::current_iso8601()},
        {"starting_capital", config_.initial_capital},
        {"available_capital", capital},
        {"open_positions", open.size()},
        {"capital_at_risk", at_risk},
        {"equity", capital + at_risk},
        {"stats", stats.to_json()},
        {"survival", brain_.snapshot().to_json()},
        {"tier_transitions", journey},
        {"recommendation", stats.recommendation()}
    };
}

bool PaperTrader::write_summary(const std::string& run_id) {
    auto report = summary();
    bool stored = !store_ || store_->record_summary(run_id, report);
    if (!stored) {
        spdlog::error("Failed to persist paper summary for run {}", run_id);
    }

    const auto& stats = report["stats"];
    notify(alerts::kDailySummary,
           fmt::format("Paper summary: {} trades, {}W/{}L/{}P, win rate {:.1f}%, pnl ${:+.2f}, "
                       "capital ${:.2f}, tier {}. Verdict: {}",
                       stats["total_trades"].get<int>(), stats["wins"].get<int>(),
                       stats["losses"].get<int>(), stats["pushes"].get<int>(),
                       stats["win_rate"].get<double>() * 100.0, stats["total_pnl"].get<double>(),
                       report["available_capital"].get<double>(),
                       report["survival"]["tier"].get<std::string>(),
                       report["recommendation"].get<std::string>()));
    return stored;
}

void PaperTrader::notify(const std::string& category, const std::string& text, bool force) {
    if (alerts_) {
        Alert alert;
        alert.category = category;
        alert.text = text;
        alert.force = force;
        alerts_->send(alert);
    }
}
