#include "types.hpp"
#include "util.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

std::string to_string(Direction direction) {
    return direction == Direction::Yes ? "YES" : "NO";
}

std::string to_string(Tier tier) {
    switch (tier) {
        case Tier::Healthy: return "HEALTHY";
        case Tier::Wounded: return "WOUNDED";
        case Tier::Thriving: return "THRIVING";
    }
    return "UNKNOWN";
}

std::string to_string(TradeStatus status) {
    return status == TradeStatus::Pending ? "PENDING" : "RESOLVED";
}

std::string to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Win: return "WIN";
        case Outcome::Loss: return "LOSS";
        case Outcome::Push: return "PUSH";
    }
    return "UNKNOWN";
}

std::string to_string(MarketSide side) {
    switch (side) {
        case MarketSide::Yes: return "YES";
        case MarketSide::No: return "NO";
        case MarketSide::Void: return "VOID";
    }
    return "UNKNOWN";
}

std::optional<Direction> direction_from_string(const std::string& value) {
    if (value == "YES") return Direction::Yes;
    if (value == "NO") return Direction::No;
    return std::nullopt;
}

std::optional<Tier> tier_from_string(const std::string& value) {
    if (value == "HEALTHY") return Tier::Healthy;
    if (value == "WOUNDED") return Tier::Wounded;
    if (value == "THRIVING") return Tier::Thriving;
    return std::nullopt;
}

std::optional<Outcome> outcome_from_string(const std::string& value) {
    if (value == "WIN") return Outcome::Win;
    if (value == "LOSS") return Outcome::Loss;
    if (value == "PUSH") return Outcome::Push;
    return std::nullopt;
}

double PriceTick::latency_ms() const {
    return std::chrono::duration<double, std::milli>(receipt_time - source_time).count();
}

nlohmann::json MarketDescriptor::to_json() const {
    return {
        {"market_id", market_id},
        {"question", question},
        {"baseline_price", baseline_price},
        {"yes_price", yes_price},
        {"created_at", util::format_timestamp(created_at)},
        {"expires_at", util::format_timestamp(expires_at)}
    };
}

std::optional<MarketDescriptor> MarketDescriptor::from_json(const nlohmann::json& j) {
    try {
        MarketDescriptor market;
        market.market_id = j.at("market_id").get<std::string>();
        market.question = j.value("question", "");
        market.baseline_price = j.at("baseline_price").get<double>();
        market.yes_price = j.at("yes_price").get<double>();
        market.created_at = util::parse_iso8601(j.at("created_at").get<std::string>());
        market.expires_at = util::parse_iso8601(j.at("expires_at").get<std::string>());
        return market;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse market descriptor: {}", e.what());
        return std::nullopt;
    }
}

double EdgeSignal::magnitude() const {
    return std::fabs(edge_pct);
}

double EdgeSignal::entry_price() const {
    return direction == Direction::Yes ? yes_price : 1.0 - yes_price;
}

nlohmann::json EdgeSignal::to_json() const {
    return {
        {"market_id", market_id},
        {"direction", to_string(direction)},
        {"edge_pct", edge_pct},
        {"real_move_pct", real_move_pct},
        {"implied_move_pct", implied_move_pct},
        {"confidence", confidence},
        {"btc_price", btc_price},
        {"yes_price", yes_price},
        {"observed_at", util::format_timestamp(observed_at)}
    };
}

nlohmann::json TierTransition::to_json() const {
    return {
        {"from", to_string(from)},
        {"to", to_string(to)},
        {"trade_id", trade_id},
        {"at", util::format_timestamp(at)}
    };
}

std::string edge_bucket(double edge_pct) {
    double magnitude = std::fabs(edge_pct);
    if (magnitude < 2.0) return "0-2%";
    if (magnitude < 5.0) return "2-5%";
    if (magnitude < 10.0) return "5-10%";
    return "10%+";
}

double PatternStats::win_rate() const {
    return samples() > 0 ? static_cast<double>(wins) / samples() : 0.0;
}

nlohmann::json PatternStats::to_json() const {
    return {
        {"wins", wins},
        {"losses", losses},
        {"total_pnl", total_pnl},
        {"win_rate", win_rate()}
    };
}

OutcomeRecord outcome_record(const Trade& trade) {
    OutcomeRecord record;
    record.trade_id = trade.id;
    record.won = trade.outcome == Outcome::Win;
    record.pnl = trade.pnl.value_or(0.0);
    record.recorded_at = trade.resolved_at.value_or(trade.opened_at);
    record.edge_pct = trade.edge_pct;
    record.direction = trade.direction;
    record.opened_at = trade.opened_at;
    return record;
}

double SurvivalState::win_rate() const {
    if (history.empty()) {
        return 0.0;
    }
    int wins = 0;
    for (const auto& record : history) {
        if (record.won) wins++;
    }
    return static_cast<double>(wins) / static_cast<double>(history.size());
}

nlohmann::json SurvivalState::to_json() const {
    nlohmann::json pattern_json = nlohmann::json::object();
    for (const auto& [key, stats] : patterns) {
        pattern_json[key] = stats.to_json();
    }
    return {
        {"tier", to_string(tier)},
        {"capital_estimate", capital_estimate},
        {"consecutive_losses", consecutive_losses},
        {"consecutive_wins", consecutive_wins},
        {"edge_threshold", edge_threshold},
        {"kelly_multiplier", kelly_multiplier},
        {"history_size", history.size()},
        {"win_rate", win_rate()},
        {"patterns", pattern_json}
    };
}

nlohmann::json Trade::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"market_id", market_id},
        {"direction", to_string(direction)},
        {"entry_price", entry_price},
        {"yes_price_at_entry", yes_price_at_entry},
        {"size", size},
        {"shares", shares},
        {"edge_pct", edge_pct},
        {"confidence", confidence},
        {"btc_price", btc_price},
        {"opened_at", util::format_timestamp(opened_at)},
        {"expires_at", util::format_timestamp(expires_at)},
        {"status", to_string(status)},
        {"order_id", order_id},
        {"paper", paper}
    };
    if (outcome) j["outcome"] = to_string(*outcome);
    if (resolution_price) j["resolution_price"] = *resolution_price;
    if (pnl) j["pnl"] = *pnl;
    if (resolved_at) j["resolved_at"] = util::format_timestamp(*resolved_at);
    if (!settlement_source.empty()) j["settlement_source"] = settlement_source;
    return j;
}

std::optional<Trade> Trade::from_json(const nlohmann::json& j) {
    try {
        Trade trade;
        trade.id = j.at("id").get<std::string>();
        trade.market_id = j.at("market_id").get<std::string>();

        auto direction = direction_from_string(j.at("direction").get<std::string>());
        if (!direction) {
            return std::nullopt;
        }
        trade.direction = *direction;

        trade.entry_price = j.at("entry_price").get<double>();
        trade.yes_price_at_entry = j.value("yes_price_at_entry",
            trade.direction == Direction::Yes ? trade.entry_price : 1.0 - trade.entry_price);
        trade.size = j.at("size").get<double>();
        trade.shares = j.value("shares", trade.entry_price > 0 ? trade.size / trade.entry_price : 0.0);
        trade.edge_pct = j.value("edge_pct", 0.0);
        trade.confidence = j.value("confidence", 0.0);
        trade.btc_price = j.value("btc_price", 0.0);
        trade.opened_at = util::parse_iso8601(j.at("opened_at").get<std::string>());
        trade.expires_at = util::parse_iso8601(j.at("expires_at").get<std::string>());
        trade.status = j.at("status").get<std::string>() == "RESOLVED"
            ? TradeStatus::Resolved : TradeStatus::Pending;
        trade.order_id = j.value("order_id", "");
        trade.paper = j.value("paper", true);
        trade.settlement_source = j.value("settlement_source", "");

        if (j.contains("outcome")) {
            trade.outcome = outcome_from_string(j["outcome"].get<std::string>());
        }
        if (j.contains("resolution_price")) trade.resolution_price = j["resolution_price"].get<double>();
        if (j.contains("pnl")) trade.pnl = j["pnl"].get<double>();
        if (j.contains("resolved_at")) {
            trade.resolved_at = util::parse_iso8601(j["resolved_at"].get<std::string>());
        }

        // A resolved record must carry its result
        if (trade.status == TradeStatus::Resolved && (!trade.outcome || !trade.pnl)) {
            return std::nullopt;
        }
        return trade;
    } catch (const std::exception& e) {
        spdlog::debug("Trade record rejected: {}", e.what());
        return std::nullopt;
    }
}

nlohmann::json Alert::to_json() const {
    return {
        {"category", category},
        {"text", text},
        {"timestamp", util::format_timestamp(timestamp)}
    };
}
