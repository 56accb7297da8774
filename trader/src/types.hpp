#pragma once

#include <map>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class Direction { Yes, No };
enum class Tier { Healthy, Wounded, Thriving };
enum class TradeStatus { Pending, Resolved };
enum class Outcome { Win, Loss, Push };
enum class MarketSide { Yes, No, Void };

std::string to_string(Direction direction);
std::string to_string(Tier tier);
std::string to_string(TradeStatus status);
std::string to_string(Outcome outcome);
std::string to_string(MarketSide side);

std::optional<Direction> direction_from_string(const std::string& value);
std::optional<Tier> tier_from_string(const std::string& value);
std::optional<Outcome> outcome_from_string(const std::string& value);

// One observation of the underlying price stream
struct PriceTick {
    double price = 0.0;
    TimePoint source_time;
    TimePoint receipt_time;
    bool stale = false;

    // receipt - source in milliseconds
    double latency_ms() const;
};

// Snapshot of a short-lived prediction market
struct MarketDescriptor {
    std::string market_id;
    std::string question;
    double baseline_price = 0.0;
    double yes_price = 0.5;
    TimePoint created_at;
    TimePoint expires_at;

    double no_price() const { return 1.0 - yes_price; }
    bool is_expired(TimePoint now) const { return now >= expires_at; }

    nlohmann::json to_json() const;
    static std::optional<MarketDescriptor> from_json(const nlohmann::json& j);
};

struct EdgeSignal {
    std::string market_id;
    Direction direction = Direction::Yes;
    double edge_pct = 0.0;
    double real_move_pct = 0.0;
    double implied_move_pct = 0.0;
    double confidence = 0.0;
    double btc_price = 0.0;
    double yes_price = 0.5;
    TimePoint expires_at;
    TimePoint observed_at;

    double magnitude() const;
    // Price paid per share on the chosen side
    double entry_price() const;

    nlohmann::json to_json() const;
};

struct OutcomeRecord {
    std::string trade_id;
    bool won = false;
    double pnl = 0.0;
    TimePoint recorded_at;

    // Entry context for pattern learning; absent for bare outcomes
    double edge_pct = 0.0;
    Direction direction = Direction::Yes;
    std::optional<TimePoint> opened_at;
};

// "0-2%", "2-5%", "5-10%" or "10%+" on |edge|
std::string edge_bucket(double edge_pct);

// Win/loss tally for one hour|side|edge-bucket pattern
struct PatternStats {
    int wins = 0;
    int losses = 0;
    double total_pnl = 0.0;

    int samples() const { return wins + losses; }
    double win_rate() const;
    nlohmann::json to_json() const;
};

struct TierTransition {
    Tier from = Tier::Healthy;
    Tier to = Tier::Healthy;
    std::string trade_id;
    TimePoint at;

    nlohmann::json to_json() const;
};

struct SurvivalState {
    Tier tier = Tier::Healthy;
    double capital_estimate = 0.0;
    int consecutive_losses = 0;
    int consecutive_wins = 0;
    double edge_threshold = 0.0;
    double kelly_multiplier = 1.0;
    std::vector<OutcomeRecord> history;
    std::map<std::string, PatternStats> patterns;

    double win_rate() const;
    nlohmann::json to_json() const;
};

// Position (live) and paper trade share one record
struct Trade {
    std::string id;
    std::string market_id;
    Direction direction = Direction::Yes;
    double entry_price = 0.0;
    double yes_price_at_entry = 0.5;
    double size = 0.0;
    double shares = 0.0;
    double edge_pct = 0.0;
    double confidence = 0.0;
    double btc_price = 0.0;
    TimePoint opened_at;
    TimePoint expires_at;
    TradeStatus status = TradeStatus::Pending;
    std::optional<Outcome> outcome;
    std::optional<double> resolution_price;
    std::optional<double> pnl;
    std::optional<TimePoint> resolved_at;
    std::string order_id;
    bool paper = true;
    std::string settlement_source;

    bool is_open() const { return status == TradeStatus::Pending; }

    nlohmann::json to_json() const;
    static std::optional<Trade> from_json(const nlohmann::json& j);
};

// Brain-facing record of a resolved win or loss
OutcomeRecord outcome_record(const Trade& trade);

struct Alert {
    std::string category;
    std::string text;
    bool force = false;
    TimePoint timestamp = Clock::now();

    nlohmann::json to_json() const;
};
