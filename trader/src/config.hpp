#pragma once
#include <string>
#include <stdexcept>
#include <cstdint>
#include <nlohmann/json.hpp>

enum class TradingMode { Paper, Live };

class Config {
public:
    // Service info
    std::string service_name = "speedscout_trader";
    std::string log_level = "info";

    // Trading surface
    TradingMode mode = TradingMode::Paper;
    double max_bet_pct = 20.0;
    int max_concurrent_positions = 10;
    double min_edge_pct = 2.0;
    int max_latency_ms = 100;
    double initial_capital = 100.0;
    double min_order_usd = 1.0;

    // Price stream
    std::string symbol = "btcusdt";
    std::string price_ws_host = "stream.binance.com";
    std::string price_ws_port = "9443";
    int stale_tick_ms = 2000;
    int reconnect_delay_ms = 1000;

    // Edge model
    double implied_scale = 100.0;
    double confidence_edge_scale = 10.0;

    // Survival brain
    double base_kelly_fraction = 0.5;
    double kelly_edge_gain = 1.0;
    double kelly_max = 2.0;
    int wound_loss_streak = 4;
    int recover_win_streak = 3;
    double thrive_win_rate = 0.6;
    int thrive_min_samples = 10;
    double thrive_kelly_boost = 1.25;
    double wound_edge_increment = 1.0;
    double thrive_edge_decrement = 0.5;
    double edge_threshold_floor = 1.0;
    double edge_threshold_ceiling = 10.0;
    int history_size = 50;
    // Patterns with at least this many outcomes and a lower win rate are skipped; 0 disables
    int min_pattern_samples = 20;
    double min_pattern_win_rate = 0.4;

    // Venue
    std::string polymarket_api_url = "https://clob.polymarket.com";
    std::string gamma_api_url = "https://gamma-api.polymarket.com";
    std::string polymarket_api_key;
    int venue_timeout_ms = 2000;
    int venue_max_attempts = 3;
    double venue_rate_per_sec = 10.0;
    int venue_rate_burst = 20;
    int market_cache_ttl_sec = 30;

    // Resolution
    int resolve_interval_sec = 30;
    int resolution_buffer_sec = 30;
    int settlement_grace_sec = 120;
    std::string settlement_oracle = "fallback";
    uint64_t simulation_seed = 42;

    // Decision loop
    int decision_budget_ms = 50;
    int tick_queue_capacity = 256;
    int summary_interval_sec = 3600;

    // Persistence
    std::string db_path = "speedscout.db";

    // Alerts
    std::string telegram_bot_token;
    std::string telegram_chat_id;
    std::string redis_url;
    std::string alert_stream = "speedscout.alerts";
    int alert_interval_sec = 10;

    // Health check
    std::string health_host = "0.0.0.0";
    int health_port = 8090;

    // Defaults overridden by environment variables
    static Config from_env();

    // Defaults, then the JSON file, then environment variables
    static Config load(const std::string& file_path);

    void validate() const;

    bool is_live() const { return mode == TradingMode::Live; }
    nlohmann::json to_json() const;

private:
    void apply_json(const nlohmann::json& j);
    void apply_env();
};

std::string to_string(TradingMode mode);
TradingMode parse_trading_mode(const std::string& value);
