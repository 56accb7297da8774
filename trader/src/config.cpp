#include "config.hpp"
#include "util.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace {

int get_env_int(const std::string& name, int default_val) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_val;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid integer value for env var {}: {}", name, value));
    }
}

double get_env_double(const std::string& name, double default_val) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_val;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid numeric value for env var {}: {}", name, value));
    }
}

uint64_t get_env_u64(const std::string& name, uint64_t default_val) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_val;
    }
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid integer value for env var {}: {}", name, value));
    }
}

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& field) {
    if (!j.contains(key)) {
        return;
    }
    try {
        field = j.at(key).get<T>();
    } catch (const nlohmann::json::exception&) {
        throw std::runtime_error(fmt::format("Invalid value for config key {}: {}", key, j.at(key).dump()));
    }
}

} // namespace

std::string to_string(TradingMode mode) {
    return mode == TradingMode::Live ? "live" : "paper";
}

TradingMode parse_trading_mode(const std::string& value) {
    auto lowered = util::to_lower(util::trim(value));
    if (lowered == "paper") return TradingMode::Paper;
    if (lowered == "live") return TradingMode::Live;
    throw std::runtime_error("TRADING_MODE must be 'paper' or 'live', got '" + value + "'");
}

Config Config::from_env() {
    Config config;
    config.apply_env();
    return config;
}

Config Config::load(const std::string& file_path) {
    Config config;

    std::ifstream in(file_path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + file_path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("Config file {} is not valid JSON: {}", file_path, e.what()));
    }

    config.apply_json(j);
    config.apply_env();
    return config;
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object");
    }

    read_key(j, "service_name", service_name);
    read_key(j, "log_level", log_level);

    if (j.contains("mode")) {
        mode = parse_trading_mode(j.at("mode").get<std::string>());
    }
    read_key(j, "max_bet_pct", max_bet_pct);
    read_key(j, "max_concurrent_positions", max_concurrent_positions);
    read_key(j, "min_edge_pct", min_edge_pct);
    read_key(j, "max_latency_ms", max_latency_ms);
    read_key(j, "initial_capital", initial_capital);
    read_key(j, "min_order_usd", min_order_usd);

    read_key(j, "symbol", symbol);
    read_key(j, "price_ws_host", price_ws_host);
    read_key(j, "price_ws_port", price_ws_port);
    read_key(j, "stale_tick_ms", stale_tick_ms);
    read_key(j, "reconnect_delay_ms", reconnect_delay_ms);

    read_key(j, "implied_scale", implied_scale);
    read_key(j, "confidence_edge_scale", confidence_edge_scale);

    read_key(j, "base_kelly_fraction", base_kelly_fraction);
    read_key(j, "kelly_edge_gain", kelly_edge_gain);
    read_key(j, "kelly_max", kelly_max);
    read_key(j, "wound_loss_streak", wound_loss_streak);
    read_key(j, "recover_win_streak", recover_win_streak);
    read_key(j, "thrive_win_rate", thrive_win_rate);
    read_key(j, "thrive_min_samples", thrive_min_samples);
    read_key(j, "thrive_kelly_boost", thrive_kelly_boost);
    read_key(j, "wound_edge_increment", wound_edge_increment);
    read_key(j, "thrive_edge_decrement", thrive_edge_decrement);
    read_key(j, "edge_threshold_floor", edge_threshold_floor);
    read_key(j, "edge_threshold_ceiling", edge_threshold_ceiling);
    read_key(j, "history_size", history_size);
    read_key(j, "min_pattern_samples", min_pattern_samples);
    read_key(j, "min_pattern_win_rate", min_pattern_win_rate);

    read_key(j, "polymarket_api_url", polymarket_api_url);
    read_key(j, "gamma_api_url", gamma_api_url);
    read_key(j, "polymarket_api_key", polymarket_api_key);
    read_key(j, "venue_timeout_ms", venue_timeout_ms);
    read_key(j, "venue_max_attempts", venue_max_attempts);
    read_key(j, "venue_rate_per_sec", venue_rate_per_sec);
    read_key(j, "venue_rate_burst", venue_rate_burst);
    read_key(j, "market_cache_ttl_sec", market_cache_ttl_sec);

    read_key(j, "resolve_interval_sec", resolve_interval_sec);
    read_key(j, "resolution_buffer_sec", resolution_buffer_sec);
    read_key(j, "settlement_grace_sec", settlement_grace_sec);
    read_key(j, "settlement_oracle", settlement_oracle);
    read_key(j, "simulation_seed", simulation_seed);

    read_key(j, "decision_budget_ms", decision_budget_ms);
    read_key(j, "tick_queue_capacity", tick_queue_capacity);
    read_key(j, "summary_interval_sec", summary_interval_sec);

    read_key(j, "db_path", db_path);

    read_key(j, "telegram_bot_token", telegram_bot_token);
    read_key(j, "telegram_chat_id", telegram_chat_id);
    read_key(j, "redis_url", redis_url);
    read_key(j, "alert_stream", alert_stream);
    read_key(j, "alert_interval_sec", alert_interval_sec);

    read_key(j, "health_host", health_host);
    read_key(j, "health_port", health_port);
}

void Config::apply_env() {
    // Service
    service_name = util::get_env_var("SERVICE_NAME", service_name);
    log_level = util::get_env_var("LOG_LEVEL", log_level);

    // Trading surface
    auto mode_str = util::get_env_var("TRADING_MODE");
    if (!mode_str.empty()) {
        mode = parse_trading_mode(mode_str);
    }
    max_bet_pct = get_env_double("MAX_BET_PCT", max_bet_pct);
    max_concurrent_positions = get_env_int("MAX_CONCURRENT_POSITIONS", max_concurrent_positions);
    min_edge_pct = get_env_double("MIN_EDGE_PCT", min_edge_pct);
    max_latency_ms = get_env_int("MAX_LATENCY_MS", max_latency_ms);
    initial_capital = get_env_double("INITIAL_CAPITAL", initial_capital);
    min_order_usd = get_env_double("MIN_ORDER_USD", min_order_usd);

    // Price stream
    symbol = util::to_lower(util::get_env_var("SYMBOL", symbol));
    price_ws_host = util::get_env_var("PRICE_WS_HOST", price_ws_host);
    price_ws_port = util::get_env_var("PRICE_WS_PORT", price_ws_port);
    stale_tick_ms = get_env_int("STALE_TICK_MS", stale_tick_ms);
    reconnect_delay_ms = get_env_int("RECONNECT_DELAY_MS", reconnect_delay_ms);

    // Edge model
    implied_scale = get_env_double("IMPLIED_SCALE", implied_scale);
    confidence_edge_scale = get_env_double("CONFIDENCE_EDGE_SCALE", confidence_edge_scale);

    // Survival brain
    base_kelly_fraction = get_env_double("KELLY_FRACTION", base_kelly_fraction);
    kelly_edge_gain = get_env_double("KELLY_EDGE_GAIN", kelly_edge_gain);
    kelly_max = get_env_double("KELLY_MAX", kelly_max);
    wound_loss_streak = get_env_int("WOUND_LOSS_STREAK", wound_loss_streak);
    recover_win_streak = get_env_int("RECOVER_WIN_STREAK", recover_win_streak);
    thrive_win_rate = get_env_double("THRIVE_WIN_RATE", thrive_win_rate);
    thrive_min_samples = get_env_int("THRIVE_MIN_SAMPLES", thrive_min_samples);
    thrive_kelly_boost = get_env_double("THRIVE_KELLY_BOOST", thrive_kelly_boost);
    wound_edge_increment = get_env_double("WOUND_EDGE_INCREMENT", wound_edge_increment);
    thrive_edge_decrement = get_env_double("THRIVE_EDGE_DECREMENT", thrive_edge_decrement);
    edge_threshold_floor = get_env_double("EDGE_THRESHOLD_FLOOR", edge_threshold_floor);
    edge_threshold_ceiling = get_env_double("EDGE_THRESHOLD_CEILING", edge_threshold_ceiling);
    history_size = get_env_int("HISTORY_SIZE", history_size);
    min_pattern_samples = get_env_int("MIN_PATTERN_SAMPLES", min_pattern_samples);
    min_pattern_win_rate = get_env_double("MIN_PATTERN_WIN_RATE", min_pattern_win_rate);

    // Venue
    polymarket_api_url = util::get_env_var("POLYMARKET_API_URL", polymarket_api_url);
    gamma_api_url = util::get_env_var("GAMMA_API_URL", gamma_api_url);
    polymarket_api_key = util::get_env_var("POLYMARKET_API_KEY", polymarket_api_key);
    venue_timeout_ms = get_env_int("VENUE_TIMEOUT_MS", venue_timeout_ms);
    venue_max_attempts = get_env_int("VENUE_MAX_ATTEMPTS", venue_max_attempts);
    venue_rate_per_sec = get_env_double("VENUE_RATE_PER_SEC", venue_rate_per_sec);
    venue_rate_burst = get_env_int("VENUE_RATE_BURST", venue_rate_burst);
    market_cache_ttl_sec = get_env_int("MARKET_CACHE_TTL_SEC", market_cache_ttl_sec);

    // Resolution
    resolve_interval_sec = get_env_int("RESOLVE_INTERVAL_SEC", resolve_interval_sec);
    resolution_buffer_sec = get_env_int("RESOLUTION_BUFFER_SEC", resolution_buffer_sec);
    settlement_grace_sec = get_env_int("SETTLEMENT_GRACE_SEC", settlement_grace_sec);
    settlement_oracle = util::to_lower(util::get_env_var("SETTLEMENT_ORACLE", settlement_oracle));
    simulation_seed = get_env_u64("SIMULATION_SEED", simulation_seed);

    // Decision loop
    decision_budget_ms = get_env_int("DECISION_BUDGET_MS", decision_budget_ms);
    tick_queue_capacity = get_env_int("TICK_QUEUE_CAPACITY", tick_queue_capacity);
    summary_interval_sec = get_env_int("SUMMARY_INTERVAL_SEC", summary_interval_sec);

    // Persistence
    db_path = util::get_env_var("DB_PATH", db_path);

    // Alerts
    telegram_bot_token = util::get_env_var("TELEGRAM_BOT_TOKEN", telegram_bot_token);
    telegram_chat_id = util::get_env_var("TELEGRAM_CHAT_ID", telegram_chat_id);
    redis_url = util::get_env_var("REDIS_URL", redis_url);
    alert_stream = util::get_env_var("ALERT_STREAM", alert_stream);
    alert_interval_sec = get_env_int("ALERT_INTERVAL_SEC", alert_interval_sec);

    // Health
    health_host = util::get_env_var("HEALTH_HOST", health_host);
    health_port = get_env_int("HEALTH_PORT", health_port);
}

void Config::validate() const {
    if (max_bet_pct <= 0.0 || max_bet_pct > 100.0) {
        throw std::runtime_error("MAX_BET_PCT must be in (0, 100]");
    }

    if (max_concurrent_positions < 1) {
        throw std::runtime_error("MAX_CONCURRENT_POSITIONS must be at least 1");
    }

    if (max_latency_ms <= 0) {
        throw std::runtime_error("MAX_LATENCY_MS must be positive");
    }

    if (initial_capital <= 0.0) {
        throw std::runtime_error("INITIAL_CAPITAL must be positive");
    }

    if (min_order_usd < 0.0) {
        throw std::runtime_error("MIN_ORDER_USD cannot be negative");
    }

    if (symbol.empty()) {
        throw std::runtime_error("SYMBOL cannot be empty");
    }

    if (stale_tick_ms <= 0) {
        throw std::runtime_error("STALE_TICK_MS must be positive");
    }

    if (reconnect_delay_ms <= 0) {
        throw std::runtime_error("RECONNECT_DELAY_MS must be positive");
    }

    if (implied_scale <= 0.0) {
        throw std::runtime_error("IMPLIED_SCALE must be positive");
    }

    if (confidence_edge_scale <= 0.0) {
        throw std::runtime_error("CONFIDENCE_EDGE_SCALE must be positive");
    }

    if (edge_threshold_floor < 0.0 || edge_threshold_floor > edge_threshold_ceiling) {
        throw std::runtime_error("EDGE_THRESHOLD_FLOOR must be between 0 and EDGE_THRESHOLD_CEILING");
    }

    if (min_edge_pct < edge_threshold_floor || min_edge_pct > edge_threshold_ceiling) {
        throw std::runtime_error(fmt::format(
            "MIN_EDGE_PCT must be within [{}, {}]", edge_threshold_floor, edge_threshold_ceiling));
    }

    if (base_kelly_fraction <= 0.0 || base_kelly_fraction > 1.0) {
        throw std::runtime_error("KELLY_FRACTION must be in (0, 1]");
    }

    if (kelly_max < 1.0) {
        throw std::runtime_error("KELLY_MAX must be at least 1.0");
    }

    if (thrive_kelly_boost < 1.0) {
        throw std::runtime_error("THRIVE_KELLY_BOOST must be at least 1.0");
    }

    if (wound_loss_streak < 1 || recover_win_streak < 1) {
        throw std::runtime_error("WOUND_LOSS_STREAK and RECOVER_WIN_STREAK must be at least 1");
    }

    if (thrive_win_rate <= 0.0 || thrive_win_rate >= 1.0) {
        throw std::runtime_error("THRIVE_WIN_RATE must be in (0, 1)");
    }

    if (history_size < 1) {
        throw std::runtime_error("HISTORY_SIZE must be at least 1");
    }

    if (thrive_min_samples < 1 || thrive_min_samples > history_size) {
        throw std::runtime_error("THRIVE_MIN_SAMPLES must be between 1 and HISTORY_SIZE");
    }

    if (wound_edge_increment < 0.0 || thrive_edge_decrement < 0.0) {
        throw std::runtime_error("Edge threshold adjustments cannot be negative");
    }

    if (min_pattern_samples < 0) {
        throw std::runtime_error("MIN_PATTERN_SAMPLES cannot be negative");
    }

    if (min_pattern_win_rate < 0.0 || min_pattern_win_rate > 1.0) {
        throw std::runtime_error("MIN_PATTERN_WIN_RATE must be in [0, 1]");
    }

    if (is_live() && polymarket_api_key.empty()) {
        throw std::runtime_error("POLYMARKET_API_KEY is required in live mode");
    }

    if (venue_timeout_ms <= 0 || venue_max_attempts < 1) {
        throw std::runtime_error("VENUE_TIMEOUT_MS must be positive and VENUE_MAX_ATTEMPTS at least 1");
    }

    if (venue_rate_per_sec <= 0.0 || venue_rate_burst < 1) {
        throw std::runtime_error("VENUE_RATE_PER_SEC must be positive and VENUE_RATE_BURST at least 1");
    }

    if (market_cache_ttl_sec < 0) {
        throw std::runtime_error("MARKET_CACHE_TTL_SEC cannot be negative");
    }

    if (resolve_interval_sec < 1) {
        throw std::runtime_error("RESOLVE_INTERVAL_SEC must be at least 1");
    }

    if (resolution_buffer_sec < 0 || settlement_grace_sec < 0) {
        throw std::runtime_error("RESOLUTION_BUFFER_SEC and SETTLEMENT_GRACE_SEC cannot be negative");
    }

    if (settlement_oracle != "venue" && settlement_oracle != "simulated" && settlement_oracle != "fallback") {
        throw std::runtime_error("SETTLEMENT_ORACLE must be one of venue, simulated, fallback");
    }

    if (decision_budget_ms <= 0) {
        throw std::runtime_error("DECISION_BUDGET_MS must be positive");
    }

    if (tick_queue_capacity < 1) {
        throw std::runtime_error("TICK_QUEUE_CAPACITY must be at least 1");
    }

    if (summary_interval_sec < 1) {
        throw std::runtime_error("SUMMARY_INTERVAL_SEC must be at least 1");
    }

    if (db_path.empty()) {
        throw std::runtime_error("DB_PATH cannot be empty");
    }

    if (!telegram_bot_token.empty() && telegram_chat_id.empty()) {
        throw std::runtime_error("TELEGRAM_CHAT_ID is required when TELEGRAM_BOT_TOKEN is set");
    }

    if (alert_interval_sec < 1) {
        throw std::runtime_error("ALERT_INTERVAL_SEC must be at least 1");
    }

    if (health_port <= 0 || health_port > 65535) {
        throw std::runtime_error("HEALTH_PORT must be between 1 and 65535");
    }

    spdlog::info("Configuration validated successfully");
}

nlohmann::json Config::to_json() const {
    return {
        {"mode", to_string(mode)},
        {"symbol", symbol},
        {"max_bet_pct", max_bet_pct},
        {"max_concurrent_positions", max_concurrent_positions},
        {"min_edge_pct", min_edge_pct},
        {"max_latency_ms", max_latency_ms},
        {"initial_capital", initial_capital},
        {"implied_scale", implied_scale},
        {"settlement_oracle", settlement_oracle}
    };
}
