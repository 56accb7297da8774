#include "redis_alert_sink.hpp"
#include "util.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>
#include <unordered_map>

RedisAlertSink::RedisAlertSink(const Config& config) : config_(config) {
    connect();
}

RedisAlertSink::~RedisAlertSink() = default;

bool RedisAlertSink::connect() {
    last_connection_attempt_ = std::chrono::steady_clock::now();
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
        redis_->ping();
        spdlog::info("Connected to Redis at {}", config_.redis_url);
        backoff_ms_ = 1000;
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        redis_.reset();
        return false;
    }
}

bool RedisAlertSink::ensure_connection() {
    if (redis_) {
        return true;
    }

    auto now = std::chrono::steady_clock::now();
    if (std::chrono::duration_cast<std::chrono::milliseconds>(
            now - last_connection_attempt_).count() < backoff_ms_) {
        return false;
    }

    if (connect()) {
        spdlog::info("Redis connection restored");
        return true;
    }

    // Exponential backoff with cap
    backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
    return false;
}

bool RedisAlertSink::send(const Alert& alert) {
    if (!ensure_connection()) {
        return false;
    }

    try {
        std::unordered_map<std::string, std::string> fields = {
            {"category", alert.category},
            {"data", alert.to_json().dump()},
            {"timestamp", std::to_string(util::to_epoch_ms(alert.timestamp))}
        };

        redis_->xadd(config_.alert_stream, "*", fields.begin(), fields.end());
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to publish alert: {}", e.what());
        // Drop the connection; the next send reconnects after backoff
        redis_.reset();
        last_connection_attempt_ = std::chrono::steady_clock::now();
        return false;
    }
}
