#pragma once

#include "alert_sink.hpp"
#include "config.hpp"
#include <chrono>
#include <memory>

namespace sw::redis {
class Redis;
}

// Publishes alerts to a Redis stream for downstream consumers
class RedisAlertSink : public AlertSink {
public:
    explicit RedisAlertSink(const Config& config);
    ~RedisAlertSink() override;

    bool send(const Alert& alert) override;

    // Non-copyable
    RedisAlertSink(const RedisAlertSink&) = delete;
    RedisAlertSink& operator=(const RedisAlertSink&) = delete;

private:
    bool connect();
    bool ensure_connection();

    const Config& config_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::chrono::steady_clock::time_point last_connection_attempt_;
    int backoff_ms_ = 1000;
};
