#pragma once

#include "config.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

// Streams trades for one symbol over a TLS WebSocket and hands each one
// to the tick callback. Reconnects on any close or read error.
class PriceFeed {
public:
    using TickHandler = std::function<void(const PriceTick&)>;

    explicit PriceFeed(const Config& config);
    ~PriceFeed();

    PriceFeed(const PriceFeed&) = delete;
    PriceFeed& operator=(const PriceFeed&) = delete;

    // Spawns the connection thread
    void start(TickHandler on_tick);

    // Idempotent; returns once the connection thread has exited
    void stop();

    std::optional<PriceTick> latest() const;

    // Latency of the latest tick, nullopt before the first one
    std::optional<double> latency_ms() const;

    bool is_connected() const;
    int reconnect_count() const;

    // Parses a trade frame (plain or combined-stream envelope).
    // nullopt for other event types or malformed payloads.
    static std::optional<PriceTick> parse_trade_message(const std::string& text,
                                                        TimePoint receipt_time,
                                                        int stale_ceiling_ms);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
