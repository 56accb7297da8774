#pragma once
#include "config.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Append-only SQLite log of trade events and run summaries.
// Each record is written in its own transaction, so a crash leaves
// every trade either absent, PENDING, or RESOLVED.
class TradeStore {
public:
    struct LoadResult {
        std::vector<Trade> pending;
        std::vector<Trade> resolved;
        int quarantined = 0;
    };

    explicit TradeStore(const Config& config);
    ~TradeStore();

    // Trade lifecycle. Opening an id that is already logged fails;
    // a repeated resolution is a no-op that succeeds.
    bool record_open(const Trade& trade);
    bool record_resolution(const Trade& trade);

    // Replays the log for one execution path; unreadable records are quarantined
    LoadResult load(bool paper);

    // Highest NNNN suffix among ids starting with prefix, quarantined ones
    // included; 0 when none
    int highest_trade_sequence(const std::string& prefix);

    // Run summaries
    bool record_summary(const std::string& run_id, const nlohmann::json& summary);
    std::optional<nlohmann::json> latest_summary();

    // Checkpoints the write-ahead log into the main database file
    bool flush();

    // Health check
    bool is_healthy() const;

    // Non-copyable
    TradeStore(const TradeStore&) = delete;
    TradeStore& operator=(const TradeStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
