#pragma once

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Alert categories
namespace alerts {
constexpr const char* kTradeOpen = "trade_open";
constexpr const char* kTradeResolve = "trade_resolve";
constexpr const char* kDailySummary = "daily_summary";
constexpr const char* kSurvival = "survival";
constexpr const char* kSystem = "system";
constexpr const char* kVenueError = "venue_error";
}

// Receiver of human-readable notifications
class AlertSink {
public:
    virtual ~AlertSink() = default;

    // false when the alert was not delivered (suppressed or failed)
    virtual bool send(const Alert& alert) = 0;
};

class LogAlertSink : public AlertSink {
public:
    bool send(const Alert& alert) override;
};

// Delivers to every child sink; succeeds if any child did
class FanoutAlertSink : public AlertSink {
public:
    void add(std::unique_ptr<AlertSink> sink);
    bool send(const Alert& alert) override;
    std::size_t size() const { return sinks_.size(); }

private:
    std::vector<std::unique_ptr<AlertSink>> sinks_;
};

// At most one alert per category per interval; forced alerts always pass
class ThrottledAlertSink : public AlertSink {
public:
    using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

    ThrottledAlertSink(std::shared_ptr<AlertSink> inner, std::chrono::seconds interval,
                       SteadyClock clock = [] { return std::chrono::steady_clock::now(); });

    bool send(const Alert& alert) override;
    int suppressed() const;

private:
    std::shared_ptr<AlertSink> inner_;
    std::chrono::seconds interval_;
    SteadyClock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_sent_;
    int suppressed_ = 0;
};

// Moves delivery onto a worker thread so network sinks never stall the caller
class AsyncAlertSink : public AlertSink {
public:
    AsyncAlertSink(std::shared_ptr<AlertSink> inner, std::size_t max_queue = 100);
    ~AsyncAlertSink() override;

    // Queues the alert; false when the queue is full or the sink is stopped
    bool send(const Alert& alert) override;

    // Delivers what is queued, then joins the worker
    void stop();

private:
    void worker_loop();

    std::shared_ptr<AlertSink> inner_;
    std::size_t max_queue_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Alert> queue_;
    bool stopping_ = false;
    std::thread worker_;
};
