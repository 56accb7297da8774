#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

struct RateLimit {
    double per_second = 10.0;
    int burst = 20;
};

// Token buckets keyed by request class ("reads", "orders"). Buckets start full.
class RateLimiter {
public:
    using SteadyClock = std::chrono::steady_clock;

    explicit RateLimiter(RateLimit defaults = RateLimit());

    // Takes one token if available
    bool try_acquire(const std::string& bucket, SteadyClock::time_point now = SteadyClock::now());

    // Waits for a token up to max_wait; false when the wait would exceed it
    bool acquire(const std::string& bucket, std::chrono::milliseconds max_wait);

    // Time until one token is available, 0 when one is ready
    std::chrono::milliseconds wait_time(const std::string& bucket,
                                        SteadyClock::time_point now = SteadyClock::now());

    void set_limit(const std::string& bucket, RateLimit limit);

private:
    struct Bucket {
        RateLimit limit;
        double tokens;
        SteadyClock::time_point refilled_at;
    };

    Bucket& bucket_for(const std::string& name, SteadyClock::time_point now);
    static void refill(Bucket& bucket, SteadyClock::time_point now);

    RateLimit defaults_;
    std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
};
