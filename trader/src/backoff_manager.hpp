#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

struct BackoffPolicy {
    std::chrono::milliseconds base{250};
    std::chrono::milliseconds cap{30000};
    double multiplier = 2.0;
    double jitter = 0.1;
};

// Cool-down gate per venue endpoint. Each failure pushes the next allowed
// call further out; one success clears the endpoint.
class BackoffManager {
public:
    using SteadyClock = std::chrono::steady_clock;

    explicit BackoffManager(BackoffPolicy policy = BackoffPolicy());

    // Returns the cool-down now in force for the endpoint
    std::chrono::milliseconds record_failure(const std::string& endpoint,
                                             SteadyClock::time_point now = SteadyClock::now());
    void record_success(const std::string& endpoint);

    // Jittered delay before retry attempt n (1-based), 0 for n <= 0
    std::chrono::milliseconds delay_for_attempt(int attempt) const;

    std::chrono::milliseconds time_until_allowed(const std::string& endpoint,
                                                 SteadyClock::time_point now = SteadyClock::now()) const;
    int failure_count(const std::string& endpoint) const;
    void reset_all();

private:
    struct Cooldown {
        int failures = 0;
        SteadyClock::time_point until;
    };

    BackoffPolicy policy_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Cooldown> cooldowns_;
};
