#include "backoff_manager.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

BackoffManager::BackoffManager(BackoffPolicy policy) : policy_(policy) {}

std::chrono::milliseconds BackoffManager::record_failure(const std::string& endpoint,
                                                         SteadyClock::time_point now) {
    auto delay = delay_for_attempt(failure_count(endpoint) + 1);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& cooldown = cooldowns_[endpoint];
    cooldown.failures++;
    cooldown.until = now + delay;
    return delay;
}

void BackoffManager::record_success(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    cooldowns_.erase(endpoint);
}

std::chrono::milliseconds BackoffManager::delay_for_attempt(int attempt) const {
    if (attempt <= 0) {
        return std::chrono::milliseconds(0);
    }

    double millis = static_cast<double>(policy_.base.count()) * std::pow(policy_.multiplier, attempt - 1);
    millis = std::min(millis, static_cast<double>(policy_.cap.count()));
    millis = util::random_jitter(millis, policy_.jitter);
    return std::chrono::milliseconds(static_cast<int64_t>(millis));
}

std::chrono::milliseconds BackoffManager::time_until_allowed(const std::string& endpoint,
                                                             SteadyClock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cooldowns_.find(endpoint);
    if (it == cooldowns_.end() || now >= it->second.until) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(it->second.until - now);
}

int BackoffManager::failure_count(const std::string& endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cooldowns_.find(endpoint);
    return it == cooldowns_.end() ? 0 : it->second.failures;
}

void BackoffManager::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    cooldowns_.clear();
}
