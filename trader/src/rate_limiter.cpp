#include "rate_limiter.hpp"
#include <algorithm>
#include <cmath>
#include <thread>

RateLimiter::RateLimiter(RateLimit defaults) : defaults_(defaults) {}

bool RateLimiter::try_acquire(const std::string& bucket, SteadyClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& b = bucket_for(bucket, now);
    refill(b, now);
    if (b.tokens < 1.0) {
        return false;
    }
    b.tokens -= 1.0;
    return true;
}

bool RateLimiter::acquire(const std::string& bucket, std::chrono::milliseconds max_wait) {
    auto deadline = SteadyClock::now() + max_wait;
    for (;;) {
        auto now = SteadyClock::now();
        if (try_acquire(bucket, now)) {
            return true;
        }
        auto wait = wait_time(bucket, now);
        if (now + wait > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::max(wait, std::chrono::milliseconds(1)));
    }
}

std::chrono::milliseconds RateLimiter::wait_time(const std::string& bucket, SteadyClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& b = bucket_for(bucket, now);
    refill(b, now);
    if (b.tokens >= 1.0) {
        return std::chrono::milliseconds(0);
    }
    double seconds = (1.0 - b.tokens) / b.limit.per_second;
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
}

void RateLimiter::set_limit(const std::string& bucket, RateLimit limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        buckets_.emplace(bucket, Bucket{limit, static_cast<double>(limit.burst), SteadyClock::now()});
        return;
    }
    it->second.limit = limit;
    it->second.tokens = std::min(it->second.tokens, static_cast<double>(limit.burst));
}

RateLimiter::Bucket& RateLimiter::bucket_for(const std::string& name, SteadyClock::time_point now) {
    auto it = buckets_.find(name);
    if (it == buckets_.end()) {
        it = buckets_.emplace(name, Bucket{defaults_, static_cast<double>(defaults_.burst), now}).first;
    }
    return it->second;
}

void RateLimiter::refill(Bucket& bucket, SteadyClock::time_point now) {
    if (now <= bucket.refilled_at) {
        return;
    }
    double elapsed = std::chrono::duration<double>(now - bucket.refilled_at).count();
    bucket.tokens = std::min(static_cast<double>(bucket.limit.burst),
                             bucket.tokens + elapsed * bucket.limit.per_second);
    bucket.refilled_at = now;
}
