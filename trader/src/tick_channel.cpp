#include "tick_channel.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

TickChannel::TickChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool TickChannel::push(const PriceTick& tick) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_++;
            if (dropped_ % 100 == 1) {
                spdlog::debug("Tick channel full, dropped {} ticks so far", dropped_);
            }
        }
        queue_.push_back(tick);
    }
    cv_.notify_one();
    return true;
}

std::optional<PriceTick> TickChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
        return std::nullopt;
    }

    PriceTick tick = queue_.front();
    queue_.pop_front();
    return tick;
}

void TickChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool TickChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t TickChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t TickChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
