#pragma once

#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// Bounded hand-off between the price feed and the decision loop.
// When full, the oldest queued tick is discarded so the feed never blocks.
class TickChannel {
public:
    explicit TickChannel(std::size_t capacity);

    // Never blocks; returns false once the channel is closed
    bool push(const PriceTick& tick);

    // Waits up to timeout for a tick; nullopt on timeout or once closed and drained
    std::optional<PriceTick> pop(std::chrono::milliseconds timeout);

    void close();
    bool is_closed() const;

    std::size_t size() const;
    std::size_t dropped() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<PriceTick> queue_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};
