#include "alert_sink.hpp"
#include <spdlog/spdlog.h>

bool LogAlertSink::send(const Alert& alert) {
    spdlog::info("[alert:{}] {}", alert.category, alert.text);
    return true;
}

void FanoutAlertSink::add(std::unique_ptr<AlertSink> sink) {
    sinks_.push_back(std::move(sink));
}

bool FanoutAlertSink::send(const Alert& alert) {
    bool delivered = false;
    for (auto& sink : sinks_) {
        delivered = sink->send(alert) || delivered;
    }
    return delivered;
}

ThrottledAlertSink::ThrottledAlertSink(std::shared_ptr<AlertSink> inner, std::chrono::seconds interval,
                                       SteadyClock clock)
    : inner_(std::move(inner)), interval_(interval), clock_(std::move(clock)) {}

bool ThrottledAlertSink::send(const Alert& alert) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        auto it = last_sent_.find(alert.category);

        if (!alert.force && it != last_sent_.end() && now - it->second < interval_) {
            suppressed_++;
            spdlog::debug("Throttling {} alert: last one sent {} ms ago", alert.category,
                          std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second).count());
            return false;
        }
        last_sent_[alert.category] = now;
    }
    return inner_->send(alert);
}

int ThrottledAlertSink::suppressed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return suppressed_;
}

AsyncAlertSink::AsyncAlertSink(std::shared_ptr<AlertSink> inner, std::size_t max_queue)
    : inner_(std::move(inner)), max_queue_(max_queue) {
    worker_ = std::thread([this] { worker_loop(); });
}

AsyncAlertSink::~AsyncAlertSink() {
    stop();
}

bool AsyncAlertSink::send(const Alert& alert) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (queue_.size() >= max_queue_) {
            spdlog::warn("Alert queue full, dropping {} alert", alert.category);
            return false;
        }
        queue_.push(alert);
    }
    cv_.notify_one();
    return true;
}

void AsyncAlertSink::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AsyncAlertSink::worker_loop() {
    while (true) {
        Alert alert;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            alert = queue_.front();
            queue_.pop();
        }

        try {
            if (!inner_->send(alert)) {
                spdlog::debug("Alert {} was not delivered", alert.category);
            }
        } catch (const std::exception& e) {
            spdlog::error("Alert delivery failed: {}", e.what());
        }
    }
}
