#include "alert_sink.hpp"
#include <gtest/gtest.h>
#include <mutex>
#include <vector>

namespace {

class RecordingSink : public AlertSink {
public:
    bool send(const Alert& alert) override {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(alert);
        return true;
    }

    std::vector<Alert> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    std::mutex mutex_;
    std::vector<Alert> received_;
};

Alert make_alert(const std::string& category, bool force = false) {
    Alert alert;
    alert.category = category;
    alert.text = category + " text";
    alert.force = force;
    return alert;
}

}

class ThrottledAlertSinkTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingSink> inner_ = std::make_shared<RecordingSink>();
    std::chrono::steady_clock::time_point now_ = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
    ThrottledAlertSink sink_{inner_, std::chrono::seconds(10), [this] { return now_; }};
};

TEST_F(ThrottledAlertSinkTest, SecondAlertInWindowIsSuppressed) {
    EXPECT_TRUE(sink_.send(make_alert("trade_open")));
    now_ += std::chrono::seconds(3);
    EXPECT_FALSE(sink_.send(make_alert("trade_open")));

    EXPECT_EQ(inner_->received().size(), 1u);
    EXPECT_EQ(sink_.suppressed(), 1);
}

TEST_F(ThrottledAlertSinkTest, CategoriesAreThrottledIndependently) {
    EXPECT_TRUE(sink_.send(make_alert("trade_open")));
    EXPECT_TRUE(sink_.send(make_alert("trade_resolve")));
    EXPECT_EQ(inner_->received().size(), 2u);
}

TEST_F(ThrottledAlertSinkTest, WindowReopensAfterInterval) {
    EXPECT_TRUE(sink_.send(make_alert("venue_error")));
    now_ += std::chrono::seconds(10);
    EXPECT_TRUE(sink_.send(make_alert("venue_error")));
}

TEST_F(ThrottledAlertSinkTest, ForcedAlertsBypassTheThrottle) {
    EXPECT_TRUE(sink_.send(make_alert("survival")));
    EXPECT_TRUE(sink_.send(make_alert("survival", true)));
    EXPECT_TRUE(sink_.send(make_alert("survival", true)));
    EXPECT_EQ(inner_->received().size(), 3u);
}

TEST(FanoutAlertSinkTest, DeliversToEveryChild) {
    auto first = std::make_unique<RecordingSink>();
    auto second = std::make_unique<RecordingSink>();
    auto* first_ptr = first.get();
    auto* second_ptr = second.get();

    FanoutAlertSink fanout;
    fanout.add(std::move(first));
    fanout.add(std::move(second));

    EXPECT_TRUE(fanout.send(make_alert("system")));
    EXPECT_EQ(first_ptr->received().size(), 1u);
    EXPECT_EQ(second_ptr->received().size(), 1u);
}

TEST(AsyncAlertSinkTest, StopDeliversQueuedAlerts) {
    auto inner = std::make_shared<RecordingSink>();
    AsyncAlertSink sink(inner);
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(sink.send(make_alert("trade_open")));
    }
    sink.stop();

    EXPECT_EQ(inner->received().size(), 5u);
    EXPECT_FALSE(sink.send(make_alert("trade_open")));
}
