#include "survival_brain.hpp"
#include "test_support.hpp"
#include "util.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <random>
#include <thread>

using testing_support::make_signal;

class SurvivalBrainTest : public ::testing::Test {
protected:
    void report(const std::string& pattern) {
        for (char c : pattern) {
            bool won = c == 'W';
            brain_.report_outcome("T" + std::to_string(next_id_++), won, won ? 1.0 : -1.0);
        }
    }

    Config config_;
    SurvivalBrain brain_{config_};
    int next_id_ = 0;
};

TEST_F(SurvivalBrainTest, StartsHealthyAtBaseline) {
    auto state = brain_.snapshot();
    EXPECT_EQ(state.tier, Tier::Healthy);
    EXPECT_DOUBLE_EQ(state.kelly_multiplier, 1.0);
    EXPECT_DOUBLE_EQ(state.edge_threshold, 2.0);
    EXPECT_DOUBLE_EQ(state.capital_estimate, 100.0);
}

TEST_F(SurvivalBrainTest, FourLossesWound) {
    report("LLL");
    EXPECT_EQ(brain_.tier(), Tier::Healthy);

    report("L");
    auto state = brain_.snapshot();
    EXPECT_EQ(state.tier, Tier::Wounded);
    EXPECT_DOUBLE_EQ(state.kelly_multiplier, 0.5);
    EXPECT_DOUBLE_EQ(state.edge_threshold, 3.0);
    EXPECT_EQ(state.consecutive_losses, 4);
    EXPECT_DOUBLE_EQ(state.capital_estimate, 96.0);
}

TEST_F(SurvivalBrainTest, ThreeWinsRecoverFromWounded) {
    report("LLLLWW");
    EXPECT_EQ(brain_.tier(), Tier::Wounded);

    report("W");
    EXPECT_EQ(brain_.tier(), Tier::Healthy);
    EXPECT_DOUBLE_EQ(brain_.kelly_multiplier(), 1.0);
    EXPECT_DOUBLE_EQ(brain_.edge_threshold(), 2.0);
}

TEST_F(SurvivalBrainTest, LossResetsRecoveryStreak) {
    report("LLLLWWLWW");
    EXPECT_EQ(brain_.tier(), Tier::Wounded);
}

TEST_F(SurvivalBrainTest, SustainedWinningThrives) {
    report("WWWWWWWWW");
    EXPECT_EQ(brain_.tier(), Tier::Healthy);

    report("W");
    EXPECT_EQ(brain_.tier(), Tier::Thriving);
    EXPECT_DOUBLE_EQ(brain_.kelly_multiplier(), 1.25);
    EXPECT_DOUBLE_EQ(brain_.edge_threshold(), 1.5);
}

TEST_F(SurvivalBrainTest, LossStreakWhileThrivingWounds) {
    report("WWWWWWWWWW");
    ASSERT_EQ(brain_.tier(), Tier::Thriving);

    report("LLLL");
    EXPECT_EQ(brain_.tier(), Tier::Wounded);
    EXPECT_DOUBLE_EQ(brain_.kelly_multiplier(), 0.5);
    EXPECT_DOUBLE_EQ(brain_.edge_threshold(), 3.0);
}

TEST_F(SurvivalBrainTest, FadingWinRateDropsThrivingToHealthy) {
    report("WWWWWWWWWW");
    ASSERT_EQ(brain_.tier(), Tier::Thriving);

    report("LLLWLLLWLLL");
    EXPECT_EQ(brain_.tier(), Tier::Healthy);
    EXPECT_DOUBLE_EQ(brain_.kelly_multiplier(), 1.0);
    EXPECT_DOUBLE_EQ(brain_.edge_threshold(), 2.0);
}

TEST_F(SurvivalBrainTest, DuplicateTradeIdIsIgnored) {
    EXPECT_TRUE(brain_.report_outcome("T1", false, -1.0));
    auto before = brain_.snapshot();

    EXPECT_FALSE(brain_.report_outcome("T1", false, -1.0));
    auto after = brain_.snapshot();

    EXPECT_EQ(after.history.size(), before.history.size());
    EXPECT_EQ(after.consecutive_losses, before.consecutive_losses);
    EXPECT_DOUBLE_EQ(after.capital_estimate, before.capital_estimate);
}

TEST_F(SurvivalBrainTest, HistoryIsBounded) {
    for (int i = 0; i < 3 * config_.history_size; ++i) {
        brain_.report_outcome("T" + std::to_string(i), i % 2 == 0, 0.5);
    }
    auto state = brain_.snapshot();
    EXPECT_EQ(state.history.size(), static_cast<std::size_t>(config_.history_size));
    EXPECT_EQ(state.history.back().trade_id, "T" + std::to_string(3 * config_.history_size - 1));
}

TEST_F(SurvivalBrainTest, RandomOutcomesKeepStateWithinBounds) {
    config_.thrive_kelly_boost = 1.9;
    config_.thrive_edge_decrement = 3.0;
    config_.wound_edge_increment = 20.0;
    config_.thrive_min_samples = 3;
    SurvivalBrain brain(config_);

    std::mt19937 rng(1234);
    std::bernoulli_distribution win(0.55);
    for (int i = 0; i < 2000; ++i) {
        brain.report_outcome("R" + std::to_string(i), win(rng), 1.0);
        auto state = brain.snapshot();
        ASSERT_GE(state.kelly_multiplier, 0.0);
        ASSERT_LE(state.kelly_multiplier, config_.kelly_max);
        ASSERT_GE(state.edge_threshold, config_.edge_threshold_floor);
        ASSERT_LE(state.edge_threshold, config_.edge_threshold_ceiling);
        ASSERT_LE(state.history.size(), static_cast<std::size_t>(config_.history_size));
    }
}

TEST_F(SurvivalBrainTest, ApproveRejectsWeakEdge) {
    auto approval = brain_.approve(make_signal("m1", 1.5), 0);
    EXPECT_FALSE(approval.approved);
    EXPECT_DOUBLE_EQ(approval.size_fraction, 0.0);
}

TEST_F(SurvivalBrainTest, ApproveRejectsAtConcurrencyLimit) {
    auto approval = brain_.approve(make_signal("m1", 5.0), config_.max_concurrent_positions);
    EXPECT_FALSE(approval.approved);
}

TEST_F(SurvivalBrainTest, ApproveSizesWithKelly) {
    auto approval = brain_.approve(make_signal("m1", 5.0, 0.45, 0.8), 0);
    ASSERT_TRUE(approval.approved);
    // 0.5 * 0.05 * (0.5 + 0.4)
    EXPECT_NEAR(approval.size_fraction, 0.0225, 1e-9);
}

TEST_F(SurvivalBrainTest, ApproveClampsToMaxBet) {
    auto approval = brain_.approve(make_signal("m1", 400.0, 0.45, 1.0), 0);
    ASSERT_TRUE(approval.approved);
    EXPECT_DOUBLE_EQ(approval.size_fraction, config_.max_bet_pct / 100.0);
}

TEST_F(SurvivalBrainTest, WoundedBrainRaisesTheBar) {
    report("LLLL");
    EXPECT_FALSE(brain_.approve(make_signal("m1", 2.5), 0).approved);

    auto approval = brain_.approve(make_signal("m1", 5.0, 0.45, 0.8), 0);
    ASSERT_TRUE(approval.approved);
    EXPECT_NEAR(approval.size_fraction, 0.01125, 1e-9);
}

TEST_F(SurvivalBrainTest, TransitionListenerSeesNewTier) {
    std::vector<TierTransition> seen;
    Tier state_tier = Tier::Healthy;
    brain_.set_transition_listener([&](const TierTransition& t, const SurvivalState& s) {
        seen.push_back(t);
        state_tier = s.tier;
    });

    report("LLLL");
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].from, Tier::Healthy);
    EXPECT_EQ(seen[0].to, Tier::Wounded);
    EXPECT_EQ(seen[0].trade_id, "T3");
    EXPECT_EQ(state_tier, Tier::Wounded);
    EXPECT_EQ(brain_.transitions().size(), 1u);
}

TEST_F(SurvivalBrainTest, RestoreReplaysOutcomesInOrder) {
    std::vector<OutcomeRecord> records;
    for (int i = 0; i < 4; ++i) {
        records.push_back(OutcomeRecord{"P" + std::to_string(i), false, -2.0, Clock::now()});
    }
    records.push_back(records.front());

    int notifications = 0;
    brain_.set_transition_listener([&](const TierTransition&, const SurvivalState&) { notifications++; });
    brain_.restore(records);

    auto state = brain_.snapshot();
    EXPECT_EQ(state.tier, Tier::Wounded);
    EXPECT_EQ(state.history.size(), 4u);
    EXPECT_DOUBLE_EQ(state.capital_estimate, 92.0);
    EXPECT_EQ(notifications, 0);

    EXPECT_FALSE(brain_.report_outcome("P0", false, -2.0));
}

namespace {
OutcomeRecord patterned(const std::string& id, bool won, double edge_pct, TimePoint opened_at) {
    OutcomeRecord record;
    record.trade_id = id;
    record.won = won;
    record.pnl = won ? 1.0 : -1.0;
    record.recorded_at = opened_at + std::chrono::minutes(15);
    record.edge_pct = edge_pct;
    record.direction = edge_pct > 0.0 ? Direction::Yes : Direction::No;
    record.opened_at = opened_at;
    return record;
}
}

TEST_F(SurvivalBrainTest, LosingPatternIsFiltered) {
    config_.min_pattern_samples = 5;
    config_.min_pattern_win_rate = 0.4;
    auto opened = util::parse_iso8601("2026-01-01T14:05:00Z");

    brain_.report_outcome(patterned("P0", true, 6.0, opened));
    for (int i = 1; i < 5; ++i) {
        brain_.report_outcome(patterned("P" + std::to_string(i), false, 6.0, opened));
    }
    auto patterns = brain_.snapshot().patterns;
    ASSERT_EQ(patterns.count("14|YES|5-10%"), 1u);
    EXPECT_EQ(patterns["14|YES|5-10%"].samples(), 5);
    EXPECT_DOUBLE_EQ(patterns["14|YES|5-10%"].win_rate(), 0.2);

    auto same = make_signal("m1", 6.0);
    same.observed_at = opened + std::chrono::minutes(30);
    auto rejected = brain_.approve(same, 0);
    EXPECT_FALSE(rejected.approved);
    EXPECT_NE(rejected.reason.find("14|YES|5-10%"), std::string::npos);

    auto later = same;
    later.observed_at = opened + std::chrono::hours(2);
    EXPECT_TRUE(brain_.approve(later, 0).approved);

    auto other_side = make_signal("m1", -6.0);
    other_side.observed_at = same.observed_at;
    EXPECT_TRUE(brain_.approve(other_side, 0).approved);

    auto other_bucket = make_signal("m1", 12.0);
    other_bucket.observed_at = same.observed_at;
    EXPECT_TRUE(brain_.approve(other_bucket, 0).approved);
}

TEST_F(SurvivalBrainTest, PatternNeedsEnoughSamples) {
    config_.min_pattern_samples = 5;
    auto opened = util::parse_iso8601("2026-01-01T09:00:00Z");
    for (int i = 0; i < 4; ++i) {
        brain_.report_outcome(patterned("Q" + std::to_string(i), false, 6.0, opened));
    }

    auto signal = make_signal("m1", 6.0);
    signal.observed_at = opened;
    EXPECT_TRUE(brain_.approve(signal, 0).approved);

    brain_.report_outcome(patterned("Q4", false, 6.0, opened));
    EXPECT_FALSE(brain_.approve(signal, 0).approved);

    config_.min_pattern_samples = 0;
    EXPECT_TRUE(brain_.approve(signal, 0).approved);
}

TEST_F(SurvivalBrainTest, RestoreRebuildsPatterns) {
    auto opened = util::parse_iso8601("2026-01-01T03:00:00Z");
    std::vector<OutcomeRecord> records = {
        patterned("R1", true, -3.0, opened),
        patterned("R2", false, -3.5, opened),
    };
    brain_.restore(records);

    auto patterns = brain_.snapshot().patterns;
    ASSERT_EQ(patterns.count("3|NO|2-5%"), 1u);
    EXPECT_EQ(patterns["3|NO|2-5%"].wins, 1);
    EXPECT_EQ(patterns["3|NO|2-5%"].losses, 1);
}

TEST_F(SurvivalBrainTest, ConcurrentOutcomesAreAllCounted) {
    const int threads = 4;
    const int per_thread = 50;
    std::atomic<int> bad_sizes{0};
    std::vector<std::thread> workers;

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < per_thread; ++i) {
                brain_.report_outcome("C" + std::to_string(t) + "_" + std::to_string(i), true, 1.0);
                auto approval = brain_.approve(make_signal("m" + std::to_string(t), 5.0), 0);
                if (approval.size_fraction < 0.0 || approval.size_fraction > config_.max_bet_pct / 100.0) {
                    bad_sizes++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto state = brain_.snapshot();
    EXPECT_EQ(state.consecutive_wins, threads * per_thread);
    EXPECT_EQ(state.consecutive_losses, 0);
    EXPECT_EQ(state.history.size(), static_cast<std::size_t>(config_.history_size));
    EXPECT_DOUBLE_EQ(state.capital_estimate, config_.initial_capital + threads * per_thread);
    EXPECT_EQ(state.tier, Tier::Thriving);
    EXPECT_EQ(bad_sizes.load(), 0);
}

TEST_F(SurvivalBrainTest, RacingDuplicatesRecordOnce) {
    std::atomic<int> accepted{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&]() {
            if (brain_.report_outcome("SAME", false, -1.0)) {
                accepted++;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(brain_.snapshot().history.size(), 1u);
    EXPECT_EQ(brain_.snapshot().consecutive_losses, 1);
}
