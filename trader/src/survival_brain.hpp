#pragma once

#include "config.hpp"
#include "types.hpp"
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

// Adaptive risk controller shared by the live and paper paths.
// Every public method takes the same mutex, so approve() and
// report_outcome() never interleave a read-modify-write.
class SurvivalBrain {
public:
    struct Approval {
        bool approved = false;
        double size_fraction = 0.0;
        std::string reason;
    };

    using TransitionListener = std::function<void(const TierTransition&, const SurvivalState&)>;

    explicit SurvivalBrain(const Config& config);

    // Gate and size a signal given the caller's current open-position count
    Approval approve(const EdgeSignal& signal, int open_positions);

    // Record a resolved trade; false when the id was already recorded
    bool report_outcome(const OutcomeRecord& record);
    bool report_outcome(const std::string& trade_id, bool won, double pnl,
                        TimePoint at = Clock::now());

    // Rebuild state from persisted outcomes, oldest first
    void restore(const std::vector<OutcomeRecord>& records);

    SurvivalState snapshot() const;
    Tier tier() const;
    double edge_threshold() const;
    double kelly_multiplier() const;
    std::vector<TierTransition> transitions() const;

    // Invoked after a tier change, outside the brain's lock
    void set_transition_listener(TransitionListener listener);

    // Unscaled Kelly fraction for a signal
    double kelly_fraction(double confidence, double edge_pct) const;

    // "<utc hour>|<side>|<edge bucket>"
    static std::string pattern_key(int utc_hour, Direction direction, double edge_pct);

private:
    // Require mutex_ held
    bool apply_outcome(const OutcomeRecord& record, std::optional<TierTransition>& transition);
    void enter_tier(Tier next);
    SurvivalState make_state() const;

    double history_win_rate() const;

    const Config& config_;
    mutable std::mutex mutex_;

    Tier tier_ = Tier::Healthy;
    double capital_estimate_;
    int consecutive_losses_ = 0;
    int consecutive_wins_ = 0;
    double edge_threshold_;
    double kelly_multiplier_ = 1.0;

    std::deque<OutcomeRecord> history_;
    std::unordered_set<std::string> recorded_ids_;
    std::deque<std::string> recorded_order_;
    std::size_t recorded_capacity_;

    std::map<std::string, PatternStats> patterns_;

    std::deque<TierTransition> transitions_;
    TransitionListener listener_;
};
