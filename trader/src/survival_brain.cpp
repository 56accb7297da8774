#include "survival_brain.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace {
constexpr std::size_t kMaxTransitions = 100;
constexpr double kBaselineMultiplier = 1.0;
}

SurvivalBrain::SurvivalBrain(const Config& config)
    : config_(config),
      capital_estimate_(config.initial_capital),
      edge_threshold_(config.min_edge_pct),
      recorded_capacity_(std::max<std::size_t>(static_cast<std::size_t>(config.history_size) * 20, 1000)) {
    spdlog::info("SurvivalBrain initialised: tier={} threshold={:.2f}% kelly={:.2f}",
                 to_string(tier_), edge_threshold_, kelly_multiplier_);
}

SurvivalBrain::Approval SurvivalBrain::approve(const EdgeSignal& signal, int open_positions) {
    std::lock_guard<std::mutex> lock(mutex_);

    Approval approval;
    if (signal.magnitude() < edge_threshold_) {
        approval.reason = fmt::format("edge {:.2f}% below threshold {:.2f}%",
                                      signal.magnitude(), edge_threshold_);
        return approval;
    }

    if (config_.min_pattern_samples > 0) {
        auto key = pattern_key(util::utc_hour(signal.observed_at), signal.direction, signal.edge_pct);
        auto pattern = patterns_.find(key);
        if (pattern != patterns_.end() &&
            pattern->second.samples() >= config_.min_pattern_samples &&
            pattern->second.win_rate() < config_.min_pattern_win_rate) {
            approval.reason = fmt::format("pattern {} filtered: {:.0f}% win rate over {} trades",
                                          key, pattern->second.win_rate() * 100.0,
                                          pattern->second.samples());
            return approval;
        }
    }

    if (open_positions >= config_.max_concurrent_positions) {
        approval.reason = fmt::format("concurrency limit {} reached", config_.max_concurrent_positions);
        return approval;
    }

    double raw = kelly_multiplier_ * kelly_fraction(signal.confidence, signal.edge_pct);
    approval.size_fraction = std::clamp(raw, 0.0, config_.max_bet_pct / 100.0);
    if (approval.size_fraction <= 0.0) {
        approval.reason = "zero size";
        return approval;
    }

    approval.approved = true;
    approval.reason = to_string(tier_);
    return approval;
}

bool SurvivalBrain::report_outcome(const std::string& trade_id, bool won, double pnl, TimePoint at) {
    OutcomeRecord record;
    record.trade_id = trade_id;
    record.won = won;
    record.pnl = pnl;
    record.recorded_at = at;
    return report_outcome(record);
}

bool SurvivalBrain::report_outcome(const OutcomeRecord& record) {
    std::optional<TierTransition> transition;
    SurvivalState state;
    TransitionListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!apply_outcome(record, transition)) {
            spdlog::debug("Outcome for {} already recorded, ignoring duplicate", record.trade_id);
            return false;
        }

        spdlog::info("Outcome {} {} pnl={:+.2f} | tier={} streak W{}/L{} threshold={:.2f}% kelly={:.2f}",
                     record.trade_id, record.won ? "WIN" : "LOSS", record.pnl, to_string(tier_),
                     consecutive_wins_, consecutive_losses_, edge_threshold_, kelly_multiplier_);

        if (transition) {
            state = make_state();
            listener = listener_;
        }
    }

    if (transition && listener) {
        listener(*transition, state);
    }
    return true;
}

void SurvivalBrain::restore(const std::vector<OutcomeRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);

    int applied = 0;
    for (const auto& record : records) {
        std::optional<TierTransition> transition;
        if (apply_outcome(record, transition)) {
            applied++;
        }
    }

    spdlog::info("SurvivalBrain restored {} outcomes: tier={} threshold={:.2f}% kelly={:.2f} capital={:.2f}",
                 applied, to_string(tier_), edge_threshold_, kelly_multiplier_, capital_estimate_);
}

SurvivalState SurvivalBrain::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return make_state();
}

Tier SurvivalBrain::tier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tier_;
}

double SurvivalBrain::edge_threshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edge_threshold_;
}

double SurvivalBrain::kelly_multiplier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kelly_multiplier_;
}

std::vector<TierTransition> SurvivalBrain::transitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {transitions_.begin(), transitions_.end()};
}

void SurvivalBrain::set_transition_listener(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

std::string SurvivalBrain::pattern_key(int utc_hour, Direction direction, double edge_pct) {
    return fmt::format("{}|{}|{}", utc_hour, to_string(direction), edge_bucket(edge_pct));
}

double SurvivalBrain::kelly_fraction(double confidence, double edge_pct) const {
    double edge_term = std::min(std::fabs(edge_pct) / 100.0 * config_.kelly_edge_gain, 1.0);
    double confidence_term = 0.5 + 0.5 * std::clamp(confidence, 0.0, 1.0);
    return config_.base_kelly_fraction * edge_term * confidence_term;
}

bool SurvivalBrain::apply_outcome(const OutcomeRecord& record, std::optional<TierTransition>& transition) {
    if (recorded_ids_.count(record.trade_id) > 0) {
        return false;
    }

    recorded_ids_.insert(record.trade_id);
    recorded_order_.push_back(record.trade_id);
    while (recorded_order_.size() > recorded_capacity_) {
        recorded_ids_.erase(recorded_order_.front());
        recorded_order_.pop_front();
    }

    history_.push_back(record);
    while (history_.size() > static_cast<std::size_t>(config_.history_size)) {
        history_.pop_front();
    }

    if (record.opened_at) {
        auto& pattern = patterns_[pattern_key(util::utc_hour(*record.opened_at), record.direction, record.edge_pct)];
        if (record.won) {
            pattern.wins++;
        } else {
            pattern.losses++;
        }
        pattern.total_pnl += record.pnl;
    }

    capital_estimate_ += record.pnl;
    if (record.won) {
        consecutive_wins_++;
        consecutive_losses_ = 0;
    } else {
        consecutive_losses_++;
        consecutive_wins_ = 0;
    }

    Tier before = tier_;
    bool loss_streak = consecutive_losses_ >= config_.wound_loss_streak;
    bool enough_samples = history_.size() >= static_cast<std::size_t>(config_.thrive_min_samples);
    double win_rate = history_win_rate();

    switch (tier_) {
        case Tier::Healthy:
            if (loss_streak) {
                enter_tier(Tier::Wounded);
            } else if (enough_samples && win_rate > config_.thrive_win_rate) {
                enter_tier(Tier::Thriving);
            }
            break;
        case Tier::Wounded:
            if (consecutive_wins_ >= config_.recover_win_streak) {
                enter_tier(Tier::Healthy);
            }
            break;
        case Tier::Thriving:
            if (loss_streak) {
                enter_tier(Tier::Wounded);
            } else if (win_rate < config_.thrive_win_rate) {
                enter_tier(Tier::Healthy);
            }
            break;
    }

    if (tier_ != before) {
        TierTransition change{before, tier_, record.trade_id, record.recorded_at};
        transitions_.push_back(change);
        while (transitions_.size() > kMaxTransitions) {
            transitions_.pop_front();
        }
        transition = change;
        spdlog::warn("Survival tier {} -> {} after {} (threshold={:.2f}% kelly={:.2f})",
                     to_string(before), to_string(tier_), record.trade_id,
                     edge_threshold_, kelly_multiplier_);
    }
    return true;
}

void SurvivalBrain::enter_tier(Tier next) {
    switch (next) {
        case Tier::Healthy:
            kelly_multiplier_ = kBaselineMultiplier;
            edge_threshold_ = config_.min_edge_pct;
            break;
        case Tier::Wounded:
            // Halved from baseline whether we fall from HEALTHY or THRIVING
            kelly_multiplier_ = kBaselineMultiplier * 0.5;
            edge_threshold_ = config_.min_edge_pct + config_.wound_edge_increment;
            break;
        case Tier::Thriving:
            kelly_multiplier_ = kelly_multiplier_ * config_.thrive_kelly_boost;
            edge_threshold_ = edge_threshold_ - config_.thrive_edge_decrement;
            break;
    }

    kelly_multiplier_ = std::clamp(kelly_multiplier_, 0.0, config_.kelly_max);
    edge_threshold_ = std::clamp(edge_threshold_, config_.edge_threshold_floor, config_.edge_threshold_ceiling);
    tier_ = next;
}

SurvivalState SurvivalBrain::make_state() const {
    SurvivalState state;
    state.tier = tier_;
    state.capital_estimate = capital_estimate_;
    state.consecutive_losses = consecutive_losses_;
    state.consecutive_wins = consecutive_wins_;
    state.edge_threshold = edge_threshold_;
    state.kelly_multiplier = kelly_multiplier_;
    state.history.assign(history_.begin(), history_.end());
    state.patterns = patterns_;
    return state;
}

double SurvivalBrain::history_win_rate() const {
    if (history_.empty()) {
        return 0.0;
    }
    auto wins = std::count_if(history_.begin(), history_.end(),
                              [](const OutcomeRecord& r) { return r.won; });
    return static_cast<double>(wins) / static_cast<double>(history_.size());
}
