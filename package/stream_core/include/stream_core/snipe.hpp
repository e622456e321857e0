#pragma once

#include <string>
#include <utility>
#include <vector>

#include "stream_core/candidate.hpp"
#include "stream_core/config.hpp"

namespace stream_core {

struct ActDecision {
  bool act_now{false};
  double snipe_probability{0.0};
  double expected_loss{0.0};
  double option_value{0.0};
  std::string reason;
};

// Competitor claims arrive as a constant-intensity Poisson process, so
// survival(t) = exp(-lambda * t).
class SurvivalModel {
public:
  explicit SurvivalModel(SnipeConfig cfg = {}) : cfg_(cfg) {}

  double hazard(HazardTier tier) const;
  double survival(HazardTier tier, double days) const;
  double snipe_probability(HazardTier tier, double days) const {
    return 1.0 - survival(tier, days);
  }

  // S * value + (1 - S) * backup_value
  double value_with_snipe_risk(double value, HazardTier tier, double days,
                               double backup_value = 0.0) const;

  // Act now when the expected loss from deferring exceeds the option value
  // of keeping the budget unit.
  ActDecision should_act_now(const std::string &id, double value, HazardTier tier,
                             int days_until_needed, double option_value) const;

  // value * hazard / days; display and ranking only.
  double urgency(double value, HazardTier tier, int days_until_needed) const;

  const SnipeConfig &config() const { return cfg_; }

private:
  SnipeConfig cfg_{};
};

// Acceptance bar that falls across the horizon, plus the option value of
// holding a budget unit for later.
class ThresholdCalculator {
public:
  explicit ThresholdCalculator(ThresholdConfig cfg = {},
                               std::vector<double> history = {})
      : cfg_(cfg), history_(std::move(history)) {}

  void add_observation(double value) { history_.push_back(value); }
  const std::vector<double> &history() const { return history_; }

  double threshold(int day, int budget_remaining, int total_days) const;
  double option_value(int day, int budget_remaining, int total_days) const;

private:
  ThresholdConfig cfg_{};
  std::vector<double> history_;
};

struct ReserveDecision {
  bool use{true};
  std::string reason;
};

// Newsvendor reserve of budget units kept back for emergencies (0..2).
int recommended_reserve(const ThresholdConfig &cfg, int n_injured, int n_day_to_day);

ReserveDecision should_use_budget(const ThresholdConfig &cfg, double value,
                                  int budget_remaining, int reserve);

} // namespace stream_core
