#include "stream_core/snipe.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "stream_core/stats.hpp"

namespace stream_core {

double SurvivalModel::hazard(HazardTier tier) const {
  const auto idx = static_cast<std::size_t>(tier);
  return cfg_.tier_lambda.at(idx) * cfg_.league_activity;
}

double SurvivalModel::survival(HazardTier tier, double days) const {
  if (days <= 0.0)
    return 1.0;
  return std::exp(-hazard(tier) * days);
}

double SurvivalModel::value_with_snipe_risk(double value, HazardTier tier, double days,
                                            double backup_value) const {
  const double s = survival(tier, days);
  return s * value + (1.0 - s) * backup_value;
}

ActDecision SurvivalModel::should_act_now(const std::string &id, double value,
                                          HazardTier tier, int days_until_needed,
                                          double option_value) const {
  ActDecision d;
  d.option_value = option_value;
  if (days_until_needed <= 0) {
    d.act_now = true;
    d.snipe_probability = 0.0;
    d.reason = fmt::format("ADD NOW: {} is needed today", id);
    return d;
  }
  d.snipe_probability = snipe_probability(tier, days_until_needed);
  d.expected_loss = d.snipe_probability * value;
  d.act_now = d.expected_loss > option_value;
  if (d.act_now) {
    d.reason = fmt::format(
        "ADD NOW: {} has {:.0f}% snipe risk over {} days; expected loss {:.1f} > "
        "option value {:.1f}",
        id, d.snipe_probability * 100.0, days_until_needed, d.expected_loss, option_value);
  } else {
    d.reason = fmt::format(
        "WAIT: {} has {:.0f}% snipe risk; expected loss {:.1f} <= option value {:.1f}",
        id, d.snipe_probability * 100.0, d.expected_loss, option_value);
  }
  return d;
}

double SurvivalModel::urgency(double value, HazardTier tier, int days_until_needed) const {
  if (days_until_needed <= 0)
    return value * cfg_.must_act_multiplier;
  return value * hazard(tier) / static_cast<double>(days_until_needed);
}

double ThresholdCalculator::threshold(int day, int budget_remaining, int total_days) const {
  const int last = std::max(total_days - 1, 0);
  const int d = std::clamp(day, 0, last);
  const double frac = last > 0 ? static_cast<double>(d) / static_cast<double>(last) : 0.0;

  if (history_.empty())
    return cfg_.base_threshold * (1.0 - cfg_.no_history_decline * frac);

  const double q = cfg_.early_percentile -
                   (cfg_.early_percentile - cfg_.late_percentile) * frac;
  double t = percentile(history_, q);
  // Fewer units left raises the bar
  if (budget_remaining <= 1)
    t *= cfg_.scarce_budget_mult;
  else if (budget_remaining >= 4)
    t *= cfg_.abundant_budget_mult;
  return t;
}

double ThresholdCalculator::option_value(int day, int budget_remaining,
                                         int total_days) const {
  const int last = total_days - 1;
  if (budget_remaining <= 1 || day >= last || last <= 0)
    return 0.0;
  const double future = history_.empty() ? cfg_.base_threshold
                                         : percentile(history_, cfg_.option_percentile);
  const double b = static_cast<double>(budget_remaining);
  const double days_left = static_cast<double>(last - std::max(day, 0));
  return future * (b - 1.0) / b * (days_left / static_cast<double>(last));
}

int recommended_reserve(const ThresholdConfig &cfg, int n_injured, int n_day_to_day) {
  const double p = std::min(0.9, cfg.emergency_rate + 0.15 * std::max(n_injured, 0) +
                                     0.20 * std::max(n_day_to_day, 0));
  if (p < 0.3)
    return 0;
  if (p < 0.6)
    return 1;
  return 2;
}

ReserveDecision should_use_budget(const ThresholdConfig &cfg, double value,
                                  int budget_remaining, int reserve) {
  ReserveDecision d;
  const int buffer = budget_remaining - reserve;
  if (buffer > 0) {
    d.reason = fmt::format("Buffer available ({} above reserve)", buffer);
    return d;
  }
  d.use = value > cfg.cost_underage;
  if (d.use) {
    d.reason = fmt::format("Value {:.1f} exceeds reserve threshold {:.1f}", value,
                           cfg.cost_underage);
  } else {
    d.reason = fmt::format("Reserving unit (value {:.1f} < {:.1f})", value,
                           cfg.cost_underage);
  }
  return d;
}

} // namespace stream_core
