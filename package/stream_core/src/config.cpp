#include "stream_core/config.hpp"

#include <fstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "stream_core/errors.hpp"
#include "stream_core/log.hpp"

namespace stream_core {

namespace {

template <typename T>
void read(const nlohmann::json &j, const char *key, T &out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return;
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw InvalidInput(fmt::format("config key '{}': {}", key, e.what()));
  }
}

const nlohmann::json *section(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end())
    return nullptr;
  if (!it->is_object()) {
    throw InvalidInput(fmt::format("config section '{}' must be an object", key));
  }
  return &*it;
}

void read_rates(const nlohmann::json &j, RateStats &r) {
  read(j, "negative_per9", r.negative_per9);
  read(j, "positive_per9", r.positive_per9);
  read(j, "walk_per9", r.walk_per9);
  read(j, "hit_per9", r.hit_per9);
  read(j, "sample_units", r.sample_units);
}

} // namespace

void validate(const EngineConfig &cfg) {
  const HorizonConfig &h = cfg.horizon;
  if (h.days <= 0)
    throw InvalidInput("horizon.days must be positive");
  if (h.budget < 0)
    throw InvalidInput("horizon.budget must be non-negative");
  if (h.reserve < 0)
    throw InvalidInput("horizon.reserve must be non-negative");
  if (!h.capacity.empty() && static_cast<int>(h.capacity.size()) != h.days) {
    throw InvalidInput(fmt::format("horizon.capacity has {} entries for {} days",
                                   h.capacity.size(), h.days));
  }
  for (const int c : h.resolved_capacity()) {
    if (c < 0)
      throw InvalidInput("horizon.capacity entries must be non-negative");
  }
  if (cfg.bandit.feature_dim <= 0)
    throw InvalidInput("bandit.feature_dim must be positive");
  if (cfg.bandit.lambda_reg <= 0.0)
    throw InvalidInput("bandit.lambda_reg must be positive");
  if (cfg.bandit.alpha < 0.0)
    throw InvalidInput("bandit.alpha must be non-negative");
  if (cfg.belief.prior_variance <= 0.0 || cfg.belief.observation_variance <= 0.0)
    throw InvalidInput("belief variances must be positive");
  if (cfg.solver.time_limit_ms <= 0.0)
    throw InvalidInput("solver.time_limit_ms must be positive");
  if (cfg.solver.value_scale <= 0.0)
    throw InvalidInput("solver.value_scale must be positive");
  if (cfg.solver.brute_force_max_candidates < 0 ||
      cfg.solver.brute_force_max_candidates > kMaxBruteForceCandidates) {
    throw InvalidInput(fmt::format("solver.brute_force_max_candidates must be in [0, {}]",
                                   kMaxBruteForceCandidates));
  }
  if (cfg.risk.disaster_threshold < 1)
    throw InvalidInput("risk.disaster_threshold must be at least 1");
  if (cfg.risk.min_adjusted_rate > cfg.risk.max_adjusted_rate)
    throw InvalidInput("risk adjusted-rate bounds are inverted");
  for (const double l : cfg.snipe.tier_lambda) {
    if (l <= 0.0)
      throw InvalidInput("snipe.tier_lambda entries must be positive");
  }
}

EngineConfig engine_config_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    throw InvalidInput("engine config must be a JSON object");
  EngineConfig cfg;

  if (const auto *s = section(j, "scoring")) {
    read(*s, "per_duration_unit", cfg.scoring.per_duration_unit);
    read(*s, "per_positive", cfg.scoring.per_positive);
    read(*s, "per_walk", cfg.scoring.per_walk);
    read(*s, "per_negative", cfg.scoring.per_negative);
    read(*s, "per_hit", cfg.scoring.per_hit);
  }
  if (const auto *s = section(j, "risk")) {
    RiskConfig &r = cfg.risk;
    read(*s, "risk_aversion", r.risk_aversion);
    read(*s, "catastrophe_penalty", r.catastrophe_penalty);
    read(*s, "disaster_threshold", r.disaster_threshold);
    read(*s, "max_disaster_prob", r.max_disaster_prob);
    read(*s, "max_blowup_prob", r.max_blowup_prob);
    read(*s, "min_sample_units", r.min_sample_units);
    read(*s, "elite_below", r.elite_below);
    read(*s, "safe_below", r.safe_below);
    read(*s, "moderate_below", r.moderate_below);
    read(*s, "risky_below", r.risky_below);
    read(*s, "min_adjusted_rate", r.min_adjusted_rate);
    read(*s, "max_adjusted_rate", r.max_adjusted_rate);
    read(*s, "ground_ball_factor", r.ground_ball_factor);
    read(*s, "fly_ball_factor", r.fly_ball_factor);
    read(*s, "max_duration", r.max_duration);
    read(*s, "min_floor_duration", r.min_floor_duration);
    if (const auto *d = section(*s, "missing_defaults"))
      read_rates(*d, r.missing_defaults);
  }
  if (const auto *s = section(j, "bandit")) {
    read(*s, "feature_dim", cfg.bandit.feature_dim);
    read(*s, "alpha", cfg.bandit.alpha);
    read(*s, "lambda_reg", cfg.bandit.lambda_reg);
    read(*s, "max_exploration_scale", cfg.bandit.max_exploration_scale);
    read(*s, "exhausted_time_scale", cfg.bandit.exhausted_time_scale);
    read(*s, "urgency_weight", cfg.bandit.urgency_weight);
  }
  if (const auto *s = section(j, "belief")) {
    read(*s, "prior_variance", cfg.belief.prior_variance);
    read(*s, "observation_variance", cfg.belief.observation_variance);
  }
  if (const auto *s = section(j, "snipe")) {
    read(*s, "league_activity", cfg.snipe.league_activity);
    read(*s, "tier_lambda", cfg.snipe.tier_lambda);
    read(*s, "must_act_multiplier", cfg.snipe.must_act_multiplier);
    read(*s, "max_snipe_alerts", cfg.snipe.max_snipe_alerts);
  }
  if (const auto *s = section(j, "threshold")) {
    ThresholdConfig &t = cfg.threshold;
    read(*s, "base_threshold", t.base_threshold);
    read(*s, "early_percentile", t.early_percentile);
    read(*s, "late_percentile", t.late_percentile);
    read(*s, "option_percentile", t.option_percentile);
    read(*s, "no_history_decline", t.no_history_decline);
    read(*s, "scarce_budget_mult", t.scarce_budget_mult);
    read(*s, "abundant_budget_mult", t.abundant_budget_mult);
    read(*s, "cost_underage", t.cost_underage);
    read(*s, "cost_overage", t.cost_overage);
    read(*s, "emergency_rate", t.emergency_rate);
  }
  if (const auto *s = section(j, "horizon")) {
    read(*s, "days", cfg.horizon.days);
    read(*s, "budget", cfg.horizon.budget);
    read(*s, "reserve", cfg.horizon.reserve);
    read(*s, "default_capacity", cfg.horizon.default_capacity);
    read(*s, "capacity", cfg.horizon.capacity);
  }
  if (const auto *s = section(j, "solver")) {
    read(*s, "time_limit_ms", cfg.solver.time_limit_ms);
    read(*s, "value_scale", cfg.solver.value_scale);
    read(*s, "max_backups", cfg.solver.max_backups);
    read(*s, "max_contingencies", cfg.solver.max_contingencies);
    read(*s, "brute_force_max_candidates", cfg.solver.brute_force_max_candidates);
  }

  validate(cfg);
  return cfg;
}

EngineConfig load_engine_config(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw InvalidInput(fmt::format("cannot open engine config '{}'", path));
  }
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error &e) {
    throw InvalidInput(fmt::format("engine config '{}': {}", path, e.what()));
  }
  log_info("loaded engine config from {}", path);
  return engine_config_from_json(j);
}

} // namespace stream_core
