#pragma once

#include <array>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "stream_core/candidate.hpp"

namespace stream_core {

// Fantasy points per unit of each event type.
struct ScoringConfig {
  double per_duration_unit{5.0};
  double per_positive{2.0};
  double per_walk{-3.0};
  double per_negative{-13.0};
  double per_hit{-1.0};
};

struct RiskConfig {
  double risk_aversion{1.0};
  double catastrophe_penalty{30.0};
  int disaster_threshold{3};
  // Hard filters
  double max_disaster_prob{0.30};
  double max_blowup_prob{0.50};
  double min_sample_units{10.0};
  // Tier cut-offs on disaster probability
  double elite_below{0.05};
  double safe_below{0.10};
  double moderate_below{0.15};
  double risky_below{0.25};
  // Adjusted negative rate is clamped into [min, max] per 9 units
  double min_adjusted_rate{0.5};
  double max_adjusted_rate{3.0};
  double ground_ball_factor{0.85};
  double fly_ball_factor{1.15};
  double max_duration{9.0};
  double min_floor_duration{2.0};
  // Substituted when a candidate arrives without rate stats
  RateStats missing_defaults{1.3, 8.0, 3.2, 8.5, 0.0};
};

struct BanditConfig {
  int feature_dim{10};
  double alpha{1.0};
  double lambda_reg{1.0};
  double max_exploration_scale{2.0};
  double exhausted_time_scale{0.1};
  double urgency_weight{5.0};
};

struct BeliefConfig {
  double prior_variance{64.0};
  double observation_variance{100.0};
};

struct SnipeConfig {
  double league_activity{1.0};
  // Daily hazard per HazardTier, Elite first
  std::array<double, 5> tier_lambda{{0.45, 0.28, 0.15, 0.08, 0.03}};
  double must_act_multiplier{10.0};
  int max_snipe_alerts{10};
};

struct ThresholdConfig {
  double base_threshold{40.0};
  double early_percentile{90.0};
  double late_percentile{50.0};
  double option_percentile{75.0};
  double no_history_decline{0.6};
  double scarce_budget_mult{1.2};
  double abundant_budget_mult{0.9};
  // Newsvendor reserve
  double cost_underage{15.0};
  double cost_overage{5.0};
  double emergency_rate{0.3};
};

struct HorizonConfig {
  int days{7};
  int budget{5};
  int reserve{0};
  int default_capacity{2};
  std::vector<int> capacity; // per day; empty means default_capacity

  std::vector<int> resolved_capacity() const {
    if (!capacity.empty())
      return capacity;
    return std::vector<int>(static_cast<std::size_t>(days > 0 ? days : 0),
                            default_capacity);
  }
};

// Subsets are enumerated as bits of a 64-bit mask.
constexpr int kMaxBruteForceCandidates = 63;

struct SolverConfig {
  double time_limit_ms{1000.0};
  double value_scale{10.0};
  int max_backups{5};
  int max_contingencies{5};
  int brute_force_max_candidates{20};
};

struct EngineConfig {
  ScoringConfig scoring{};
  RiskConfig risk{};
  BanditConfig bandit{};
  BeliefConfig belief{};
  SnipeConfig snipe{};
  ThresholdConfig threshold{};
  HorizonConfig horizon{};
  SolverConfig solver{};
};

// Throws InvalidInput on values the engine cannot run with.
void validate(const EngineConfig &cfg);

// Every key is optional; unknown keys are ignored.
EngineConfig engine_config_from_json(const nlohmann::json &j);
EngineConfig load_engine_config(const std::string &path);

} // namespace stream_core
