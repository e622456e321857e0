#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "stream_core/candidate.hpp"
#include "stream_core/config.hpp"
#include "stream_core/errors.hpp"
#include "stream_core/risk.hpp"

namespace stream_core {

// A candidate after risk and bandit scoring, ready for selection.
struct ScoredCandidate {
  std::string id;
  std::vector<int> days;
  double value_per_day{0.0};
  RiskTier tier{RiskTier::Moderate};
  HazardTier hazard{HazardTier::Moderate};
  bool low_confidence{false};

  // Bundled: per-day value on every occupied day.
  double total_value() const { return value_per_day * static_cast<double>(days.size()); }
};

struct SlotProblem {
  std::vector<ScoredCandidate> candidates;
  std::vector<int> capacity; // free slots per horizon day
  int budget{0};
};

struct PlannedPick {
  std::string id;
  std::vector<int> days;
  double value{0.0};
  int commit_day{0}; // one day before the first occupied day, never negative
  HazardTier hazard{HazardTier::Moderate};
};

struct OptimizationResult {
  std::vector<PlannedPick> selected;
  double total_value{0.0};
  std::int64_t objective{0}; // scaled integer objective actually maximized
  std::vector<PlannedPick> backups;
  bool optimal{true};
  double solve_ms{0.0};
  std::int64_t nodes{0};
  std::vector<EngineWarning> warnings;

  bool contains(const std::string &id) const;
};

struct Contingency {
  std::string if_sniped;
  std::vector<std::string> fallbacks;
  double value_lost{0.0};
};

class SlotOptimizer {
public:
  explicit SlotOptimizer(SolverConfig cfg = {}) : cfg_(cfg) {}

  // Exact maximization of the scaled objective under budget and per-day
  // capacity. NO-GO and non-positive candidates are never selected.
  OptimizationResult solve(const SlotProblem &p) const;

  // Enumerates every subset; throws InvalidInput above
  // brute_force_max_candidates eligible candidates.
  OptimizationResult solve_brute_force(const SlotProblem &p) const;

  // For the most snipe-exposed picks: what replaces each one if it is lost.
  std::vector<Contingency> plan_contingencies(const SlotProblem &p,
                                              const OptimizationResult &base) const;

  const SolverConfig &config() const { return cfg_; }

private:
  SolverConfig cfg_{};
};

// Throws InvalidInput on negative budget/capacity, out-of-horizon days,
// empty or repeated day sets and duplicate ids.
void check_problem(const SlotProblem &p);

} // namespace stream_core
