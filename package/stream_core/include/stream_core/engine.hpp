#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "stream_core/bandit.hpp"
#include "stream_core/bayes.hpp"
#include "stream_core/candidate.hpp"
#include "stream_core/config.hpp"
#include "stream_core/horizon.hpp"
#include "stream_core/optimizer.hpp"
#include "stream_core/risk.hpp"
#include "stream_core/snipe.hpp"

namespace stream_core {

// Everything learned across horizons. Owned by the caller: handed to the
// engine at construction, read back through DecisionEngine::model().
struct LearnedModel {
  BanditModel bandit;
  ProjectionBook posteriors;
  std::vector<double> value_history; // realized per-day outcomes

  static LearnedModel fresh(const EngineConfig &cfg);
};

// "Is this candidate still unclaimed?"
using AvailabilityOracle = std::function<bool(const std::string &id)>;

struct UrgencyEntry {
  std::string id;
  double value{0.0};
  double urgency{0.0};
  double snipe_probability{0.0};
  int days_until_needed{0};
  bool selected{false};
  bool above_threshold{false};
  bool act_now{false};
  std::string reason;
};

struct DailyRecommendation {
  int day{0};
  double threshold{0.0};
  double option_value{0.0};
  std::vector<std::string> must_act_today;
  std::vector<UrgencyEntry> urgency_ranking; // highest urgency first
  std::vector<Contingency> contingencies;
  std::optional<std::string> exploration_pick; // bandit's highest-UCB arm
  OptimizationResult plan;
  std::vector<EngineWarning> warnings;
};

// Context of a committed pick whose outcome has not been recorded yet.
struct PendingOutcome {
  std::string id;
  Eigen::VectorXd x;
  double expected{0.0};
  double prior_mean{0.0};
};

// Everything needed to continue the current horizon after a restart.
struct HorizonCheckpoint {
  HorizonSnapshot horizon;
  std::vector<PendingOutcome> pending; // ordered by id
};

class DecisionEngine {
public:
  // Starts a fresh horizon; bandit counters follow the configured horizon.
  DecisionEngine(EngineConfig cfg, LearnedModel model);
  // Continues a checkpointed horizon. InvalidInput when the checkpoint was
  // taken under a different horizon configuration, InfeasibleConstraint when
  // its commitments exceed budget or capacity.
  DecisionEngine(EngineConfig cfg, LearnedModel model, HorizonCheckpoint resume_from);

  void set_availability_oracle(AvailabilityOracle oracle) { oracle_ = std::move(oracle); }

  // Replaces the candidate feed for the current pass. Duplicate ids or days
  // outside the horizon throw InvalidInput.
  void set_feed(const std::vector<Candidate> &feed);
  const CandidateTable &feed() const { return feed_; }

  RiskAssessment assess(const Candidate &c) const { return risk_.assess(c); }
  std::vector<RiskAssessment> assess_feed() const;

  // Risk, posterior and bandit estimates folded into one value per day.
  std::vector<ScoredCandidate> score();

  // Solves today's remaining problem. Picks the availability oracle rejects
  // are excluded for the rest of the horizon and the problem is re-solved.
  OptimizationResult optimize();

  DailyRecommendation recommend();

  const HorizonSnapshot &commit(const std::string &id);
  void record_outcome(const std::string &id, double per_day_outcome);

  const HorizonSnapshot &advance_day();
  const HorizonSnapshot &mark_unavailable(const std::string &id);
  const HorizonSnapshot &drop(const std::string &id);
  const HorizonSnapshot &set_reserve(int reserve);
  // Reserve from the newsvendor rule for the current injury report.
  const HorizonSnapshot &set_reserve_for_injuries(int n_injured, int n_day_to_day);

  // Budget, capacity and bandit counters reset; learning is kept.
  const HorizonSnapshot &start_new_horizon();
  // Explicit season boundary: learning is discarded too.
  void start_new_season();

  LearnedModel model() const;
  HorizonCheckpoint checkpoint() const;
  const HorizonSnapshot &horizon() const { return snapshot_; }
  const EngineConfig &config() const { return cfg_; }

private:
  struct Context {
    Eigen::VectorXd x;
    double expected{0.0};
    double prior_mean{0.0};
    std::vector<int> days;
    double value_per_day{0.0};
  };

  EngineConfig cfg_{};
  RiskCalculator risk_;
  BudgetedBandit bandit_;
  ProjectionBook posteriors_;
  std::vector<double> value_history_;
  SurvivalModel survival_;
  SlotOptimizer optimizer_;
  RollingHorizon horizon_mgr_;
  HorizonSnapshot snapshot_;
  CandidateTable feed_;
  AvailabilityOracle oracle_;
  std::unordered_map<std::string, Context> scored_;  // last score() pass
  std::unordered_map<std::string, Context> pending_; // committed, outcome not yet seen
  SlotProblem last_problem_;
};

} // namespace stream_core
