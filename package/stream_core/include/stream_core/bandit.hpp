#pragma once

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "stream_core/candidate.hpp"
#include "stream_core/config.hpp"
#include "stream_core/risk.hpp"

namespace stream_core {

constexpr int kFeatureCount = 10;

// Shared linear model plus the consumable counters of the current horizon.
struct BanditModel {
  int dim{0};
  double alpha{1.0};
  Eigen::MatrixXd A; // dim x dim, starts at lambda * I
  Eigen::VectorXd b; // dim
  int observations{0};
  int budget_total{0};
  int budget_remaining{0};
  int time_total{0};
  int time_remaining{0};

  static BanditModel fresh(const BanditConfig &cfg, int budget, int horizon_days);
};

struct UcbScore {
  double ucb{0.0};
  double mean{0.0};
  double bonus{0.0}; // exploration after budget/time scaling
  double urgency{0.0};
};

struct BanditArm {
  std::string id;
  Eigen::VectorXd x;
  std::optional<int> deadline_days;
};

struct BanditChoice {
  std::string id;
  double ucb{0.0};
};

class BudgetedBandit {
public:
  BudgetedBandit() = default;
  BudgetedBandit(BanditConfig cfg, BanditModel st);

  Eigen::VectorXd theta() const;

  UcbScore score(const Eigen::VectorXd &x,
                 std::optional<int> deadline_days = std::nullopt) const;

  // Highest UCB among arms; none when the budget is spent or no arms remain.
  std::optional<BanditChoice> select(const std::vector<BanditArm> &arms) const;

  // A += x x^T, b += reward x, and one budget unit is consumed.
  void update(const Eigen::VectorXd &x, double reward);

  // Once per day, whether or not anything was selected.
  void advance_time();

  // New horizon: counters restart from the configured budget and length,
  // A and b kept.
  void reset_horizon(int budget, int horizon_days);

  const BanditModel &state() const { return st_; }
  BanditModel &mutable_state() { return st_; }
  const BanditConfig &config() const { return cfg_; }

private:
  void check_dim(const Eigen::VectorXd &x) const;
  double exploration_scale() const;

  BanditConfig cfg_{};
  BanditModel st_{};
};

// Normalized context for one candidate; index 0 is a bias term.
Eigen::VectorXd build_features(const Candidate &c, const RiskAssessment &ra);

} // namespace stream_core
