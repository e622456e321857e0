#include "stream_core/bandit.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/format.h>

#include "stream_core/errors.hpp"
#include "stream_core/log.hpp"

namespace stream_core {

BanditModel BanditModel::fresh(const BanditConfig &cfg, int budget, int horizon_days) {
  BanditModel m;
  m.dim = cfg.feature_dim;
  m.alpha = cfg.alpha;
  m.A = cfg.lambda_reg * Eigen::MatrixXd::Identity(m.dim, m.dim);
  m.b = Eigen::VectorXd::Zero(m.dim);
  m.budget_total = budget;
  m.budget_remaining = budget;
  m.time_total = horizon_days;
  m.time_remaining = horizon_days;
  return m;
}

BudgetedBandit::BudgetedBandit(BanditConfig cfg, BanditModel st)
    : cfg_(cfg), st_(std::move(st)) {
  if (st_.dim <= 0 || st_.A.rows() != st_.dim || st_.A.cols() != st_.dim ||
      st_.b.size() != st_.dim) {
    throw InvalidInput(fmt::format(
        "BudgetedBandit: inconsistent model (dim={}, A={}x{}, b={})", st_.dim,
        st_.A.rows(), st_.A.cols(), st_.b.size()));
  }
}

void BudgetedBandit::check_dim(const Eigen::VectorXd &x) const {
  if (x.size() != st_.dim) {
    throw InvalidInput(fmt::format("bandit context has {} features, model expects {}",
                                   x.size(), st_.dim));
  }
}

Eigen::VectorXd BudgetedBandit::theta() const { return st_.A.ldlt().solve(st_.b); }

double BudgetedBandit::exploration_scale() const {
  const double budget_ratio = static_cast<double>(st_.budget_remaining) /
                              static_cast<double>(std::max(st_.budget_total, 1));
  const double time_ratio = static_cast<double>(st_.time_remaining) /
                            static_cast<double>(std::max(st_.time_total, 1));
  if (time_ratio <= 0.0)
    return cfg_.exhausted_time_scale;
  return std::min(budget_ratio / time_ratio, cfg_.max_exploration_scale);
}

UcbScore BudgetedBandit::score(const Eigen::VectorXd &x,
                               std::optional<int> deadline_days) const {
  check_dim(x);
  const auto ldlt = st_.A.ldlt();
  const Eigen::VectorXd th = ldlt.solve(st_.b);
  const Eigen::VectorXd ainv_x = ldlt.solve(x);

  UcbScore s;
  s.mean = x.dot(th);
  const double width = std::sqrt(std::max(0.0, x.dot(ainv_x)));
  s.bonus = st_.alpha * width * exploration_scale();
  if (deadline_days && *deadline_days > 0)
    s.urgency = cfg_.urgency_weight / static_cast<double>(*deadline_days);
  s.ucb = s.mean + s.bonus + s.urgency;
  return s;
}

std::optional<BanditChoice> BudgetedBandit::select(const std::vector<BanditArm> &arms) const {
  if (st_.budget_remaining <= 0 || arms.empty())
    return std::nullopt;
  std::optional<BanditChoice> best;
  double best_ucb = -std::numeric_limits<double>::infinity();
  for (const auto &arm : arms) {
    const double u = score(arm.x, arm.deadline_days).ucb;
    if (u > best_ucb) {
      best_ucb = u;
      best = BanditChoice{arm.id, u};
    }
  }
  return best;
}

void BudgetedBandit::update(const Eigen::VectorXd &x, double reward) {
  check_dim(x);
  if (!std::isfinite(reward))
    throw InvalidInput("bandit reward must be finite");
  st_.A.noalias() += x * x.transpose();
  st_.b += reward * x;
  ++st_.observations;
  if (st_.budget_remaining > 0) {
    --st_.budget_remaining;
  } else {
    log_warn("bandit update with no budget remaining; counter stays at 0");
  }
}

void BudgetedBandit::advance_time() {
  if (st_.time_remaining > 0)
    --st_.time_remaining;
}

void BudgetedBandit::reset_horizon(int budget, int horizon_days) {
  if (budget < 0 || horizon_days <= 0) {
    throw InvalidInput(fmt::format("bandit horizon needs budget >= 0 and days > 0, got {} and {}",
                                   budget, horizon_days));
  }
  st_.budget_total = budget;
  st_.budget_remaining = budget;
  st_.time_total = horizon_days;
  st_.time_remaining = horizon_days;
}

Eigen::VectorXd build_features(const Candidate &c, const RiskAssessment &ra) {
  Eigen::VectorXd x(kFeatureCount);
  const RateStats r = c.rates ? *c.rates : RateStats{};
  x[0] = 1.0;
  x[1] = (r.positive_per9 - 7.0) / 3.0;
  x[2] = (3.5 - r.walk_per9) / 1.5;
  x[3] = (1.3 - ra.adjusted_rate) / 0.5;
  x[4] = c.profile.ground_ball ? 1.0 : 0.0;
  x[5] = c.profile.fly_ball ? 1.0 : 0.0;
  x[6] = (1.0 - c.matchup.opponent_negative) / 0.3;
  x[7] = (c.matchup.opponent_positive - 1.0) / 0.2;
  x[8] = (1.0 - c.matchup.venue_negative) / 0.2;
  x[9] = c.is_multi_day() ? 1.0 : 0.0;
  return x;
}

} // namespace stream_core
