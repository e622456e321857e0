#include "stream_core/correlation.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "stream_core/errors.hpp"
#include "stream_core/log.hpp"

namespace stream_core {

bool CorrelationEstimator::fit(const Eigen::MatrixXd &outcomes,
                               const std::vector<std::string> &ids) {
  if (outcomes.cols() != static_cast<Eigen::Index>(ids.size())) {
    throw InvalidInput(fmt::format("outcome matrix has {} columns for {} ids", outcomes.cols(),
                                   ids.size()));
  }
  if (!outcomes.allFinite())
    throw InvalidInput("outcome matrix holds non-finite values");
  std::unordered_map<std::string, Eigen::Index> index;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (!index.emplace(ids[i], static_cast<Eigen::Index>(i)).second)
      throw InvalidInput("duplicate id in correlation fit: " + ids[i]);
  }
  ids_ = ids;
  index_ = std::move(index);
  if (outcomes.rows() < kMinPeriods) {
    log_debug("correlation fit skipped: {} period(s) of {} needed", outcomes.rows(),
              kMinPeriods);
    fitted_ = false;
    return false;
  }

  const double n = static_cast<double>(outcomes.rows());
  const double p = static_cast<double>(outcomes.cols());
  const Eigen::MatrixXd X = outcomes.rowwise() - outcomes.colwise().mean();
  const Eigen::MatrixXd S = X.transpose() * X / n; // maximum-likelihood covariance
  const double mu = S.trace() / p;

  // delta: distance of S from the target; beta: how noisy S is as an
  // estimate, from the spread of the per-period outer products.
  const Eigen::MatrixXd X2 = X.array().square().matrix();
  const double spread = (X2.transpose() * X2).sum() / n;
  const double s_norm = S.array().square().sum();
  double delta = (s_norm - 2.0 * mu * S.trace() + p * mu * mu) / p;
  double beta = (spread - s_norm) / (p * n);
  beta = std::min(beta, delta);
  shrinkage_ = beta <= 0.0 || delta <= 0.0 ? 0.0 : beta / delta;

  covariance_ = (1.0 - shrinkage_) * S;
  covariance_.diagonal().array() += shrinkage_ * mu;
  fitted_ = true;
  log_debug("correlation fit on {} periods x {} ids, shrinkage {:.3f}", outcomes.rows(),
            outcomes.cols(), shrinkage_);
  return true;
}

Eigen::MatrixXd CorrelationEstimator::covariance() const {
  if (!fitted_) {
    const auto k = static_cast<Eigen::Index>(ids_.size());
    return Eigen::MatrixXd::Identity(k, k);
  }
  return covariance_;
}

Eigen::MatrixXd CorrelationEstimator::correlation() const {
  const Eigen::MatrixXd cov = covariance();
  Eigen::VectorXd sd = cov.diagonal().cwiseMax(0.0).cwiseSqrt();
  for (Eigen::Index i = 0; i < sd.size(); ++i) {
    if (sd[i] == 0.0)
      sd[i] = 1.0;
  }
  return (cov.array() / (sd * sd.transpose()).array()).matrix();
}

double CorrelationEstimator::correlation(const std::string &a, const std::string &b) const {
  if (!fitted_)
    return 0.0;
  const auto ia = index_.find(a);
  const auto ib = index_.find(b);
  if (ia == index_.end() || ib == index_.end())
    return 0.0;
  const double sa = std::sqrt(covariance_(ia->second, ia->second));
  const double sb = std::sqrt(covariance_(ib->second, ib->second));
  if (sa == 0.0 || sb == 0.0)
    return 0.0;
  return covariance_(ia->second, ib->second) / (sa * sb);
}

} // namespace stream_core
