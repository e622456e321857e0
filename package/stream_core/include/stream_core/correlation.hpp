#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <Eigen/Dense>

namespace stream_core {

// Covariance of per-period outcomes across identities, shrunk toward a
// scaled identity (Ledoit-Wolf). Sample covariance alone is unreliable with
// a handful of periods.
class CorrelationEstimator {
public:
  // Fewer periods than this leave the estimator unfitted.
  static constexpr int kMinPeriods = 3;

  CorrelationEstimator() = default;

  // Rows are periods, columns identities. Throws InvalidInput when the
  // column count and ids disagree, ids repeat or values are not finite.
  // Returns false, and keeps the estimator unfitted, below kMinPeriods rows.
  bool fit(const Eigen::MatrixXd &outcomes, const std::vector<std::string> &ids);

  bool fitted() const { return fitted_; }
  const std::vector<std::string> &ids() const { return ids_; }

  // Identity until fitted.
  Eigen::MatrixXd covariance() const;
  Eigen::MatrixXd correlation() const;

  // Weight on the shrinkage target in [0, 1]; 1 until fitted.
  double shrinkage() const { return fitted_ ? shrinkage_ : 1.0; }

  // 0 for unknown identities or before fitting.
  double correlation(const std::string &a, const std::string &b) const;

private:
  bool fitted_{false};
  double shrinkage_{1.0};
  Eigen::MatrixXd covariance_;
  std::vector<std::string> ids_;
  std::unordered_map<std::string, Eigen::Index> index_;
};

} // namespace stream_core
