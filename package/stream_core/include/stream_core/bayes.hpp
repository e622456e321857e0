#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <Eigen/Dense>

namespace stream_core {

// Normal-normal conjugate belief about one identity's per-day outcome.
// Precisions add: 1/post_var = 1/prior_var + n/obs_var.
struct PosteriorBelief {
  double prior_mean{0.0};
  double prior_variance{64.0};
  double observation_variance{100.0};
  double observed_mean{0.0};
  int n{0};

  PosteriorBelief() = default;
  PosteriorBelief(double prior_mean_, double prior_variance_,
                  double observation_variance_);

  // Incremental running mean of observations.
  void update(double observed);

  double posterior_mean() const;
  double posterior_variance() const;
  double posterior_stddev() const;

  Eigen::VectorXd sample(std::size_t count, std::uint64_t seed) const;

  // Central interval holding `level` of the posterior mass.
  std::pair<double, double> confidence_interval(double level) const;
};

class ProjectionBook {
public:
  ProjectionBook() = default;

  // Priors are set once; returns false if the identity already has one.
  bool set_prior(const std::string &id, double mean, double variance,
                 double observation_variance);

  // Returns false for identities without a prior.
  bool update(const std::string &id, double observed);

  bool has(const std::string &id) const { return map_.find(id) != map_.end(); }

  const PosteriorBelief &get(const std::string &id) const;

  double posterior_mean(const std::string &id) const {
    return get(id).posterior_mean();
  }
  double posterior_variance(const std::string &id) const {
    return get(id).posterior_variance();
  }

  Eigen::VectorXd sample(const std::string &id, std::size_t count,
                         std::uint64_t seed) const;

  std::pair<double, double> confidence_interval(const std::string &id,
                                                double level) const {
    return get(id).confidence_interval(level);
  }

  std::size_t size() const { return map_.size(); }

  // Sorted, so persisted output is stable.
  std::vector<std::string> ids() const;

  // Replaces any belief held for id (used when loading persisted state).
  void restore(const std::string &id, const PosteriorBelief &belief) {
    map_[id] = belief;
  }

private:
  std::unordered_map<std::string, PosteriorBelief> map_;
};

} // namespace stream_core
