#include "stream_core/bayes.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

#include <fmt/format.h>

#include "stream_core/errors.hpp"
#include "stream_core/log.hpp"
#include "stream_core/stats.hpp"

namespace stream_core {

PosteriorBelief::PosteriorBelief(double prior_mean_, double prior_variance_,
                                 double observation_variance_)
    : prior_mean(prior_mean_), prior_variance(prior_variance_),
      observation_variance(observation_variance_) {
  if (!(prior_variance > 0.0) || !(observation_variance > 0.0)) {
    throw InvalidInput("PosteriorBelief: variances must be positive");
  }
  if (!std::isfinite(prior_mean)) {
    throw InvalidInput("PosteriorBelief: prior mean must be finite");
  }
}

void PosteriorBelief::update(double observed) {
  if (!std::isfinite(observed))
    throw InvalidInput("PosteriorBelief: observation must be finite");
  ++n;
  observed_mean += (observed - observed_mean) / static_cast<double>(n);
}

double PosteriorBelief::posterior_mean() const {
  if (n == 0)
    return prior_mean;
  const double prior_precision = 1.0 / prior_variance;
  const double obs_precision = static_cast<double>(n) / observation_variance;
  return (prior_precision * prior_mean + obs_precision * observed_mean) /
         (prior_precision + obs_precision);
}

double PosteriorBelief::posterior_variance() const {
  if (n == 0)
    return prior_variance;
  const double prior_precision = 1.0 / prior_variance;
  const double obs_precision = static_cast<double>(n) / observation_variance;
  return 1.0 / (prior_precision + obs_precision);
}

double PosteriorBelief::posterior_stddev() const {
  return std::sqrt(posterior_variance());
}

Eigen::VectorXd PosteriorBelief::sample(std::size_t count, std::uint64_t seed) const {
  if (count == 0)
    return {};
  std::mt19937_64 rng(seed);
  std::normal_distribution<double> dist(posterior_mean(), posterior_stddev());
  Eigen::VectorXd vec(static_cast<Eigen::Index>(count));
  for (std::size_t i = 0; i < count; ++i)
    vec(static_cast<Eigen::Index>(i)) = dist(rng);
  return vec;
}

std::pair<double, double> PosteriorBelief::confidence_interval(double level) const {
  if (!(level > 0.0 && level < 1.0)) {
    throw InvalidInput(fmt::format("confidence level {} outside (0, 1)", level));
  }
  const double z = normal_quantile((1.0 + level) / 2.0);
  const double m = posterior_mean();
  const double s = posterior_stddev();
  return {m - z * s, m + z * s};
}

bool ProjectionBook::set_prior(const std::string &id, double mean, double variance,
                               double observation_variance) {
  if (has(id))
    return false;
  map_.emplace(id, PosteriorBelief(mean, variance, observation_variance));
  return true;
}

bool ProjectionBook::update(const std::string &id, double observed) {
  auto it = map_.find(id);
  if (it == map_.end()) {
    log_debug("ProjectionBook: no prior for {}, observation ignored", id);
    return false;
  }
  it->second.update(observed);
  return true;
}

const PosteriorBelief &ProjectionBook::get(const std::string &id) const {
  auto it = map_.find(id);
  if (it == map_.end()) {
    throw std::out_of_range("ProjectionBook: id not found: " + id);
  }
  return it->second;
}

Eigen::VectorXd ProjectionBook::sample(const std::string &id, std::size_t count,
                                       std::uint64_t seed) const {
  return get(id).sample(count, mix_seed(seed, hash_id(id)));
}

std::vector<std::string> ProjectionBook::ids() const {
  std::vector<std::string> out;
  out.reserve(map_.size());
  for (const auto &kv : map_)
    out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace stream_core
