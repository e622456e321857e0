#pragma once

#include <functional>
#include <string>
#include <vector>

#include "stream_core/candidate.hpp"
#include "stream_core/config.hpp"

namespace stream_core {

// Ordered safest first. NoGo is a hard filter, not a score.
enum class RiskTier { Elite = 0, Safe, Moderate, Risky, Dangerous, NoGo };

const char *risk_tier_name(RiskTier tier);

// One step of the negative-rate adjustment pipeline. Must be pure.
using RateAdjuster = std::function<double(double rate, const Candidate &c)>;

struct RiskAssessment {
  std::string id;
  double adjusted_rate{0.0};   // negative events per 9 units
  double expected_events{0.0}; // Poisson lambda for one occupied day
  double expected{0.0};
  double floor{0.0};
  double ceiling{0.0};
  double variance{0.0};
  double disaster_prob{0.0};
  double blowup_prob{0.0};
  double risk_score{0.0};
  double risk_adjusted_value{0.0};
  RiskTier tier{RiskTier::Moderate};
  bool hard_filtered{false};
  bool low_confidence{false};
  std::string recommendation;
  std::vector<std::string> warnings;

  double stddev() const;
};

class RiskCalculator {
public:
  explicit RiskCalculator(RiskConfig cfg = {}, ScoringConfig scoring = {});
  RiskCalculator(RiskConfig cfg, ScoringConfig scoring,
                 std::vector<RateAdjuster> adjusters);

  // Opponent, venue and profile adjustments, in that order.
  static std::vector<RateAdjuster> default_adjusters(const RiskConfig &cfg);

  // Recomputed from the candidate every call; nothing is cached.
  RiskAssessment assess(const Candidate &c) const;

  double adjusted_rate(const Candidate &c) const;

  const RiskConfig &config() const { return cfg_; }
  const ScoringConfig &scoring() const { return scoring_; }
  std::size_t adjuster_count() const { return adjusters_.size(); }

private:
  RiskTier classify(const Candidate &c, double disaster, double blowup,
                    bool low_confidence) const;
  std::vector<std::string> warnings_for(const Candidate &c,
                                        const RiskAssessment &ra) const;
  static std::string recommendation_for(const RiskAssessment &ra);

  RiskConfig cfg_{};
  ScoringConfig scoring_{};
  std::vector<RateAdjuster> adjusters_;
};

// Risk preference from the current score differential: positive protects a
// lead, negative chases variance.
double risk_parameter(double score_differential, int days_remaining);

// mean - 0.5 * theta * stddev
double risk_adjust(double mean, double stddev, double theta);

} // namespace stream_core
