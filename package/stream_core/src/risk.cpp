#include "stream_core/risk.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "stream_core/errors.hpp"
#include "stream_core/stats.hpp"

namespace stream_core {

namespace {

// Extra events assumed by the pessimistic/optimistic outings.
constexpr double kFloorExtraNegative = 1.5;
constexpr double kCeilingFewerNegative = 0.8;
constexpr double kFloorDurationCut = 2.0;
constexpr double kCeilingDurationGain = 1.5;
constexpr double kRangeToStd = 3.3;
// Non-catastrophic variance folded into the blowup approximation.
constexpr double kBaseVariance = 100.0;

struct EventCounts {
  double duration{0.0};
  double positive{0.0};
  double walk{0.0};
  double negative{0.0};
  double hit{0.0};
};

double points(const ScoringConfig &s, const EventCounts &e) {
  return s.per_duration_unit * e.duration + s.per_positive * e.positive +
         s.per_walk * e.walk + s.per_negative * e.negative + s.per_hit * e.hit;
}

void check_candidate(const Candidate &c) {
  if (!(c.expected_duration > 0.0) || !std::isfinite(c.expected_duration)) {
    throw InvalidInput(
        fmt::format("candidate {}: expected_duration must be positive", c.id));
  }
  const MatchupFactors &m = c.matchup;
  if (!(m.opponent_negative > 0.0) || !(m.opponent_positive > 0.0) ||
      !(m.venue_negative > 0.0)) {
    throw InvalidInput(
        fmt::format("candidate {}: adjustment factors must be positive", c.id));
  }
}

} // namespace

const char *risk_tier_name(RiskTier tier) {
  switch (tier) {
  case RiskTier::Elite:
    return "elite";
  case RiskTier::Safe:
    return "safe";
  case RiskTier::Moderate:
    return "moderate";
  case RiskTier::Risky:
    return "risky";
  case RiskTier::Dangerous:
    return "dangerous";
  case RiskTier::NoGo:
    return "no_go";
  }
  return "moderate";
}

double RiskAssessment::stddev() const { return std::sqrt(std::max(0.0, variance)); }

RiskCalculator::RiskCalculator(RiskConfig cfg, ScoringConfig scoring)
    : cfg_(cfg), scoring_(scoring), adjusters_(default_adjusters(cfg)) {}

RiskCalculator::RiskCalculator(RiskConfig cfg, ScoringConfig scoring,
                               std::vector<RateAdjuster> adjusters)
    : cfg_(cfg), scoring_(scoring), adjusters_(std::move(adjusters)) {}

std::vector<RateAdjuster> RiskCalculator::default_adjusters(const RiskConfig &cfg) {
  std::vector<RateAdjuster> out;
  out.emplace_back([](double rate, const Candidate &c) {
    return rate * c.matchup.opponent_negative;
  });
  out.emplace_back([](double rate, const Candidate &c) {
    return rate * c.matchup.venue_negative;
  });
  const double gb = cfg.ground_ball_factor;
  const double fb = cfg.fly_ball_factor;
  out.emplace_back([gb, fb](double rate, const Candidate &c) {
    if (c.profile.ground_ball)
      return rate * gb;
    if (c.profile.fly_ball)
      return rate * fb;
    return rate;
  });
  return out;
}

double RiskCalculator::adjusted_rate(const Candidate &c) const {
  const RateStats &r = c.rates ? *c.rates : cfg_.missing_defaults;
  double rate = r.negative_per9;
  for (const auto &adjust : adjusters_)
    rate = adjust(rate, c);
  if (!std::isfinite(rate)) {
    throw InvalidInput(fmt::format("candidate {}: adjusted rate is not finite", c.id));
  }
  return std::clamp(rate, cfg_.min_adjusted_rate, cfg_.max_adjusted_rate);
}

RiskAssessment RiskCalculator::assess(const Candidate &c) const {
  check_candidate(c);
  RiskAssessment ra;
  ra.id = c.id;
  ra.low_confidence = !c.rates.has_value();
  const RateStats &r = c.rates ? *c.rates : cfg_.missing_defaults;

  const double d = c.expected_duration;
  ra.adjusted_rate = adjusted_rate(c);

  EventCounts exp;
  exp.duration = d;
  exp.positive = r.positive_per9 / 9.0 * c.matchup.opponent_positive * d;
  exp.walk = r.walk_per9 / 9.0 * d;
  exp.negative = ra.adjusted_rate / 9.0 * d;
  exp.hit = r.hit_per9 / 9.0 * d;
  ra.expected_events = exp.negative;
  ra.expected = points(scoring_, exp);

  // Bad outing: shorter, more catastrophic events, fewer positives
  EventCounts lo;
  lo.duration = std::min(d, std::max(cfg_.min_floor_duration, d - kFloorDurationCut));
  lo.positive = std::max(0.0, exp.positive - 2.0);
  lo.walk = exp.walk + 1.0;
  lo.negative = exp.negative + kFloorExtraNegative;
  lo.hit = exp.hit + 2.0;
  ra.floor = points(scoring_, lo);

  // Good outing: longer, fewer catastrophic events, more positives
  EventCounts hi;
  hi.duration = std::max(d, std::min(cfg_.max_duration, d + kCeilingDurationGain));
  hi.positive = exp.positive + 3.0;
  hi.walk = std::max(0.0, exp.walk - 1.0);
  hi.negative = std::max(0.0, exp.negative - kCeilingFewerNegative);
  hi.hit = std::max(0.0, exp.hit - 2.0);
  ra.ceiling = points(scoring_, hi);

  const double range = (ra.ceiling - ra.floor) / kRangeToStd;
  ra.variance = range * range;

  ra.disaster_prob = poisson_tail(exp.negative, cfg_.disaster_threshold);
  const double pts_var =
      scoring_.per_negative * scoring_.per_negative * exp.negative + kBaseVariance;
  ra.blowup_prob = normal_cdf(0.0, ra.expected, std::sqrt(pts_var));

  ra.risk_score = std::min(100.0, ra.disaster_prob * 200.0 + ra.blowup_prob * 50.0 +
                                      std::min(15.0, ra.variance / 100.0));
  ra.risk_adjusted_value = ra.expected - cfg_.risk_aversion * ra.stddev() -
                           ra.disaster_prob * cfg_.catastrophe_penalty;

  ra.tier = classify(c, ra.disaster_prob, ra.blowup_prob, ra.low_confidence);
  ra.hard_filtered = ra.tier == RiskTier::NoGo;
  ra.warnings = warnings_for(c, ra);
  ra.recommendation = recommendation_for(ra);
  return ra;
}

RiskTier RiskCalculator::classify(const Candidate &c, double disaster,
                                  double blowup, bool low_confidence) const {
  if (disaster > cfg_.max_disaster_prob || blowup > cfg_.max_blowup_prob)
    return RiskTier::NoGo;
  if (!low_confidence && c.rates->sample_units < cfg_.min_sample_units)
    return RiskTier::NoGo;
  if (c.profile.fly_ball && c.matchup.elite_opponent && c.matchup.hostile_venue)
    return RiskTier::NoGo;

  if (disaster < cfg_.elite_below)
    return RiskTier::Elite;
  if (disaster < cfg_.safe_below)
    return RiskTier::Safe;
  if (disaster < cfg_.moderate_below)
    return RiskTier::Moderate;
  if (disaster < cfg_.risky_below)
    return RiskTier::Risky;
  return RiskTier::Dangerous;
}

std::vector<std::string> RiskCalculator::warnings_for(const Candidate &c,
                                                      const RiskAssessment &ra) const {
  std::vector<std::string> out;
  if (ra.tier == RiskTier::NoGo)
    out.emplace_back("HARD FILTER: do not use this candidate");
  if (ra.low_confidence)
    out.emplace_back("Missing rate stats: league-average defaults substituted");
  else if (c.rates->sample_units < cfg_.min_sample_units)
    out.push_back(fmt::format("Thin track record: {:.1f} units (minimum {:.1f})",
                              c.rates->sample_units, cfg_.min_sample_units));
  if (c.matchup.elite_opponent)
    out.emplace_back("Elite opponent");
  if (c.matchup.hostile_venue)
    out.push_back(fmt::format("Hostile venue (factor {:.2f})", c.matchup.venue_negative));
  if (c.profile.fly_ball)
    out.emplace_back("Fly-ball profile: prone to catastrophic events");
  const RateStats &r = c.rates ? *c.rates : cfg_.missing_defaults;
  if (r.negative_per9 >= 1.5)
    out.push_back(fmt::format("High negative-event rate: {:.2f} per 9", r.negative_per9));
  if (ra.disaster_prob >= 0.20)
    out.push_back(fmt::format("High disaster risk: {:.0f}% chance of {}+ events",
                              ra.disaster_prob * 100.0, cfg_.disaster_threshold));
  return out;
}

std::string RiskCalculator::recommendation_for(const RiskAssessment &ra) {
  const double pct = ra.disaster_prob * 100.0;
  switch (ra.tier) {
  case RiskTier::NoGo:
    return "AVOID - Risk too high regardless of upside";
  case RiskTier::Elite:
    return fmt::format("STRONG ADD - Safe floor with {:.0f} pt upside", ra.expected);
  case RiskTier::Safe:
    return fmt::format("GOOD ADD - Solid {:.0f} pt expectation, low risk", ra.expected);
  case RiskTier::Moderate:
    if (ra.risk_adjusted_value > 20.0)
      return fmt::format("ACCEPTABLE - Worth {:.0f} risk-adjusted pts",
                         ra.risk_adjusted_value);
    return fmt::format("MARGINAL - Only {:.0f} risk-adjusted pts", ra.risk_adjusted_value);
  case RiskTier::Risky:
    if (ra.expected > 35.0)
      return fmt::format("HIGH RISK/REWARD - {:.0f} pts but {:.0f}% disaster",
                         ra.expected, pct);
    return fmt::format("RISKY - Not enough upside ({:.0f} pts) for {:.0f}% disaster risk",
                       ra.expected, pct);
  case RiskTier::Dangerous:
    return fmt::format("DANGEROUS - {:.0f}% disaster probability", pct);
  }
  return "EVALUATE FURTHER";
}

double risk_parameter(double score_differential, int days_remaining) {
  if (days_remaining <= 1) {
    if (score_differential > 30.0)
      return 3.0;
    if (score_differential < -30.0)
      return -3.0;
  }
  if (score_differential > 30.0)
    return 2.0;
  if (score_differential > 10.0)
    return 0.5;
  if (score_differential > -10.0)
    return 0.0;
  if (score_differential > -30.0)
    return -1.0;
  return -2.0;
}

double risk_adjust(double mean, double stddev, double theta) {
  return mean - 0.5 * theta * stddev;
}

} // namespace stream_core
