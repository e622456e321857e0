#pragma once

#include <string>
#include <vector>

#include "stream_core/candidate.hpp"
#include "stream_core/optimizer.hpp"

namespace stream_core::testing {

// Well-established candidate with neutral matchup.
inline Candidate make_candidate(const std::string &id, std::vector<int> days,
                                double negative_per9 = 1.0) {
  Candidate c(id, std::move(days));
  RateStats r;
  r.negative_per9 = negative_per9;
  r.positive_per9 = 9.0;
  r.walk_per9 = 2.8;
  r.hit_per9 = 8.0;
  r.sample_units = 60.0;
  c.rates = r;
  return c;
}

inline ScoredCandidate scored(const std::string &id, std::vector<int> days, double per_day,
                              RiskTier tier = RiskTier::Safe,
                              HazardTier hazard = HazardTier::Moderate) {
  ScoredCandidate s;
  s.id = id;
  s.days = std::move(days);
  s.value_per_day = per_day;
  s.tier = tier;
  s.hazard = hazard;
  return s;
}

} // namespace stream_core::testing
