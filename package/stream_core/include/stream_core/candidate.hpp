#pragma once

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stream_core/errors.hpp"

namespace stream_core {

// Ordered by desirability to competitors, most contested first.
enum class HazardTier { Elite = 0, High, Moderate, Low, Minimal };

inline const char *hazard_tier_name(HazardTier tier) {
  switch (tier) {
  case HazardTier::Elite:
    return "elite";
  case HazardTier::High:
    return "high";
  case HazardTier::Moderate:
    return "moderate";
  case HazardTier::Low:
    return "low";
  case HazardTier::Minimal:
    return "minimal";
  }
  return "moderate";
}

// Event rates per 9 units of occupied duration.
struct RateStats {
  double negative_per9{1.2}; // catastrophic events
  double positive_per9{8.5};
  double walk_per9{3.0};
  double hit_per9{8.0};
  double sample_units{0.0}; // track record behind the rates
};

struct MatchupFactors {
  double opponent_negative{1.0};
  double opponent_positive{1.0};
  double venue_negative{1.0};
  bool elite_opponent{false};
  bool hostile_venue{false};
};

struct ProfileFlags {
  bool ground_ball{false};
  bool fly_ball{false};
};

struct Candidate {
  std::string id;
  std::vector<int> days; // horizon days occupied if selected
  std::optional<RateStats> rates;
  MatchupFactors matchup{};
  ProfileFlags profile{};
  double expected_duration{5.5}; // per occupied day
  HazardTier hazard{HazardTier::Moderate};
  std::optional<double> prior_outcome;

  Candidate() = default;
  Candidate(std::string id_, std::vector<int> days_)
      : id(std::move(id_)), days(std::move(days_)) {}

  bool is_multi_day() const { return days.size() >= 2; }

  int first_day() const {
    if (days.empty())
      return -1;
    return *std::min_element(days.begin(), days.end());
  }
};

class CandidateTable {
public:
  CandidateTable() = default;
  explicit CandidateTable(const std::vector<Candidate> &feed) {
    for (const auto &c : feed)
      add(c);
  }

  // Identities are unique per pass; a multi-day candidate is one entry.
  void add(const Candidate &c) {
    if (c.id.empty()) {
      throw InvalidInput("CandidateTable: candidate id must not be empty");
    }
    if (has_id(c.id)) {
      throw InvalidInput("CandidateTable: duplicate candidate id " + c.id);
    }
    index_[c.id] = candidates_.size();
    candidates_.push_back(c);
  }

  std::size_t size() const { return candidates_.size(); }

  bool has_id(const std::string &id) const {
    return index_.find(id) != index_.end();
  }

  const Candidate &get_by_id(const std::string &id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
      throw std::out_of_range("Candidate id not found: " + id);
    }
    return candidates_.at(it->second);
  }

  const std::vector<Candidate> &candidates() const { return candidates_; }

private:
  std::vector<Candidate> candidates_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace stream_core
