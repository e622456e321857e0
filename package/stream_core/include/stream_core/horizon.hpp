#pragma once

#include <string>
#include <vector>

#include "stream_core/config.hpp"
#include "stream_core/optimizer.hpp"

namespace stream_core {

// Accepted pick. Fixed once created; the optimizer only ever sees it as
// consumed budget and capacity.
struct CommittedPick {
  std::string id;
  int commit_day{0};
  std::vector<int> days;
  double value_per_day{0.0};
  bool locked{true};

  int last_day() const;
};

// One immutable view of the horizon. Every RollingHorizon operation returns
// a new snapshot and leaves its input untouched.
struct HorizonSnapshot {
  int day{0};
  int total_days{0};
  int budget_total{0};
  int reserve{0};
  int budget_used{0};
  std::vector<int> capacity;            // configured slots per day
  std::vector<CommittedPick> committed; // still has days at or after `day`
  std::vector<CommittedPick> completed; // last day passed; historical
  std::vector<std::string> dropped;     // completed picks whose spot was freed
  std::vector<std::string> unavailable; // claimed by a competitor this horizon
  bool complete{false};

  int remaining_budget() const { return budget_total - budget_used; }
  // Budget the optimizer may spend after holding back the reserve.
  int optimizer_budget() const;
  // capacity minus occupancy of every pick made this horizon
  std::vector<int> residual_capacity() const;
  // Completed picks whose roster spot can be released.
  std::vector<std::string> droppable() const;

  bool is_committed(const std::string &id) const;
  bool is_unavailable(const std::string &id) const;

  std::string status_text() const;
};

class RollingHorizon {
public:
  explicit RollingHorizon(HorizonConfig cfg = {});

  HorizonSnapshot start() const;

  // InvalidInput for repeated ids or days in the past / outside the horizon;
  // InfeasibleConstraint when no budget or capacity is left for it.
  HorizonSnapshot commit(const HorizonSnapshot &s, const CommittedPick &pick) const;

  // Moves to the next day. Picks whose last day has passed become
  // droppable; leaving the last day completes the horizon and forfeits
  // unused budget.
  HorizonSnapshot advance(const HorizonSnapshot &s) const;

  HorizonSnapshot mark_unavailable(const HorizonSnapshot &s, const std::string &id) const;
  HorizonSnapshot drop(const HorizonSnapshot &s, const std::string &id) const;
  HorizonSnapshot with_reserve(const HorizonSnapshot &s, int reserve) const;

  // Throws InfeasibleConstraint if the commitments exceed budget or capacity.
  void validate(const HorizonSnapshot &s) const;

  // What is left to decide today: committed, completed and unavailable
  // identities removed, past days trimmed, capacity and budget reduced by
  // the commitments.
  SlotProblem remaining_problem(const HorizonSnapshot &s,
                                const std::vector<ScoredCandidate> &scored) const;

  const HorizonConfig &config() const { return cfg_; }

private:
  HorizonConfig cfg_{};
};

} // namespace stream_core
