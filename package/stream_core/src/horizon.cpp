#include "stream_core/horizon.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "stream_core/errors.hpp"
#include "stream_core/log.hpp"

namespace stream_core {

namespace {

bool contains_id(const std::vector<std::string> &ids, const std::string &id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool contains_pick(const std::vector<CommittedPick> &picks, const std::string &id) {
  return std::any_of(picks.begin(), picks.end(),
                     [&](const CommittedPick &p) { return p.id == id; });
}

} // namespace

int CommittedPick::last_day() const {
  if (days.empty())
    return commit_day;
  return *std::max_element(days.begin(), days.end());
}

int HorizonSnapshot::optimizer_budget() const {
  if (complete)
    return 0;
  return std::max(0, remaining_budget() - reserve);
}

std::vector<int> HorizonSnapshot::residual_capacity() const {
  std::vector<int> out = capacity;
  auto consume = [&](const CommittedPick &p) {
    for (const int d : p.days) {
      if (d >= 0 && d < static_cast<int>(out.size()))
        --out[static_cast<std::size_t>(d)];
    }
  };
  for (const auto &p : committed)
    consume(p);
  for (const auto &p : completed)
    consume(p);
  return out;
}

std::vector<std::string> HorizonSnapshot::droppable() const {
  std::vector<std::string> out;
  for (const auto &p : completed) {
    if (!contains_id(dropped, p.id))
      out.push_back(p.id);
  }
  return out;
}

bool HorizonSnapshot::is_committed(const std::string &id) const {
  return contains_pick(committed, id) || contains_pick(completed, id);
}

bool HorizonSnapshot::is_unavailable(const std::string &id) const {
  return contains_id(unavailable, id);
}

std::string HorizonSnapshot::status_text() const {
  std::string out;
  if (complete) {
    out = fmt::format("Horizon complete: {}/{} used", budget_used, budget_total);
  } else {
    out = fmt::format("Day {}/{}: {}/{} used, {} remaining (reserve {})", day + 1,
                      total_days, budget_used, budget_total, remaining_budget(), reserve);
  }
  for (const auto &p : committed) {
    const auto left = std::count_if(p.days.begin(), p.days.end(),
                                    [&](int d) { return d >= day; });
    out += fmt::format("\n  {} committed day {}, {} day(s) left", p.id, p.commit_day, left);
  }
  for (const auto &id : droppable())
    out += fmt::format("\n  {} droppable", id);
  return out;
}

RollingHorizon::RollingHorizon(HorizonConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.days <= 0)
    throw InvalidInput("horizon must span at least one day");
  if (cfg_.budget < 0 || cfg_.reserve < 0)
    throw InvalidInput("horizon budget and reserve must be non-negative");
  if (static_cast<int>(cfg_.resolved_capacity().size()) != cfg_.days) {
    throw InvalidInput(fmt::format("capacity has {} entries for a {}-day horizon",
                                   cfg_.resolved_capacity().size(), cfg_.days));
  }
}

HorizonSnapshot RollingHorizon::start() const {
  HorizonSnapshot s;
  s.total_days = cfg_.days;
  s.budget_total = cfg_.budget;
  s.reserve = cfg_.reserve;
  s.capacity = cfg_.resolved_capacity();
  return s;
}

HorizonSnapshot RollingHorizon::commit(const HorizonSnapshot &s,
                                       const CommittedPick &pick) const {
  if (s.complete)
    throw InfeasibleConstraint(fmt::format("cannot commit {}: horizon is complete", pick.id));
  if (pick.id.empty())
    throw InvalidInput("committed pick needs an id");
  if (s.is_committed(pick.id))
    throw InvalidInput(fmt::format("{} is already committed this horizon", pick.id));
  if (pick.days.empty())
    throw InvalidInput(fmt::format("{} occupies no days", pick.id));
  for (const int d : pick.days) {
    if (d < s.day || d >= s.total_days) {
      throw InvalidInput(fmt::format("{} occupies day {} outside [{}, {})", pick.id, d,
                                     s.day, s.total_days));
    }
  }
  if (s.remaining_budget() <= 0) {
    throw InfeasibleConstraint(
        fmt::format("cannot commit {}: budget of {} is spent", pick.id, s.budget_total));
  }
  const std::vector<int> free = s.residual_capacity();
  for (const int d : pick.days) {
    if (free[static_cast<std::size_t>(d)] <= 0) {
      throw InfeasibleConstraint(
          fmt::format("cannot commit {}: no capacity left on day {}", pick.id, d));
    }
  }

  HorizonSnapshot next = s;
  CommittedPick p = pick;
  p.commit_day = s.day;
  p.locked = true;
  next.committed.push_back(std::move(p));
  ++next.budget_used;
  log_info("committed {} on day {} ({}/{} used)", pick.id, s.day, next.budget_used,
           next.budget_total);
  return next;
}

HorizonSnapshot RollingHorizon::advance(const HorizonSnapshot &s) const {
  if (s.complete)
    throw InvalidInput("horizon is already complete; start a new one");
  HorizonSnapshot next = s;
  next.day = s.day + 1;

  std::vector<CommittedPick> active;
  for (const auto &p : s.committed) {
    if (p.last_day() < next.day) {
      next.completed.push_back(p);
    } else {
      active.push_back(p);
    }
  }
  next.committed = std::move(active);

  if (next.day >= next.total_days) {
    next.complete = true;
    if (next.remaining_budget() > 0) {
      log_info("horizon complete; {} unused unit(s) forfeited", next.remaining_budget());
    } else {
      log_info("horizon complete; budget fully used");
    }
  } else {
    log_info("advanced to day {}/{}", next.day + 1, next.total_days);
  }
  return next;
}

HorizonSnapshot RollingHorizon::mark_unavailable(const HorizonSnapshot &s,
                                                 const std::string &id) const {
  HorizonSnapshot next = s;
  if (!next.is_unavailable(id))
    next.unavailable.push_back(id);
  return next;
}

HorizonSnapshot RollingHorizon::drop(const HorizonSnapshot &s, const std::string &id) const {
  const auto ids = s.droppable();
  if (!contains_id(ids, id))
    throw InvalidInput(fmt::format("{} is not droppable", id));
  HorizonSnapshot next = s;
  next.dropped.push_back(id);
  return next;
}

HorizonSnapshot RollingHorizon::with_reserve(const HorizonSnapshot &s, int reserve) const {
  if (reserve < 0)
    throw InvalidInput("reserve must be non-negative");
  HorizonSnapshot next = s;
  next.reserve = reserve;
  return next;
}

void RollingHorizon::validate(const HorizonSnapshot &s) const {
  if (s.budget_used > s.budget_total) {
    throw InfeasibleConstraint(fmt::format("{} picks committed against a budget of {}",
                                           s.budget_used, s.budget_total));
  }
  const std::vector<int> free = s.residual_capacity();
  for (std::size_t d = 0; d < free.size(); ++d) {
    if (free[d] < 0) {
      throw InfeasibleConstraint(
          fmt::format("day {} holds {} more picks than its capacity of {}", d, -free[d],
                      s.capacity[d]));
    }
  }
}

SlotProblem RollingHorizon::remaining_problem(
    const HorizonSnapshot &s, const std::vector<ScoredCandidate> &scored) const {
  validate(s);
  SlotProblem p;
  p.budget = s.optimizer_budget();
  p.capacity = s.residual_capacity();
  for (int d = 0; d < std::min(s.day, static_cast<int>(p.capacity.size())); ++d)
    p.capacity[static_cast<std::size_t>(d)] = 0;
  if (s.complete)
    return p;

  for (const auto &c : scored) {
    if (s.is_committed(c.id) || s.is_unavailable(c.id))
      continue;
    ScoredCandidate trimmed = c;
    trimmed.days.erase(std::remove_if(trimmed.days.begin(), trimmed.days.end(),
                                      [&](int d) { return d < s.day; }),
                       trimmed.days.end());
    if (trimmed.days.empty())
      continue;
    p.candidates.push_back(std::move(trimmed));
  }
  return p;
}

} // namespace stream_core
