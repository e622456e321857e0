#include "stream_core/optimizer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_set>

#include <fmt/format.h>
#include <ortools/sat/cp_model.h>
#include <ortools/sat/cp_model.pb.h>
#include <ortools/sat/cp_model_solver.h>
#include <ortools/sat/model.h>
#include <ortools/sat/sat_parameters.pb.h>

#include "stream_core/log.hpp"

namespace stream_core {

namespace {

namespace sat = operations_research::sat;
using Clock = std::chrono::steady_clock;

struct Item {
  std::size_t src{0}; // index into SlotProblem::candidates
  std::int64_t w{0};
};

int commit_day_for(const std::vector<int> &days) {
  const int first = *std::min_element(days.begin(), days.end());
  return std::max(0, first - 1);
}

// Eligible candidates, best first. Ties fall back to id so the order, and
// with it the chosen optimum, is reproducible.
std::vector<Item> eligible_items(const SlotProblem &p, double scale) {
  std::vector<Item> items;
  for (std::size_t i = 0; i < p.candidates.size(); ++i) {
    const auto &c = p.candidates[i];
    if (c.tier == RiskTier::NoGo)
      continue;
    const auto w = static_cast<std::int64_t>(std::llround(c.total_value() * scale));
    if (w <= 0)
      continue;
    items.push_back(Item{i, w});
  }
  std::sort(items.begin(), items.end(), [&](const Item &a, const Item &b) {
    if (a.w != b.w)
      return a.w > b.w;
    return p.candidates[a.src].id < p.candidates[b.src].id;
  });
  return items;
}

// Best items first while budget and capacity allow. Seeds the solver and
// stands in when it finds nothing before the time limit.
std::vector<char> greedy_take(const SlotProblem &p, const std::vector<Item> &items) {
  std::vector<char> take(items.size(), 0);
  std::vector<int> used(p.capacity.size(), 0);
  int left = p.budget;
  for (std::size_t i = 0; i < items.size() && left > 0; ++i) {
    const auto &days = p.candidates[items[i].src].days;
    const bool fits = std::all_of(days.begin(), days.end(), [&](int d) {
      return used[static_cast<std::size_t>(d)] < p.capacity[static_cast<std::size_t>(d)];
    });
    if (!fits)
      continue;
    for (const int d : days)
      ++used[static_cast<std::size_t>(d)];
    take[i] = 1;
    --left;
  }
  return take;
}

OptimizationResult build_result(const SlotProblem &p, const std::vector<Item> &items,
                                const std::vector<char> &take, int max_backups) {
  OptimizationResult res;
  for (std::size_t i = 0; i < items.size(); ++i) {
    const auto &c = p.candidates[items[i].src];
    PlannedPick pick{c.id, c.days, c.total_value(), commit_day_for(c.days), c.hazard};
    if (take[i]) {
      res.total_value += pick.value;
      res.objective += items[i].w;
      if (c.low_confidence) {
        res.warnings.push_back(EngineWarning{
            WarningKind::MissingData,
            fmt::format("{} selected on league-average defaults", c.id)});
      }
      res.selected.push_back(std::move(pick));
    } else if (static_cast<int>(res.backups.size()) < max_backups) {
      res.backups.push_back(std::move(pick));
    }
  }
  std::stable_sort(res.selected.begin(), res.selected.end(),
                   [](const PlannedPick &a, const PlannedPick &b) {
                     return a.commit_day < b.commit_day;
                   });
  return res;
}

double elapsed_ms(Clock::time_point start) {
  return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

} // namespace

bool OptimizationResult::contains(const std::string &id) const {
  return std::any_of(selected.begin(), selected.end(),
                     [&](const PlannedPick &s) { return s.id == id; });
}

void check_problem(const SlotProblem &p) {
  if (p.budget < 0)
    throw InvalidInput(fmt::format("budget must be non-negative, got {}", p.budget));
  for (std::size_t d = 0; d < p.capacity.size(); ++d) {
    if (p.capacity[d] < 0)
      throw InvalidInput(fmt::format("capacity on day {} is negative", d));
  }
  const int horizon = static_cast<int>(p.capacity.size());
  std::unordered_set<std::string> ids;
  for (const auto &c : p.candidates) {
    if (!ids.insert(c.id).second)
      throw InvalidInput("duplicate candidate id " + c.id);
    if (c.days.empty())
      throw InvalidInput(fmt::format("candidate {} occupies no days", c.id));
    std::vector<int> sorted = c.days;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
      throw InvalidInput(fmt::format("candidate {} lists a day twice", c.id));
    if (sorted.front() < 0 || sorted.back() >= horizon) {
      throw InvalidInput(fmt::format("candidate {} occupies a day outside [0, {})",
                                     c.id, horizon));
    }
    if (!std::isfinite(c.value_per_day))
      throw InvalidInput(fmt::format("candidate {} has a non-finite value", c.id));
  }
}

OptimizationResult SlotOptimizer::solve(const SlotProblem &p) const {
  check_problem(p);
  const auto start = Clock::now();
  const std::vector<Item> items = eligible_items(p, cfg_.value_scale);
  const std::vector<char> greedy = greedy_take(p, items);

  // One boolean per eligible candidate; a bundle occupies every one of its days.
  sat::CpModelBuilder model;
  std::vector<sat::BoolVar> pick;
  std::vector<std::int64_t> weights;
  pick.reserve(items.size());
  weights.reserve(items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    pick.push_back(model.NewBoolVar().WithName(p.candidates[items[i].src].id));
    weights.push_back(items[i].w);
    model.AddHint(pick.back(), greedy[i] != 0);
  }
  model.AddLessOrEqual(sat::LinearExpr::Sum(pick), p.budget);
  for (std::size_t d = 0; d < p.capacity.size(); ++d) {
    std::vector<sat::BoolVar> today;
    for (std::size_t i = 0; i < items.size(); ++i) {
      const auto &days = p.candidates[items[i].src].days;
      if (std::find(days.begin(), days.end(), static_cast<int>(d)) != days.end())
        today.push_back(pick[i]);
    }
    if (!today.empty())
      model.AddLessOrEqual(sat::LinearExpr::Sum(today), p.capacity[d]);
  }
  model.Maximize(sat::LinearExpr::WeightedSum(pick, weights));

  sat::SatParameters params;
  params.set_max_time_in_seconds(cfg_.time_limit_ms / 1000.0);
  // Single worker keeps tie-breaking between equal optima reproducible.
  params.set_num_workers(1);
  sat::Model env;
  env.Add(sat::NewSatParameters(params));
  const sat::CpSolverResponse response = sat::SolveCpModel(model.Build(), &env);

  std::vector<char> take = greedy;
  const sat::CpSolverStatus status = response.status();
  if (status == sat::CpSolverStatus::OPTIMAL || status == sat::CpSolverStatus::FEASIBLE) {
    for (std::size_t i = 0; i < items.size(); ++i)
      take[i] = sat::SolutionBooleanValue(response, pick[i]) ? 1 : 0;
  } else if (status != sat::CpSolverStatus::UNKNOWN) {
    // The empty selection is always feasible, so anything else is a model bug.
    throw InfeasibleConstraint(fmt::format("slot model rejected by CP-SAT: {}",
                                           sat::CpSolverStatus_Name(status)));
  }

  OptimizationResult res = build_result(p, items, take, cfg_.max_backups);
  res.nodes = response.num_branches();
  res.solve_ms = elapsed_ms(start);
  res.optimal = status == sat::CpSolverStatus::OPTIMAL;
  if (!res.optimal) {
    res.warnings.push_back(EngineWarning{
        WarningKind::SolverTimeout,
        fmt::format("solver hit {:.0f} ms cap; best feasible plan returned",
                    cfg_.time_limit_ms)});
    log_warn("slot solve stopped at the time limit ({}); returning {} plan (value {:.1f})",
             sat::CpSolverStatus_Name(status),
             status == sat::CpSolverStatus::UNKNOWN ? "greedy" : "incumbent",
             res.total_value);
  }
  log_debug("slot solve: {} eligible of {}, budget {}, {} branches, {:.2f} ms, value {:.1f}",
            items.size(), p.candidates.size(), p.budget, res.nodes, res.solve_ms,
            res.total_value);
  return res;
}

OptimizationResult SlotOptimizer::solve_brute_force(const SlotProblem &p) const {
  check_problem(p);
  const auto start = Clock::now();
  const std::vector<Item> items = eligible_items(p, cfg_.value_scale);
  const std::size_t n = items.size();
  const int limit = std::min(cfg_.brute_force_max_candidates, kMaxBruteForceCandidates);
  if (static_cast<int>(n) > limit)
    throw InvalidInput(fmt::format("brute force limited to {} candidates, got {}", limit, n));

  std::uint64_t best_mask = 0;
  std::int64_t best = 0;
  std::vector<int> used(p.capacity.size());
  const std::uint64_t end = std::uint64_t{1} << n;
  for (std::uint64_t mask = 1; mask < end; ++mask) {
    int count = 0;
    std::int64_t value = 0;
    std::fill(used.begin(), used.end(), 0);
    bool ok = true;
    for (std::size_t i = 0; i < n && ok; ++i) {
      if (!(mask & (std::uint64_t{1} << i)))
        continue;
      if (++count > p.budget) {
        ok = false;
        break;
      }
      value += items[i].w;
      for (const int d : p.candidates[items[i].src].days) {
        const auto di = static_cast<std::size_t>(d);
        if (++used[di] > p.capacity[di]) {
          ok = false;
          break;
        }
      }
    }
    if (ok && value > best) {
      best = value;
      best_mask = mask;
    }
  }

  std::vector<char> take(n, 0);
  for (std::size_t i = 0; i < n; ++i)
    take[i] = (best_mask & (std::uint64_t{1} << i)) ? 1 : 0;
  OptimizationResult res = build_result(p, items, take, cfg_.max_backups);
  res.nodes = static_cast<std::int64_t>(end);
  res.solve_ms = elapsed_ms(start);
  return res;
}

std::vector<Contingency> SlotOptimizer::plan_contingencies(
    const SlotProblem &p, const OptimizationResult &base) const {
  std::vector<PlannedPick> exposed = base.selected;
  std::stable_sort(exposed.begin(), exposed.end(),
                   [](const PlannedPick &a, const PlannedPick &b) {
                     if (a.hazard != b.hazard)
                       return static_cast<int>(a.hazard) < static_cast<int>(b.hazard);
                     return a.value > b.value;
                   });
  if (static_cast<int>(exposed.size()) > cfg_.max_contingencies)
    exposed.resize(static_cast<std::size_t>(cfg_.max_contingencies));

  std::vector<Contingency> out;
  for (const auto &pick : exposed) {
    SlotProblem without = p;
    without.candidates.erase(
        std::remove_if(without.candidates.begin(), without.candidates.end(),
                       [&](const ScoredCandidate &c) { return c.id == pick.id; }),
        without.candidates.end());
    const OptimizationResult alt = solve(without);

    Contingency c;
    c.if_sniped = pick.id;
    for (const auto &s : alt.selected) {
      if (!base.contains(s.id))
        c.fallbacks.push_back(s.id);
    }
    c.value_lost = base.total_value - alt.total_value;
    out.push_back(std::move(c));
  }
  return out;
}

} // namespace stream_core
