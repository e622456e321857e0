#include "stream_core/engine.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "stream_core/errors.hpp"
#include "stream_core/log.hpp"

namespace stream_core {

LearnedModel LearnedModel::fresh(const EngineConfig &cfg) {
  LearnedModel m;
  m.bandit = BanditModel::fresh(cfg.bandit, cfg.horizon.budget, cfg.horizon.days);
  return m;
}

namespace {

const EngineConfig &checked(const EngineConfig &cfg) {
  validate(cfg);
  if (cfg.bandit.feature_dim != kFeatureCount) {
    throw InvalidInput(fmt::format("bandit.feature_dim must be {} for the engine features",
                                   kFeatureCount));
  }
  return cfg;
}

} // namespace

DecisionEngine::DecisionEngine(EngineConfig cfg, LearnedModel model)
    : cfg_(checked(cfg)), risk_(cfg_.risk, cfg_.scoring),
      bandit_(cfg_.bandit, std::move(model.bandit)),
      posteriors_(std::move(model.posteriors)),
      value_history_(std::move(model.value_history)), survival_(cfg_.snipe),
      optimizer_(cfg_.solver), horizon_mgr_(cfg_.horizon),
      snapshot_(horizon_mgr_.start()) {
  bandit_.reset_horizon(cfg_.horizon.budget, cfg_.horizon.days);
}

DecisionEngine::DecisionEngine(EngineConfig cfg, LearnedModel model,
                               HorizonCheckpoint resume_from)
    : DecisionEngine(std::move(cfg), std::move(model)) {
  const HorizonSnapshot &s = resume_from.horizon;
  if (s.total_days != cfg_.horizon.days || s.budget_total != cfg_.horizon.budget ||
      s.capacity != cfg_.horizon.resolved_capacity()) {
    throw InvalidInput(fmt::format(
        "checkpoint is for a {}-day horizon with budget {}; configured {} days, budget {}",
        s.total_days, s.budget_total, cfg_.horizon.days, cfg_.horizon.budget));
  }
  if (s.day < 0 || s.day > s.total_days || s.budget_used < 0 || s.reserve < 0)
    throw InvalidInput(fmt::format("checkpoint day {} or counters out of range", s.day));
  horizon_mgr_.validate(s);
  for (const auto &p : resume_from.pending) {
    if (p.x.size() != kFeatureCount) {
      throw InvalidInput(fmt::format("pending outcome {} has {} features, expected {}", p.id,
                                     p.x.size(), kFeatureCount));
    }
  }

  snapshot_ = s;
  for (auto &p : resume_from.pending) {
    Context ctx;
    ctx.x = std::move(p.x);
    ctx.expected = p.expected;
    ctx.prior_mean = p.prior_mean;
    pending_[p.id] = std::move(ctx);
  }
  // The bandit spends a unit per recorded outcome, the ledger per commit.
  BanditModel &st = bandit_.mutable_state();
  st.budget_remaining = std::min(
      st.budget_total,
      std::max(0, snapshot_.remaining_budget()) + static_cast<int>(pending_.size()));
  st.time_remaining = std::max(0, snapshot_.total_days - snapshot_.day);
  log_info("resumed horizon at day {}/{}: {}/{} used, {} outcome(s) pending",
           snapshot_.day + 1, snapshot_.total_days, snapshot_.budget_used,
           snapshot_.budget_total, pending_.size());
}

void DecisionEngine::set_feed(const std::vector<Candidate> &feed) {
  CandidateTable table(feed);
  for (const auto &c : table.candidates()) {
    for (const int d : c.days) {
      if (d < 0 || d >= snapshot_.total_days) {
        throw InvalidInput(fmt::format("candidate {} occupies day {} outside the {}-day horizon",
                                       c.id, d, snapshot_.total_days));
      }
    }
    if (c.days.empty())
      throw InvalidInput(fmt::format("candidate {} occupies no days", c.id));
    if (!c.rates)
      log_info("{} has no rate stats; using league-average defaults", c.id);
  }
  feed_ = std::move(table);
  scored_.clear();
}

std::vector<RiskAssessment> DecisionEngine::assess_feed() const {
  std::vector<RiskAssessment> out;
  out.reserve(feed_.size());
  for (const auto &c : feed_.candidates())
    out.push_back(risk_.assess(c));
  return out;
}

std::vector<ScoredCandidate> DecisionEngine::score() {
  std::vector<ScoredCandidate> out;
  scored_.clear();
  for (const auto &c : feed_.candidates()) {
    const RiskAssessment ra = risk_.assess(c);
    Context ctx;
    ctx.x = build_features(c, ra);
    ctx.expected = ra.expected;
    ctx.prior_mean = c.prior_outcome.value_or(ra.expected);
    ctx.days = c.days;

    const int until = c.first_day() - snapshot_.day;
    const UcbScore u = bandit_.score(ctx.x, until > 0 ? std::optional<int>(until)
                                                      : std::nullopt);
    double base = ra.expected;
    if (posteriors_.has(c.id) && posteriors_.get(c.id).n > 0)
      base = posteriors_.posterior_mean(c.id);
    // Risk penalty applies to whichever base estimate is used.
    const double penalty = ra.expected - ra.risk_adjusted_value;
    ctx.value_per_day = base - penalty + u.mean + u.bonus;

    ScoredCandidate s;
    s.id = c.id;
    s.days = c.days;
    s.value_per_day = ctx.value_per_day;
    s.tier = ra.tier;
    s.hazard = c.hazard;
    s.low_confidence = ra.low_confidence;
    out.push_back(std::move(s));
    scored_[c.id] = std::move(ctx);
  }
  return out;
}

OptimizationResult DecisionEngine::optimize() {
  const std::vector<ScoredCandidate> scored = score();
  std::vector<EngineWarning> stale;
  while (true) {
    last_problem_ = horizon_mgr_.remaining_problem(snapshot_, scored);
    OptimizationResult res = optimizer_.solve(last_problem_);
    bool resolve = false;
    if (oracle_) {
      for (const auto &pick : res.selected) {
        if (oracle_(pick.id))
          continue;
        snapshot_ = horizon_mgr_.mark_unavailable(snapshot_, pick.id);
        stale.push_back(EngineWarning{
            WarningKind::StaleAvailability,
            fmt::format("{} was claimed before commit; re-solved without it", pick.id)});
        log_warn("{} no longer available; excluding and re-solving", pick.id);
        resolve = true;
      }
    }
    if (!resolve) {
      res.warnings.insert(res.warnings.begin(), stale.begin(), stale.end());
      return res;
    }
  }
}

DailyRecommendation DecisionEngine::recommend() {
  DailyRecommendation rec;
  rec.plan = optimize();
  rec.day = snapshot_.day;
  rec.warnings = rec.plan.warnings;

  const ThresholdCalculator tc(cfg_.threshold, value_history_);
  const int left = snapshot_.remaining_budget();
  rec.threshold = tc.threshold(snapshot_.day, left, snapshot_.total_days);
  rec.option_value = tc.option_value(snapshot_.day, left, snapshot_.total_days);

  auto rank = [&](const PlannedPick &pick, bool selected) {
    UrgencyEntry e;
    e.id = pick.id;
    e.value = pick.value;
    e.selected = selected;
    e.days_until_needed = *std::min_element(pick.days.begin(), pick.days.end()) - snapshot_.day;
    e.urgency = survival_.urgency(pick.value, pick.hazard, e.days_until_needed);
    e.snipe_probability = survival_.snipe_probability(pick.hazard, e.days_until_needed);
    e.above_threshold =
        pick.value / static_cast<double>(pick.days.size()) >= rec.threshold;
    const ActDecision d = survival_.should_act_now(pick.id, pick.value, pick.hazard,
                                                   e.days_until_needed, rec.option_value);
    if (selected && pick.commit_day <= snapshot_.day) {
      e.act_now = true;
      e.reason = fmt::format("ADD NOW: {} must be added today to be active on day {}",
                             pick.id, snapshot_.day + e.days_until_needed);
    } else {
      e.act_now = selected && d.act_now;
      e.reason = d.reason;
    }
    rec.urgency_ranking.push_back(std::move(e));
  };
  for (const auto &pick : rec.plan.selected)
    rank(pick, true);
  for (const auto &pick : rec.plan.backups)
    rank(pick, false);
  std::stable_sort(rec.urgency_ranking.begin(), rec.urgency_ranking.end(),
                   [](const UrgencyEntry &a, const UrgencyEntry &b) {
                     return a.urgency > b.urgency;
                   });
  if (static_cast<int>(rec.urgency_ranking.size()) > cfg_.snipe.max_snipe_alerts)
    rec.urgency_ranking.resize(static_cast<std::size_t>(cfg_.snipe.max_snipe_alerts));
  for (const auto &e : rec.urgency_ranking) {
    if (e.act_now)
      rec.must_act_today.push_back(e.id);
  }

  rec.contingencies = optimizer_.plan_contingencies(last_problem_, rec.plan);

  std::vector<BanditArm> arms;
  for (const auto &c : last_problem_.candidates) {
    if (c.tier == RiskTier::NoGo)
      continue;
    const Context &ctx = scored_.at(c.id);
    const int until = *std::min_element(c.days.begin(), c.days.end()) - snapshot_.day;
    arms.push_back(BanditArm{c.id, ctx.x, until > 0 ? std::optional<int>(until)
                                                    : std::nullopt});
  }
  if (const auto choice = bandit_.select(arms))
    rec.exploration_pick = choice->id;

  log_debug("day {}: {} selected, {} must act, threshold {:.1f}, option value {:.1f}",
            rec.day, rec.plan.selected.size(), rec.must_act_today.size(), rec.threshold,
            rec.option_value);
  return rec;
}

const HorizonSnapshot &DecisionEngine::commit(const std::string &id) {
  if (!feed_.has_id(id))
    throw InvalidInput(fmt::format("cannot commit {}: not in the current feed", id));
  if (scored_.find(id) == scored_.end())
    score();
  Context ctx = scored_.at(id);

  CommittedPick pick;
  pick.id = id;
  pick.value_per_day = ctx.value_per_day;
  for (const int d : ctx.days) {
    if (d >= snapshot_.day)
      pick.days.push_back(d);
  }
  snapshot_ = horizon_mgr_.commit(snapshot_, pick);
  pending_[id] = std::move(ctx);
  return snapshot_;
}

void DecisionEngine::record_outcome(const std::string &id, double per_day_outcome) {
  auto it = pending_.find(id);
  if (it == pending_.end())
    throw InvalidInput(fmt::format("no committed pick {} awaiting an outcome", id));
  const Context &ctx = it->second;

  bandit_.update(ctx.x, per_day_outcome - ctx.expected);
  if (!posteriors_.has(id)) {
    posteriors_.set_prior(id, ctx.prior_mean, cfg_.belief.prior_variance,
                          cfg_.belief.observation_variance);
  }
  posteriors_.update(id, per_day_outcome);
  value_history_.push_back(per_day_outcome);
  log_debug("outcome {} for {}: posterior mean {:.2f}, variance {:.2f}", per_day_outcome,
            id, posteriors_.posterior_mean(id), posteriors_.posterior_variance(id));
  pending_.erase(it);
}

const HorizonSnapshot &DecisionEngine::advance_day() {
  snapshot_ = horizon_mgr_.advance(snapshot_);
  bandit_.advance_time();
  return snapshot_;
}

const HorizonSnapshot &DecisionEngine::mark_unavailable(const std::string &id) {
  snapshot_ = horizon_mgr_.mark_unavailable(snapshot_, id);
  return snapshot_;
}

const HorizonSnapshot &DecisionEngine::drop(const std::string &id) {
  snapshot_ = horizon_mgr_.drop(snapshot_, id);
  return snapshot_;
}

const HorizonSnapshot &DecisionEngine::set_reserve(int reserve) {
  snapshot_ = horizon_mgr_.with_reserve(snapshot_, reserve);
  return snapshot_;
}

const HorizonSnapshot &DecisionEngine::set_reserve_for_injuries(int n_injured,
                                                                int n_day_to_day) {
  return set_reserve(recommended_reserve(cfg_.threshold, n_injured, n_day_to_day));
}

const HorizonSnapshot &DecisionEngine::start_new_horizon() {
  snapshot_ = horizon_mgr_.start();
  bandit_.reset_horizon(cfg_.horizon.budget, cfg_.horizon.days);
  feed_ = CandidateTable();
  scored_.clear();
  last_problem_ = SlotProblem();
  log_info("new horizon: {} days, budget {}", snapshot_.total_days, snapshot_.budget_total);
  return snapshot_;
}

void DecisionEngine::start_new_season() {
  bandit_ = BudgetedBandit(
      cfg_.bandit, BanditModel::fresh(cfg_.bandit, cfg_.horizon.budget, cfg_.horizon.days));
  posteriors_ = ProjectionBook();
  value_history_.clear();
  pending_.clear();
  log_info("new season: learned model reset to its prior");
  start_new_horizon();
}

LearnedModel DecisionEngine::model() const {
  LearnedModel m;
  m.bandit = bandit_.state();
  m.posteriors = posteriors_;
  m.value_history = value_history_;
  return m;
}

HorizonCheckpoint DecisionEngine::checkpoint() const {
  HorizonCheckpoint cp;
  cp.horizon = snapshot_;
  for (const auto &kv : pending_)
    cp.pending.push_back(PendingOutcome{kv.first, kv.second.x, kv.second.expected,
                                        kv.second.prior_mean});
  std::sort(cp.pending.begin(), cp.pending.end(),
            [](const PendingOutcome &a, const PendingOutcome &b) { return a.id < b.id; });
  return cp;
}

} // namespace stream_core
