#include "stream_core/config.hpp"
#include "stream_core/correlation.hpp"
#include "stream_core/engine.hpp"
#include "stream_core/log.hpp"
#include "stream_core/risk.hpp"
#include "stream_core/state_store.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

namespace sc = stream_core;

NB_MODULE(stream_core, m) {
  m.doc() = "Budgeted streaming decision engine.";

  nanobind::enum_<sc::LogLevel>(m, "LogLevel")
      .value("Debug", sc::LogLevel::Debug)
      .value("Info", sc::LogLevel::Info)
      .value("Warn", sc::LogLevel::Warn)
      .value("Error", sc::LogLevel::Error);
  m.def("set_log_level", &sc::set_log_level);

  nanobind::enum_<sc::HazardTier>(m, "HazardTier")
      .value("Elite", sc::HazardTier::Elite)
      .value("High", sc::HazardTier::High)
      .value("Moderate", sc::HazardTier::Moderate)
      .value("Low", sc::HazardTier::Low)
      .value("Minimal", sc::HazardTier::Minimal);

  nanobind::enum_<sc::RiskTier>(m, "RiskTier")
      .value("Elite", sc::RiskTier::Elite)
      .value("Safe", sc::RiskTier::Safe)
      .value("Moderate", sc::RiskTier::Moderate)
      .value("Risky", sc::RiskTier::Risky)
      .value("Dangerous", sc::RiskTier::Dangerous)
      .value("NoGo", sc::RiskTier::NoGo);

  nanobind::enum_<sc::WarningKind>(m, "WarningKind")
      .value("SolverTimeout", sc::WarningKind::SolverTimeout)
      .value("MissingData", sc::WarningKind::MissingData)
      .value("StaleAvailability", sc::WarningKind::StaleAvailability);

  nanobind::class_<sc::EngineWarning>(m, "EngineWarning")
      .def_ro("kind", &sc::EngineWarning::kind)
      .def_ro("message", &sc::EngineWarning::message)
      .def("__repr__", [](const sc::EngineWarning &w) {
        return fmt::format("EngineWarning(kind={}, message={})",
                           sc::warning_kind_name(w.kind), w.message);
      });

  // Candidate feed
  nanobind::class_<sc::RateStats>(m, "RateStats")
      .def(nanobind::init<>())
      .def_rw("negative_per9", &sc::RateStats::negative_per9)
      .def_rw("positive_per9", &sc::RateStats::positive_per9)
      .def_rw("walk_per9", &sc::RateStats::walk_per9)
      .def_rw("hit_per9", &sc::RateStats::hit_per9)
      .def_rw("sample_units", &sc::RateStats::sample_units);

  nanobind::class_<sc::MatchupFactors>(m, "MatchupFactors")
      .def(nanobind::init<>())
      .def_rw("opponent_negative", &sc::MatchupFactors::opponent_negative)
      .def_rw("opponent_positive", &sc::MatchupFactors::opponent_positive)
      .def_rw("venue_negative", &sc::MatchupFactors::venue_negative)
      .def_rw("elite_opponent", &sc::MatchupFactors::elite_opponent)
      .def_rw("hostile_venue", &sc::MatchupFactors::hostile_venue);

  nanobind::class_<sc::ProfileFlags>(m, "ProfileFlags")
      .def(nanobind::init<>())
      .def_rw("ground_ball", &sc::ProfileFlags::ground_ball)
      .def_rw("fly_ball", &sc::ProfileFlags::fly_ball);

  nanobind::class_<sc::Candidate>(m, "Candidate")
      .def(nanobind::init<>())
      .def(nanobind::init<std::string, std::vector<int>>())
      .def_rw("id", &sc::Candidate::id)
      .def_rw("days", &sc::Candidate::days)
      .def_rw("rates", &sc::Candidate::rates)
      .def_rw("matchup", &sc::Candidate::matchup)
      .def_rw("profile", &sc::Candidate::profile)
      .def_rw("expected_duration", &sc::Candidate::expected_duration)
      .def_rw("hazard", &sc::Candidate::hazard)
      .def_rw("prior_outcome", &sc::Candidate::prior_outcome)
      .def("__repr__", [](const sc::Candidate &c) {
        return fmt::format("Candidate(id={}, days=[{}], hazard={})", c.id,
                           fmt::join(c.days, ", "), sc::hazard_tier_name(c.hazard));
      });

  // Configuration
  nanobind::class_<sc::ScoringConfig>(m, "ScoringConfig")
      .def(nanobind::init<>())
      .def_rw("per_duration_unit", &sc::ScoringConfig::per_duration_unit)
      .def_rw("per_positive", &sc::ScoringConfig::per_positive)
      .def_rw("per_walk", &sc::ScoringConfig::per_walk)
      .def_rw("per_negative", &sc::ScoringConfig::per_negative)
      .def_rw("per_hit", &sc::ScoringConfig::per_hit);

  nanobind::class_<sc::BanditConfig>(m, "BanditConfig")
      .def(nanobind::init<>())
      .def_rw("alpha", &sc::BanditConfig::alpha)
      .def_rw("lambda_reg", &sc::BanditConfig::lambda_reg)
      .def_rw("urgency_weight", &sc::BanditConfig::urgency_weight);

  nanobind::class_<sc::BeliefConfig>(m, "BeliefConfig")
      .def(nanobind::init<>())
      .def_rw("prior_variance", &sc::BeliefConfig::prior_variance)
      .def_rw("observation_variance", &sc::BeliefConfig::observation_variance);

  nanobind::class_<sc::SnipeConfig>(m, "SnipeConfig")
      .def(nanobind::init<>())
      .def_rw("league_activity", &sc::SnipeConfig::league_activity)
      .def_rw("max_snipe_alerts", &sc::SnipeConfig::max_snipe_alerts);

  nanobind::class_<sc::ThresholdConfig>(m, "ThresholdConfig")
      .def(nanobind::init<>())
      .def_rw("base_threshold", &sc::ThresholdConfig::base_threshold)
      .def_rw("cost_underage", &sc::ThresholdConfig::cost_underage)
      .def_rw("emergency_rate", &sc::ThresholdConfig::emergency_rate);

  nanobind::class_<sc::RiskConfig>(m, "RiskConfig")
      .def(nanobind::init<>())
      .def_rw("risk_aversion", &sc::RiskConfig::risk_aversion)
      .def_rw("catastrophe_penalty", &sc::RiskConfig::catastrophe_penalty)
      .def_rw("disaster_threshold", &sc::RiskConfig::disaster_threshold)
      .def_rw("max_disaster_prob", &sc::RiskConfig::max_disaster_prob)
      .def_rw("max_blowup_prob", &sc::RiskConfig::max_blowup_prob)
      .def_rw("min_sample_units", &sc::RiskConfig::min_sample_units);

  nanobind::class_<sc::HorizonConfig>(m, "HorizonConfig")
      .def(nanobind::init<>())
      .def_rw("days", &sc::HorizonConfig::days)
      .def_rw("budget", &sc::HorizonConfig::budget)
      .def_rw("reserve", &sc::HorizonConfig::reserve)
      .def_rw("default_capacity", &sc::HorizonConfig::default_capacity)
      .def_rw("capacity", &sc::HorizonConfig::capacity);

  nanobind::class_<sc::SolverConfig>(m, "SolverConfig")
      .def(nanobind::init<>())
      .def_rw("time_limit_ms", &sc::SolverConfig::time_limit_ms)
      .def_rw("value_scale", &sc::SolverConfig::value_scale)
      .def_rw("max_backups", &sc::SolverConfig::max_backups)
      .def_rw("max_contingencies", &sc::SolverConfig::max_contingencies);

  nanobind::class_<sc::EngineConfig>(m, "EngineConfig")
      .def(nanobind::init<>())
      .def_rw("scoring", &sc::EngineConfig::scoring)
      .def_rw("risk", &sc::EngineConfig::risk)
      .def_rw("bandit", &sc::EngineConfig::bandit)
      .def_rw("belief", &sc::EngineConfig::belief)
      .def_rw("snipe", &sc::EngineConfig::snipe)
      .def_rw("threshold", &sc::EngineConfig::threshold)
      .def_rw("horizon", &sc::EngineConfig::horizon)
      .def_rw("solver", &sc::EngineConfig::solver);
  m.def("load_engine_config", &sc::load_engine_config, nanobind::arg("path"));

  // Results
  nanobind::class_<sc::RiskAssessment>(m, "RiskAssessment")
      .def_ro("id", &sc::RiskAssessment::id)
      .def_ro("adjusted_rate", &sc::RiskAssessment::adjusted_rate)
      .def_ro("expected", &sc::RiskAssessment::expected)
      .def_ro("floor", &sc::RiskAssessment::floor)
      .def_ro("ceiling", &sc::RiskAssessment::ceiling)
      .def_ro("disaster_prob", &sc::RiskAssessment::disaster_prob)
      .def_ro("blowup_prob", &sc::RiskAssessment::blowup_prob)
      .def_ro("risk_score", &sc::RiskAssessment::risk_score)
      .def_ro("risk_adjusted_value", &sc::RiskAssessment::risk_adjusted_value)
      .def_ro("tier", &sc::RiskAssessment::tier)
      .def_ro("low_confidence", &sc::RiskAssessment::low_confidence)
      .def_ro("recommendation", &sc::RiskAssessment::recommendation)
      .def_ro("warnings", &sc::RiskAssessment::warnings)
      .def("__repr__", [](const sc::RiskAssessment &r) {
        return fmt::format("RiskAssessment(id={}, expected={:.1f}, disaster={:.3f}, tier={})",
                           r.id, r.expected, r.disaster_prob, sc::risk_tier_name(r.tier));
      });

  nanobind::class_<sc::PlannedPick>(m, "PlannedPick")
      .def_ro("id", &sc::PlannedPick::id)
      .def_ro("days", &sc::PlannedPick::days)
      .def_ro("value", &sc::PlannedPick::value)
      .def_ro("commit_day", &sc::PlannedPick::commit_day)
      .def("__repr__", [](const sc::PlannedPick &p) {
        return fmt::format("PlannedPick(id={}, value={:.1f}, commit_day={})", p.id, p.value,
                           p.commit_day);
      });

  nanobind::class_<sc::OptimizationResult>(m, "OptimizationResult")
      .def_ro("selected", &sc::OptimizationResult::selected)
      .def_ro("total_value", &sc::OptimizationResult::total_value)
      .def_ro("backups", &sc::OptimizationResult::backups)
      .def_ro("optimal", &sc::OptimizationResult::optimal)
      .def_ro("solve_ms", &sc::OptimizationResult::solve_ms)
      .def_ro("warnings", &sc::OptimizationResult::warnings)
      .def("__repr__", [](const sc::OptimizationResult &r) {
        return fmt::format("OptimizationResult(selected={}, total_value={:.1f}, optimal={})",
                           r.selected.size(), r.total_value, r.optimal);
      });

  nanobind::class_<sc::Contingency>(m, "Contingency")
      .def_ro("if_sniped", &sc::Contingency::if_sniped)
      .def_ro("fallbacks", &sc::Contingency::fallbacks)
      .def_ro("value_lost", &sc::Contingency::value_lost);

  nanobind::class_<sc::UrgencyEntry>(m, "UrgencyEntry")
      .def_ro("id", &sc::UrgencyEntry::id)
      .def_ro("value", &sc::UrgencyEntry::value)
      .def_ro("urgency", &sc::UrgencyEntry::urgency)
      .def_ro("snipe_probability", &sc::UrgencyEntry::snipe_probability)
      .def_ro("days_until_needed", &sc::UrgencyEntry::days_until_needed)
      .def_ro("selected", &sc::UrgencyEntry::selected)
      .def_ro("act_now", &sc::UrgencyEntry::act_now)
      .def_ro("reason", &sc::UrgencyEntry::reason);

  nanobind::class_<sc::DailyRecommendation>(m, "DailyRecommendation")
      .def_ro("day", &sc::DailyRecommendation::day)
      .def_ro("threshold", &sc::DailyRecommendation::threshold)
      .def_ro("option_value", &sc::DailyRecommendation::option_value)
      .def_ro("must_act_today", &sc::DailyRecommendation::must_act_today)
      .def_ro("urgency_ranking", &sc::DailyRecommendation::urgency_ranking)
      .def_ro("contingencies", &sc::DailyRecommendation::contingencies)
      .def_ro("exploration_pick", &sc::DailyRecommendation::exploration_pick)
      .def_ro("plan", &sc::DailyRecommendation::plan)
      .def_ro("warnings", &sc::DailyRecommendation::warnings)
      .def("__repr__", [](const sc::DailyRecommendation &r) {
        return fmt::format("DailyRecommendation(day={}, must_act_today=[{}])", r.day,
                           fmt::join(r.must_act_today, ", "));
      });

  nanobind::class_<sc::HorizonSnapshot>(m, "HorizonSnapshot")
      .def_ro("day", &sc::HorizonSnapshot::day)
      .def_ro("total_days", &sc::HorizonSnapshot::total_days)
      .def_ro("budget_total", &sc::HorizonSnapshot::budget_total)
      .def_ro("budget_used", &sc::HorizonSnapshot::budget_used)
      .def_ro("complete", &sc::HorizonSnapshot::complete)
      .def("remaining_budget", &sc::HorizonSnapshot::remaining_budget)
      .def("droppable", &sc::HorizonSnapshot::droppable)
      .def("status_text", &sc::HorizonSnapshot::status_text)
      .def("__repr__", [](const sc::HorizonSnapshot &s) { return s.status_text(); });

  // Learned state
  nanobind::class_<sc::PosteriorBelief>(m, "PosteriorBelief")
      .def(nanobind::init<double, double, double>())
      .def_ro("n", &sc::PosteriorBelief::n)
      .def("update", &sc::PosteriorBelief::update)
      .def("posterior_mean", &sc::PosteriorBelief::posterior_mean)
      .def("posterior_variance", &sc::PosteriorBelief::posterior_variance)
      .def("sample", &sc::PosteriorBelief::sample, nanobind::arg("count"), nanobind::arg("seed"))
      .def("confidence_interval", &sc::PosteriorBelief::confidence_interval);

  nanobind::class_<sc::LearnedModel>(m, "LearnedModel")
      .def_static("fresh", &sc::LearnedModel::fresh)
      .def_ro("value_history", &sc::LearnedModel::value_history)
      .def("__repr__", [](const sc::LearnedModel &lm) {
        return fmt::format("LearnedModel(observations={}, posteriors={})",
                           lm.bandit.observations, lm.posteriors.size());
      });
  m.def("save_model", &sc::save_model, nanobind::arg("model"), nanobind::arg("path"));
  m.def("load_model", &sc::load_model, nanobind::arg("path"), nanobind::arg("config"));

  nanobind::class_<sc::CorrelationEstimator>(m, "CorrelationEstimator")
      .def(nanobind::init<>())
      .def("fit", &sc::CorrelationEstimator::fit, nanobind::arg("outcomes"),
           nanobind::arg("ids"))
      .def_prop_ro("fitted", &sc::CorrelationEstimator::fitted)
      .def_prop_ro("shrinkage", &sc::CorrelationEstimator::shrinkage)
      .def("covariance", &sc::CorrelationEstimator::covariance)
      .def("correlation_matrix",
           nanobind::overload_cast<>(&sc::CorrelationEstimator::correlation, nanobind::const_))
      .def("correlation",
           nanobind::overload_cast<const std::string &, const std::string &>(
               &sc::CorrelationEstimator::correlation, nanobind::const_))
      .def("__repr__", [](const sc::CorrelationEstimator &c) {
        return fmt::format("CorrelationEstimator(ids={}, fitted={}, shrinkage={:.3f})",
                           c.ids().size(), c.fitted(), c.shrinkage());
      });

  nanobind::class_<sc::HorizonCheckpoint>(m, "HorizonCheckpoint")
      .def_ro("horizon", &sc::HorizonCheckpoint::horizon)
      .def("__repr__", [](const sc::HorizonCheckpoint &cp) {
        return fmt::format("HorizonCheckpoint(day={}, used={}/{}, pending={})", cp.horizon.day,
                           cp.horizon.budget_used, cp.horizon.budget_total, cp.pending.size());
      });

  nanobind::class_<sc::DecisionEngine>(m, "DecisionEngine")
      .def(nanobind::init<sc::EngineConfig, sc::LearnedModel>())
      .def(nanobind::init<sc::EngineConfig, sc::LearnedModel, sc::HorizonCheckpoint>())
      .def("set_availability_oracle", &sc::DecisionEngine::set_availability_oracle)
      .def("set_feed", &sc::DecisionEngine::set_feed)
      .def("assess", &sc::DecisionEngine::assess)
      .def("assess_feed", &sc::DecisionEngine::assess_feed)
      .def("optimize", &sc::DecisionEngine::optimize)
      .def("recommend", &sc::DecisionEngine::recommend)
      .def("commit", &sc::DecisionEngine::commit, nanobind::rv_policy::copy)
      .def("record_outcome", &sc::DecisionEngine::record_outcome)
      .def("advance_day", &sc::DecisionEngine::advance_day, nanobind::rv_policy::copy)
      .def("mark_unavailable", &sc::DecisionEngine::mark_unavailable,
           nanobind::rv_policy::copy)
      .def("drop", &sc::DecisionEngine::drop, nanobind::rv_policy::copy)
      .def("set_reserve", &sc::DecisionEngine::set_reserve, nanobind::rv_policy::copy)
      .def("set_reserve_for_injuries", &sc::DecisionEngine::set_reserve_for_injuries,
           nanobind::rv_policy::copy)
      .def("start_new_horizon", &sc::DecisionEngine::start_new_horizon,
           nanobind::rv_policy::copy)
      .def("start_new_season", &sc::DecisionEngine::start_new_season)
      .def("model", &sc::DecisionEngine::model)
      .def("checkpoint", &sc::DecisionEngine::checkpoint)
      .def("horizon", &sc::DecisionEngine::horizon, nanobind::rv_policy::copy);
  m.def("save_engine", &sc::save_engine, nanobind::arg("engine"), nanobind::arg("path"));
  m.def("load_engine", &sc::load_engine, nanobind::arg("path"), nanobind::arg("config"));
}
