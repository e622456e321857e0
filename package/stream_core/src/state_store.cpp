#include "stream_core/state_store.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "stream_core/errors.hpp"
#include "stream_core/log.hpp"

namespace stream_core {

namespace {

nlohmann::json bandit_to_json(const BanditModel &m) {
  nlohmann::json A = nlohmann::json::array();
  for (Eigen::Index r = 0; r < m.A.rows(); ++r) {
    nlohmann::json row = nlohmann::json::array();
    for (Eigen::Index c = 0; c < m.A.cols(); ++c)
      row.push_back(m.A(r, c));
    A.push_back(std::move(row));
  }
  std::vector<double> b(m.b.data(), m.b.data() + m.b.size());
  return {{"dim", m.dim},
          {"alpha", m.alpha},
          {"A", std::move(A)},
          {"b", b},
          {"observations", m.observations},
          {"budget_total", m.budget_total},
          {"budget_remaining", m.budget_remaining},
          {"time_total", m.time_total},
          {"time_remaining", m.time_remaining}};
}

BanditModel bandit_from_json(const nlohmann::json &j, const EngineConfig &engine_cfg) {
  const BanditConfig &cfg = engine_cfg.bandit;
  BanditModel m;
  m.dim = j.at("dim").get<int>();
  if (m.dim != cfg.feature_dim) {
    throw InvalidInput(fmt::format("bandit dimension {} does not match configured {}",
                                   m.dim, cfg.feature_dim));
  }
  m.alpha = j.value("alpha", cfg.alpha);
  const auto &A = j.at("A");
  const auto b = j.at("b").get<std::vector<double>>();
  if (!A.is_array() || static_cast<int>(A.size()) != m.dim ||
      static_cast<int>(b.size()) != m.dim) {
    throw InvalidInput("bandit A/b do not match the stored dimension");
  }
  m.A.resize(m.dim, m.dim);
  for (int r = 0; r < m.dim; ++r) {
    const auto row = A.at(static_cast<std::size_t>(r)).get<std::vector<double>>();
    if (static_cast<int>(row.size()) != m.dim)
      throw InvalidInput(fmt::format("bandit A row {} has {} entries", r, row.size()));
    for (int c = 0; c < m.dim; ++c)
      m.A(r, c) = row[static_cast<std::size_t>(c)];
  }
  m.b = Eigen::Map<const Eigen::VectorXd>(b.data(), m.dim);
  m.observations = j.value("observations", 0);
  m.budget_total = j.value("budget_total", engine_cfg.horizon.budget);
  m.budget_remaining = j.value("budget_remaining", m.budget_total);
  m.time_total = j.value("time_total", engine_cfg.horizon.days);
  m.time_remaining = j.value("time_remaining", m.time_total);
  return m;
}

nlohmann::json pick_to_json(const CommittedPick &p) {
  return {{"id", p.id},
          {"commit_day", p.commit_day},
          {"days", p.days},
          {"value_per_day", p.value_per_day},
          {"locked", p.locked}};
}

CommittedPick pick_from_json(const nlohmann::json &j) {
  CommittedPick p;
  p.id = j.at("id").get<std::string>();
  p.commit_day = j.at("commit_day").get<int>();
  p.days = j.at("days").get<std::vector<int>>();
  p.value_per_day = j.value("value_per_day", 0.0);
  p.locked = j.value("locked", true);
  return p;
}

std::vector<CommittedPick> picks_from_json(const nlohmann::json &j, const char *key) {
  std::vector<CommittedPick> out;
  if (!j.contains(key))
    return out;
  for (const auto &item : j.at(key))
    out.push_back(pick_from_json(item));
  return out;
}

void write_atomically(const nlohmann::json &doc, const std::string &path) {
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out)
      throw PersistenceError(fmt::format("cannot open {} for writing", tmp));
    out << doc.dump(2) << '\n';
    out.flush();
    if (!out)
      throw PersistenceError(fmt::format("failed writing {}", tmp));
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    throw PersistenceError(fmt::format("cannot rename {} to {}: {}", tmp, path, ec.message()));
  }
}

// Empty when the file is missing or not JSON; both are logged.
std::optional<nlohmann::json> read_document(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    log_warn("no persisted state at {}; starting from a fresh prior", path);
    return std::nullopt;
  }
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error &e) {
    log_warn("persisted state {} is corrupt ({}); starting from a fresh prior", path, e.what());
    return std::nullopt;
  }
  return j;
}

} // namespace

nlohmann::json model_to_json(const LearnedModel &m) {
  nlohmann::json posteriors = nlohmann::json::object();
  for (const auto &id : m.posteriors.ids()) {
    const PosteriorBelief &p = m.posteriors.get(id);
    posteriors[id] = {{"prior_mean", p.prior_mean},
                      {"prior_variance", p.prior_variance},
                      {"observation_variance", p.observation_variance},
                      {"observed_mean", p.observed_mean},
                      {"n", p.n},
                      {"posterior_mean", p.posterior_mean()},
                      {"posterior_variance", p.posterior_variance()}};
  }
  return {{"schema_version", kSchemaVersion},
          {"bandit", bandit_to_json(m.bandit)},
          {"posteriors", std::move(posteriors)},
          {"value_history", m.value_history}};
}

LearnedModel model_from_json(const nlohmann::json &j, const EngineConfig &cfg) {
  try {
    if (!j.is_object())
      throw InvalidInput("persisted model must be a JSON object");
    const int version = j.value("schema_version", 0);
    if (version > kSchemaVersion) {
      throw InvalidInput(
          fmt::format("schema version {} is newer than supported {}", version, kSchemaVersion));
    }

    LearnedModel m = LearnedModel::fresh(cfg);
    if (j.contains("bandit"))
      m.bandit = bandit_from_json(j.at("bandit"), cfg);
    if (j.contains("posteriors")) {
      for (const auto &item : j.at("posteriors").items()) {
        const auto &v = item.value();
        PosteriorBelief p(v.at("prior_mean").get<double>(),
                          v.value("prior_variance", cfg.belief.prior_variance),
                          v.value("observation_variance", cfg.belief.observation_variance));
        p.observed_mean = v.value("observed_mean", 0.0);
        p.n = v.value("n", 0);
        if (p.n < 0)
          throw InvalidInput(fmt::format("posterior {} has a negative count", item.key()));
        m.posteriors.restore(item.key(), p);
      }
    }
    if (j.contains("value_history"))
      m.value_history = j.at("value_history").get<std::vector<double>>();
    return m;
  } catch (const nlohmann::json::exception &e) {
    throw InvalidInput(fmt::format("malformed persisted model: {}", e.what()));
  }
}

void save_model(const LearnedModel &m, const std::string &path) {
  write_atomically(model_to_json(m), path);
  log_debug("saved learned model to {}", path);
}

LearnedModel load_model(const std::string &path, const EngineConfig &cfg) {
  const std::optional<nlohmann::json> j = read_document(path);
  if (!j)
    return LearnedModel::fresh(cfg);
  try {
    LearnedModel m = model_from_json(*j, cfg);
    log_info("loaded learned model from {} ({} posteriors, {} observations)", path,
             m.posteriors.size(), m.bandit.observations);
    return m;
  } catch (const InvalidInput &e) {
    log_warn("persisted model {} unusable ({}); starting from a fresh prior", path, e.what());
    return LearnedModel::fresh(cfg);
  }
}

nlohmann::json checkpoint_to_json(const HorizonCheckpoint &cp) {
  const HorizonSnapshot &s = cp.horizon;
  nlohmann::json committed = nlohmann::json::array();
  for (const auto &p : s.committed)
    committed.push_back(pick_to_json(p));
  nlohmann::json completed = nlohmann::json::array();
  for (const auto &p : s.completed)
    completed.push_back(pick_to_json(p));

  nlohmann::json pending = nlohmann::json::object();
  for (const auto &p : cp.pending) {
    std::vector<double> x(p.x.data(), p.x.data() + p.x.size());
    pending[p.id] = {{"x", x}, {"expected", p.expected}, {"prior_mean", p.prior_mean}};
  }

  return {{"horizon",
           {{"day", s.day},
            {"total_days", s.total_days},
            {"budget_total", s.budget_total},
            {"reserve", s.reserve},
            {"budget_used", s.budget_used},
            {"capacity", s.capacity},
            {"committed", std::move(committed)},
            {"completed", std::move(completed)},
            {"dropped", s.dropped},
            {"unavailable", s.unavailable},
            {"complete", s.complete}}},
          {"pending", std::move(pending)}};
}

HorizonCheckpoint checkpoint_from_json(const nlohmann::json &j) {
  try {
    HorizonCheckpoint cp;
    const auto &h = j.at("horizon");
    HorizonSnapshot &s = cp.horizon;
    s.day = h.at("day").get<int>();
    s.total_days = h.at("total_days").get<int>();
    s.budget_total = h.at("budget_total").get<int>();
    s.reserve = h.value("reserve", 0);
    s.budget_used = h.at("budget_used").get<int>();
    s.capacity = h.at("capacity").get<std::vector<int>>();
    s.committed = picks_from_json(h, "committed");
    s.completed = picks_from_json(h, "completed");
    s.dropped = h.value("dropped", std::vector<std::string>{});
    s.unavailable = h.value("unavailable", std::vector<std::string>{});
    s.complete = h.value("complete", false);
    if (s.budget_used != static_cast<int>(s.committed.size() + s.completed.size())) {
      throw InvalidInput(fmt::format("ledger records {} used for {} picks", s.budget_used,
                                     s.committed.size() + s.completed.size()));
    }

    if (j.contains("pending")) {
      for (const auto &item : j.at("pending").items()) {
        const auto &v = item.value();
        const auto x = v.at("x").get<std::vector<double>>();
        PendingOutcome p;
        p.id = item.key();
        p.x = Eigen::Map<const Eigen::VectorXd>(x.data(), static_cast<Eigen::Index>(x.size()));
        p.expected = v.at("expected").get<double>();
        p.prior_mean = v.value("prior_mean", p.expected);
        cp.pending.push_back(std::move(p));
      }
    }
    return cp;
  } catch (const nlohmann::json::exception &e) {
    throw InvalidInput(fmt::format("malformed horizon checkpoint: {}", e.what()));
  }
}

void save_engine(const DecisionEngine &engine, const std::string &path) {
  nlohmann::json doc = model_to_json(engine.model());
  nlohmann::json cp = checkpoint_to_json(engine.checkpoint());
  doc["horizon"] = std::move(cp["horizon"]);
  doc["pending"] = std::move(cp["pending"]);
  write_atomically(doc, path);
  log_debug("saved engine state to {} (day {}, {}/{} used)", path, engine.horizon().day,
            engine.horizon().budget_used, engine.horizon().budget_total);
}

DecisionEngine load_engine(const std::string &path, const EngineConfig &cfg) {
  const std::optional<nlohmann::json> j = read_document(path);
  if (!j)
    return DecisionEngine(cfg, LearnedModel::fresh(cfg));

  LearnedModel m;
  try {
    m = model_from_json(*j, cfg);
  } catch (const InvalidInput &e) {
    log_warn("persisted state {} unusable ({}); starting from a fresh prior", path, e.what());
    return DecisionEngine(cfg, LearnedModel::fresh(cfg));
  }
  if (!j->contains("horizon")) {
    log_info("{} holds no horizon ledger; starting a new horizon", path);
    return DecisionEngine(cfg, std::move(m));
  }
  try {
    return DecisionEngine(cfg, m, checkpoint_from_json(*j));
  } catch (const InvalidInput &e) {
    log_warn("horizon ledger in {} unusable ({}); starting a new horizon", path, e.what());
  }
  return DecisionEngine(cfg, std::move(m));
}

} // namespace stream_core
