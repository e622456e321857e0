#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "fixtures.hpp"
#include "stream_core/config.hpp"
#include "stream_core/errors.hpp"
#include "stream_core/state_store.hpp"

using namespace stream_core;
using stream_core::testing::make_candidate;
namespace fs = std::filesystem;

namespace {

fs::path scratch(const std::string &name) {
  const fs::path dir = fs::temp_directory_path() / "stream_core_tests";
  fs::create_directories(dir);
  const fs::path p = dir / name;
  fs::remove(p);
  return p;
}

void write_text(const fs::path &p, const std::string &text) {
  std::ofstream out(p);
  out << text;
}

LearnedModel trained_model(const EngineConfig &cfg) {
  LearnedModel m = LearnedModel::fresh(cfg);
  BudgetedBandit bandit(cfg.bandit, m.bandit);
  Eigen::VectorXd x = Eigen::VectorXd::Zero(kFeatureCount);
  x[0] = 1.0;
  x[3] = 0.5;
  bandit.update(x, 6.0);
  bandit.advance_time();
  m.bandit = bandit.state();
  m.posteriors.set_prior("ace", 20.0, 64.0, 100.0);
  m.posteriors.update("ace", 10.0);
  m.value_history = {10.0, 32.5};
  return m;
}

} // namespace

TEST_CASE("Config keys are optional and unknown keys ignored", "[config]") {
  const nlohmann::json j = {
      {"horizon", {{"budget", 3}, {"capacity", {1, 2, 2, 2, 2, 2, 1}}}},
      {"solver", {{"time_limit_ms", 250.0}}},
      {"risk", {{"missing_defaults", {{"negative_per9", 1.5}}}}},
      {"from_a_newer_version", true}};
  const EngineConfig cfg = engine_config_from_json(j);
  CHECK(cfg.horizon.budget == 3);
  CHECK(cfg.horizon.days == 7);
  CHECK(cfg.horizon.resolved_capacity() == std::vector<int>{1, 2, 2, 2, 2, 2, 1});
  CHECK(cfg.solver.time_limit_ms == 250.0);
  CHECK(cfg.risk.missing_defaults.negative_per9 == 1.5);
  CHECK(cfg.risk.catastrophe_penalty == 30.0);
}

TEST_CASE("Bad config values are rejected", "[config]") {
  CHECK_THROWS_AS(engine_config_from_json({{"horizon", {{"budget", "five"}}}}), InvalidInput);
  CHECK_THROWS_AS(engine_config_from_json({{"horizon", {{"budget", -1}}}}), InvalidInput);
  CHECK_THROWS_AS(engine_config_from_json({{"horizon", {{"capacity", {1, 1}}}}}),
                  InvalidInput);
  CHECK_THROWS_AS(engine_config_from_json({{"horizon", 3}}), InvalidInput);
  CHECK_THROWS_AS(engine_config_from_json(nlohmann::json::array()), InvalidInput);
  CHECK_THROWS_AS(
      engine_config_from_json({{"solver", {{"brute_force_max_candidates", 64}}}}),
      InvalidInput);
  CHECK(engine_config_from_json({{"solver", {{"brute_force_max_candidates", 63}}}})
            .solver.brute_force_max_candidates == 63);
}

TEST_CASE("Config loads from a file", "[config]") {
  const fs::path p = scratch("engine.json");
  write_text(p, R"({"horizon": {"days": 5, "budget": 2}})");
  const EngineConfig cfg = load_engine_config(p.string());
  CHECK(cfg.horizon.days == 5);
  CHECK(cfg.horizon.budget == 2);
  CHECK_THROWS_AS(load_engine_config((p.parent_path() / "absent.json").string()),
                  InvalidInput);
}

TEST_CASE("Learned model survives a save/load cycle", "[state]") {
  const EngineConfig cfg{};
  const LearnedModel m = trained_model(cfg);
  const fs::path p = scratch("model.json");

  save_model(m, p.string());
  CHECK(fs::exists(p));
  CHECK_FALSE(fs::exists(p.string() + ".tmp"));

  const LearnedModel back = load_model(p.string(), cfg);
  CHECK(back.bandit.A.isApprox(m.bandit.A));
  CHECK(back.bandit.b.isApprox(m.bandit.b));
  CHECK(back.bandit.observations == 1);
  CHECK(back.bandit.budget_remaining == m.bandit.budget_remaining);
  CHECK(back.bandit.time_remaining == m.bandit.time_remaining);
  CHECK(back.posteriors.posterior_mean("ace") == Approx(m.posteriors.posterior_mean("ace")));
  CHECK(back.posteriors.get("ace").n == 1);
  CHECK(back.value_history == m.value_history);
}

TEST_CASE("Snapshots tolerate unknown fields", "[state]") {
  const EngineConfig cfg{};
  nlohmann::json j = model_to_json(trained_model(cfg));
  j["next_season_extension"] = {{"anything", 1}};
  j["bandit"]["new_counter"] = 7;
  j["posteriors"]["ace"]["shape"] = "normal";
  const LearnedModel m = model_from_json(j, cfg);
  CHECK(m.bandit.observations == 1);
  CHECK(m.posteriors.has("ace"));
}

TEST_CASE("Snapshots without horizon counters take them from config", "[state]") {
  EngineConfig cfg{};
  cfg.horizon.budget = 6;
  cfg.horizon.days = 8;
  nlohmann::json j = model_to_json(trained_model(EngineConfig{}));
  for (const char *key : {"budget_total", "budget_remaining", "time_total", "time_remaining"})
    j["bandit"].erase(key);
  const LearnedModel m = model_from_json(j, cfg);
  CHECK(m.bandit.budget_total == 6);
  CHECK(m.bandit.budget_remaining == 6);
  CHECK(m.bandit.time_total == 8);
  CHECK(m.bandit.time_remaining == 8);
  CHECK(m.bandit.observations == 1);
}

TEST_CASE("Unusable snapshots degrade to a fresh prior", "[state]") {
  EngineConfig cfg{};
  const fs::path p = scratch("broken.json");

  SECTION("missing file") {
    CHECK(load_model(p.string(), cfg).bandit.observations == 0);
  }
  SECTION("corrupt file") {
    write_text(p, "{\"schema_version\": 1, \"bandit\": [");
    const LearnedModel m = load_model(p.string(), cfg);
    CHECK(m.bandit.observations == 0);
    CHECK(m.posteriors.size() == 0);
  }
  SECTION("newer schema") {
    nlohmann::json j = model_to_json(trained_model(cfg));
    j["schema_version"] = kSchemaVersion + 1;
    write_text(p, j.dump());
    CHECK(load_model(p.string(), cfg).bandit.observations == 0);
  }
  SECTION("dimension mismatch") {
    save_model(trained_model(cfg), p.string());
    EngineConfig other = cfg;
    other.bandit.feature_dim = 4;
    const LearnedModel m = load_model(p.string(), other);
    CHECK(m.bandit.dim == 4);
    CHECK(m.bandit.observations == 0);
  }
}

TEST_CASE("Unwritable destinations raise PersistenceError", "[state]") {
  const fs::path p = scratch("missing_dir") / "nested" / "model.json";
  CHECK_THROWS_AS(save_model(LearnedModel::fresh(EngineConfig{}), p.string()),
                  PersistenceError);
}

namespace {

std::vector<Candidate> restart_feed() {
  return {make_candidate("c0", {1}), make_candidate("c1", {2}), make_candidate("c2", {3}),
          make_candidate("c3", {4})};
}

} // namespace

TEST_CASE("A restarted engine keeps the week's commitments", "[state]") {
  EngineConfig cfg{};
  cfg.horizon.budget = 2;
  const fs::path p = scratch("engine_state.json");

  {
    DecisionEngine engine(cfg, LearnedModel::fresh(cfg));
    engine.set_feed(restart_feed());
    engine.commit("c0");
    engine.commit("c1");
    engine.record_outcome("c1", 14.0);
    engine.advance_day();
    engine.mark_unavailable("c3");
    save_engine(engine, p.string());
  }
  CHECK_FALSE(fs::exists(p.string() + ".tmp"));

  DecisionEngine engine = load_engine(p.string(), cfg);
  engine.set_feed(restart_feed());
  const HorizonSnapshot &h = engine.horizon();
  CHECK(h.day == 1);
  CHECK(h.budget_used == 2);
  CHECK(h.remaining_budget() == 0);
  CHECK(h.is_committed("c0"));
  CHECK(h.is_unavailable("c3"));
  CHECK(engine.model().bandit.observations == 1);
  CHECK(engine.model().posteriors.has("c1"));

  CHECK_THROWS_AS(engine.commit("c2"), InfeasibleConstraint);
  CHECK(engine.optimize().selected.empty());
  engine.record_outcome("c0", 9.0);
  CHECK(engine.model().posteriors.has("c0"));
}

TEST_CASE("Ledgers that cannot be resumed", "[state]") {
  EngineConfig cfg{};
  cfg.horizon.budget = 2;
  const fs::path p = scratch("engine_ledger.json");
  DecisionEngine engine(cfg, LearnedModel::fresh(cfg));
  engine.set_feed(restart_feed());
  engine.commit("c0");
  engine.record_outcome("c0", 11.0);
  save_engine(engine, p.string());

  SECTION("configured horizon changed") {
    EngineConfig other = cfg;
    other.horizon.budget = 4;
    const DecisionEngine resumed = load_engine(p.string(), other);
    CHECK(resumed.horizon().budget_used == 0);
    CHECK(resumed.model().posteriors.has("c0"));
  }
  SECTION("commitments beyond the budget") {
    std::ifstream in(p);
    nlohmann::json j;
    in >> j;
    in.close();
    auto &committed = j["horizon"]["committed"];
    for (const char *id : {"x1", "x2"}) {
      committed.push_back(nlohmann::json{{"id", id},
                                         {"commit_day", 0},
                                         {"days", nlohmann::json::array({5})},
                                         {"value_per_day", 9.0}});
    }
    j["horizon"]["budget_used"] = 3;
    write_text(p, j.dump());
    CHECK_THROWS_AS(load_engine(p.string(), cfg), InfeasibleConstraint);
  }
  SECTION("missing file") {
    const DecisionEngine fresh = load_engine((p.parent_path() / "none.json").string(), cfg);
    CHECK(fresh.horizon().day == 0);
    CHECK(fresh.model().bandit.observations == 0);
  }
}
