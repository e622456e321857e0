#include <catch2/catch.hpp>

#include "fixtures.hpp"
#include "stream_core/bandit.hpp"
#include "stream_core/errors.hpp"

using namespace stream_core;

namespace {

BudgetedBandit fresh_bandit(int budget = 5, int days = 7) {
  BanditConfig cfg;
  return BudgetedBandit(cfg, BanditModel::fresh(cfg, budget, days));
}

Eigen::VectorXd context(double v) {
  Eigen::VectorXd x = Eigen::VectorXd::Zero(kFeatureCount);
  x[0] = 1.0;
  x[1] = v;
  return x;
}

} // namespace

TEST_CASE("Zero-observation model is pure exploration", "[bandit]") {
  const BudgetedBandit bandit = fresh_bandit();
  const Eigen::VectorXd x = context(0.7);
  const UcbScore s = bandit.score(x);
  CHECK(s.mean == Approx(0.0).margin(1e-12));
  CHECK(s.bonus == Approx(x.norm()));
  CHECK(s.ucb == Approx(s.bonus));
  CHECK(s.urgency == 0.0);
}

TEST_CASE("Exploration scales with budget against time", "[bandit]") {
  BudgetedBandit bandit = fresh_bandit(5, 7);
  const Eigen::VectorXd x = context(0.0);
  const double base = bandit.score(x).bonus;

  SECTION("plentiful budget late in the horizon is capped") {
    for (int i = 0; i < 6; ++i)
      bandit.advance_time();
    CHECK(bandit.score(x).bonus == Approx(2.0 * base));
  }
  SECTION("no time left") {
    for (int i = 0; i < 7; ++i)
      bandit.advance_time();
    CHECK(bandit.score(x).bonus == Approx(0.1 * base));
  }
  SECTION("scarce budget shrinks exploration") {
    bandit.update(x, 0.0);
    bandit.update(x, 0.0);
    const BudgetedBandit reference = fresh_bandit(5, 7);
    CHECK(bandit.state().budget_remaining == 3);
    CHECK(bandit.score(x).bonus < reference.score(x).bonus);
  }
}

TEST_CASE("Urgency favours arms expiring soon", "[bandit]") {
  const BudgetedBandit bandit = fresh_bandit();
  const Eigen::VectorXd x = context(0.0);
  CHECK(bandit.score(x, 1).urgency == Approx(5.0));
  CHECK(bandit.score(x, 5).urgency == Approx(1.0));
}

TEST_CASE("Updates learn the reward direction", "[bandit]") {
  BudgetedBandit bandit = fresh_bandit(10, 7);
  const Eigen::VectorXd good = context(1.0);
  const Eigen::VectorXd bad = context(-1.0);
  for (int i = 0; i < 5; ++i) {
    bandit.update(good, 10.0);
    bandit.update(bad, -10.0);
  }
  CHECK(bandit.state().observations == 10);
  CHECK(bandit.score(good).mean > 0.0);
  CHECK(bandit.score(bad).mean < 0.0);

  const auto pick = bandit.select({{"bad", bad, std::nullopt}, {"good", good, std::nullopt}});
  REQUIRE(pick.has_value());
  CHECK(pick->id == "good");
}

TEST_CASE("Selection stops when the budget is spent", "[bandit]") {
  BudgetedBandit bandit = fresh_bandit(1, 7);
  const Eigen::VectorXd x = context(0.0);
  CHECK(bandit.select({{"a", x, std::nullopt}}).has_value());
  CHECK_FALSE(bandit.select({}).has_value());
  bandit.update(x, 3.0);
  CHECK(bandit.state().budget_remaining == 0);
  CHECK_FALSE(bandit.select({{"a", x, std::nullopt}}).has_value());
  // Counter never goes negative
  bandit.update(x, 3.0);
  CHECK(bandit.state().budget_remaining == 0);
}

TEST_CASE("Horizon reset keeps what was learned", "[bandit]") {
  BudgetedBandit bandit = fresh_bandit(5, 7);
  const Eigen::VectorXd x = context(1.0);
  bandit.update(x, 8.0);
  bandit.advance_time();
  const Eigen::MatrixXd A = bandit.state().A;
  bandit.reset_horizon(5, 7);
  CHECK(bandit.state().budget_remaining == 5);
  CHECK(bandit.state().time_remaining == 7);
  CHECK(bandit.state().A.isApprox(A));
  CHECK(bandit.score(x).mean > 0.0);
}

TEST_CASE("Horizon reset adopts the new budget and length", "[bandit]") {
  BudgetedBandit bandit = fresh_bandit(5, 7);
  bandit.update(context(1.0), 2.0);
  bandit.reset_horizon(7, 9);
  CHECK(bandit.state().budget_total == 7);
  CHECK(bandit.state().budget_remaining == 7);
  CHECK(bandit.state().time_total == 9);
  CHECK(bandit.state().time_remaining == 9);
  CHECK(bandit.state().observations == 1);
  CHECK_THROWS_AS(bandit.reset_horizon(-1, 7), InvalidInput);
}

TEST_CASE("Dimension mismatches are rejected", "[bandit]") {
  const BudgetedBandit bandit = fresh_bandit();
  CHECK_THROWS_AS(bandit.score(Eigen::VectorXd::Zero(3)), InvalidInput);
  BanditModel broken = BanditModel::fresh(BanditConfig{}, 5, 7);
  broken.b = Eigen::VectorXd::Zero(4);
  CHECK_THROWS_AS(BudgetedBandit(BanditConfig{}, broken), InvalidInput);
}

TEST_CASE("Feature builder produces a fixed-size context", "[bandit]") {
  RiskCalculator calc;
  Candidate c = stream_core::testing::make_candidate("two", {1, 5}, 1.0);
  c.profile.ground_ball = true;
  const Eigen::VectorXd x = build_features(c, calc.assess(c));
  REQUIRE(x.size() == kFeatureCount);
  CHECK(x[0] == 1.0);
  CHECK(x[4] == 1.0);
  CHECK(x[5] == 0.0);
  CHECK(x[9] == 1.0);
}
