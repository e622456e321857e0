#include <catch2/catch.hpp>

#include <cmath>

#include "stream_core/snipe.hpp"

using namespace stream_core;

namespace {

const HazardTier kTiers[] = {HazardTier::Elite, HazardTier::High, HazardTier::Moderate,
                             HazardTier::Low, HazardTier::Minimal};

} // namespace

TEST_CASE("Survival starts at one and strictly decays", "[snipe]") {
  SurvivalModel m;
  for (const HazardTier t : kTiers) {
    CHECK(m.survival(t, 0.0) == 1.0);
    double prev = 1.0;
    for (int d = 1; d <= 7; ++d) {
      const double s = m.survival(t, d);
      CHECK(s < prev);
      CHECK(s > 0.0);
      prev = s;
    }
  }
  CHECK(m.survival(HazardTier::Elite, 2.0) == Approx(std::exp(-0.9)));
}

TEST_CASE("Survival strictly decreases in hazard", "[snipe]") {
  SurvivalModel m;
  for (int d = 1; d <= 5; ++d) {
    for (int i = 0; i + 1 < 5; ++i)
      CHECK(m.survival(kTiers[i], d) < m.survival(kTiers[i + 1], d));
  }
  SnipeConfig busy;
  busy.league_activity = 1.5;
  CHECK(SurvivalModel(busy).survival(HazardTier::Low, 3) <
        m.survival(HazardTier::Low, 3));
}

TEST_CASE("Snipe-adjusted value blends toward the backup", "[snipe]") {
  SurvivalModel m;
  const double s = m.survival(HazardTier::High, 2);
  CHECK(m.value_with_snipe_risk(50.0, HazardTier::High, 2, 20.0) ==
        Approx(s * 50.0 + (1.0 - s) * 20.0));
  CHECK(m.value_with_snipe_risk(50.0, HazardTier::High, 0, 20.0) == Approx(50.0));
}

TEST_CASE("Act now only when deferring costs more than waiting is worth", "[snipe]") {
  SurvivalModel m;
  const ActDecision hot = m.should_act_now("hot", 50.0, HazardTier::Elite, 3, 10.0);
  CHECK(hot.act_now);
  CHECK(hot.expected_loss == Approx((1.0 - std::exp(-1.35)) * 50.0));
  CHECK(hot.reason.rfind("ADD NOW", 0) == 0);

  const ActDecision cold = m.should_act_now("cold", 50.0, HazardTier::Minimal, 1, 10.0);
  CHECK_FALSE(cold.act_now);
  CHECK(cold.reason.rfind("WAIT", 0) == 0);

  CHECK(m.should_act_now("today", 1.0, HazardTier::Minimal, 0, 100.0).act_now);
}

TEST_CASE("Urgency ranks by value, hazard and closeness", "[snipe]") {
  SurvivalModel m;
  CHECK(m.urgency(40.0, HazardTier::Moderate, 2) == Approx(40.0 * 0.15 / 2.0));
  CHECK(m.urgency(40.0, HazardTier::Moderate, 0) == Approx(400.0));
  CHECK(m.urgency(40.0, HazardTier::Elite, 2) > m.urgency(40.0, HazardTier::Low, 2));
  CHECK(m.urgency(40.0, HazardTier::Elite, 1) > m.urgency(40.0, HazardTier::Elite, 4));
}

TEST_CASE("Threshold declines across the horizon", "[snipe][threshold]") {
  SECTION("without history") {
    ThresholdCalculator tc;
    CHECK(tc.threshold(0, 3, 7) == Approx(40.0));
    CHECK(tc.threshold(6, 3, 7) == Approx(16.0));
    double prev = tc.threshold(0, 3, 7);
    for (int d = 1; d < 7; ++d) {
      CHECK(tc.threshold(d, 3, 7) <= prev);
      prev = tc.threshold(d, 3, 7);
    }
  }
  SECTION("with history") {
    std::vector<double> hist;
    for (int i = 1; i <= 100; ++i)
      hist.push_back(i);
    ThresholdCalculator tc(ThresholdConfig{}, hist);
    CHECK(tc.threshold(0, 2, 7) == Approx(90.1));
    CHECK(tc.threshold(6, 2, 7) == Approx(50.5));
    CHECK(tc.threshold(0, 1, 7) == Approx(90.1 * 1.2));
    CHECK(tc.threshold(0, 5, 7) == Approx(90.1 * 0.9));
    double prev = tc.threshold(0, 2, 7);
    for (int d = 1; d < 7; ++d) {
      CHECK(tc.threshold(d, 2, 7) < prev);
      prev = tc.threshold(d, 2, 7);
    }
  }
}

TEST_CASE("Option value vanishes with budget or time", "[snipe][threshold]") {
  ThresholdCalculator tc;
  CHECK(tc.option_value(0, 5, 7) == Approx(40.0 * 4.0 / 5.0));
  CHECK(tc.option_value(3, 5, 7) == Approx(40.0 * 4.0 / 5.0 * 0.5));
  CHECK(tc.option_value(0, 1, 7) == 0.0);
  CHECK(tc.option_value(6, 5, 7) == 0.0);

  tc.add_observation(10.0);
  tc.add_observation(30.0);
  CHECK(tc.history().size() == 2);
  CHECK(tc.option_value(0, 2, 7) == Approx(25.0 * 0.5));
}

TEST_CASE("Newsvendor reserve", "[snipe][reserve]") {
  ThresholdConfig cfg;
  CHECK(recommended_reserve(cfg, 0, 0) == 1);
  CHECK(recommended_reserve(cfg, 1, 0) == 1);
  CHECK(recommended_reserve(cfg, 0, 2) == 2);
  cfg.emergency_rate = 0.1;
  CHECK(recommended_reserve(cfg, 0, 0) == 0);

  CHECK(should_use_budget(cfg, 5.0, 3, 1).use);
  CHECK_FALSE(should_use_budget(cfg, 10.0, 1, 1).use);
  CHECK(should_use_budget(cfg, 20.0, 1, 1).use);
}
