#include <catch2/catch.hpp>

#include "fixtures.hpp"
#include "stream_core/errors.hpp"
#include "stream_core/horizon.hpp"

using namespace stream_core;
using stream_core::testing::scored;

namespace {

CommittedPick pick(const std::string &id, std::vector<int> days, double value = 20.0) {
  CommittedPick p;
  p.id = id;
  p.days = std::move(days);
  p.value_per_day = value;
  return p;
}

HorizonConfig small_horizon() {
  HorizonConfig cfg;
  cfg.days = 7;
  cfg.budget = 3;
  cfg.default_capacity = 1;
  return cfg;
}

} // namespace

TEST_CASE("A fresh horizon starts at day zero with full budget", "[horizon]") {
  RollingHorizon h(small_horizon());
  const HorizonSnapshot s = h.start();
  CHECK(s.day == 0);
  CHECK(s.remaining_budget() == 3);
  CHECK(s.capacity == std::vector<int>(7, 1));
  CHECK_FALSE(s.complete);
}

TEST_CASE("Commit consumes one unit and reserves every occupied day", "[horizon]") {
  RollingHorizon h(small_horizon());
  const HorizonSnapshot s0 = h.start();
  const HorizonSnapshot s1 = h.commit(s0, pick("two", {1, 5}));

  CHECK(s1.budget_used == 1);
  CHECK(s1.remaining_budget() == 2);
  const std::vector<int> free = s1.residual_capacity();
  CHECK(free[1] == 0);
  CHECK(free[5] == 0);
  CHECK(free[2] == 1);
  CHECK(s1.is_committed("two"));
  CHECK(s1.committed.front().locked);

  // The input snapshot is untouched.
  CHECK(s0.budget_used == 0);
  CHECK(s0.committed.empty());
}

TEST_CASE("Commit refuses what the horizon cannot honor", "[horizon]") {
  RollingHorizon h(small_horizon());
  HorizonSnapshot s = h.commit(h.start(), pick("a", {1}));

  CHECK_THROWS_AS(h.commit(s, pick("b", {1})), InfeasibleConstraint);
  CHECK_THROWS_AS(h.commit(s, pick("a", {2})), InvalidInput);
  CHECK_THROWS_AS(h.commit(s, pick("c", {9})), InvalidInput);
  CHECK_THROWS_AS(h.commit(s, pick("c", {})), InvalidInput);

  s = h.commit(s, pick("b", {2}));
  s = h.commit(s, pick("c", {3}));
  CHECK(s.remaining_budget() == 0);
  CHECK_THROWS_AS(h.commit(s, pick("d", {4})), InfeasibleConstraint);
}

TEST_CASE("Past days cannot be committed", "[horizon]") {
  RollingHorizon h(small_horizon());
  const HorizonSnapshot s = h.advance(h.advance(h.start()));
  CHECK(s.day == 2);
  CHECK_THROWS_AS(h.commit(s, pick("late", {1, 4})), InvalidInput);
}

TEST_CASE("Picks become droppable once their last day has passed", "[horizon]") {
  RollingHorizon h(small_horizon());
  HorizonSnapshot s = h.commit(h.start(), pick("two", {0, 2}));
  s = h.advance(s);
  CHECK(s.droppable().empty());
  s = h.advance(s);
  CHECK(s.droppable().empty()); // still active on day 2
  s = h.advance(s);
  CHECK(s.droppable() == std::vector<std::string>{"two"});
  CHECK(s.committed.empty());
  CHECK(s.completed.size() == 1);
  // Budget is not refunded
  CHECK(s.budget_used == 1);

  s = h.drop(s, "two");
  CHECK(s.droppable().empty());
  CHECK_THROWS_AS(h.drop(s, "two"), InvalidInput);
}

TEST_CASE("Leaving the last day completes the horizon", "[horizon]") {
  RollingHorizon h(small_horizon());
  HorizonSnapshot s = h.start();
  for (int d = 0; d < 7; ++d)
    s = h.advance(s);
  CHECK(s.complete);
  CHECK(s.optimizer_budget() == 0);
  CHECK_THROWS_AS(h.advance(s), InvalidInput);
  CHECK_THROWS_AS(h.commit(s, pick("x", {6})), InfeasibleConstraint);
  CHECK(s.status_text().rfind("Horizon complete", 0) == 0);
}

TEST_CASE("Remaining problem leaves commitments fixed", "[horizon]") {
  RollingHorizon h(small_horizon());
  HorizonSnapshot s = h.commit(h.start(), pick("kept", {2}));
  s = h.mark_unavailable(s, "gone");
  s = h.advance(s);

  const std::vector<ScoredCandidate> feed{
      scored("kept", {2}, 30.0), scored("gone", {3}, 30.0),
      scored("split", {0, 4}, 25.0), scored("past", {0}, 50.0),
      scored("fresh", {5}, 10.0)};
  const SlotProblem p = h.remaining_problem(s, feed);

  CHECK(p.budget == 2);
  REQUIRE(p.candidates.size() == 2);
  CHECK(p.candidates[0].id == "split");
  CHECK(p.candidates[0].days == std::vector<int>{4});
  CHECK(p.candidates[1].id == "fresh");
  CHECK(p.capacity[0] == 0);
  CHECK(p.capacity[2] == 0);
  CHECK(p.capacity[4] == 1);
}

TEST_CASE("Reserve is held back from the optimizer", "[horizon]") {
  RollingHorizon h(small_horizon());
  HorizonSnapshot s = h.with_reserve(h.start(), 2);
  CHECK(s.optimizer_budget() == 1);
  s = h.with_reserve(s, 5);
  CHECK(s.optimizer_budget() == 0);
  CHECK(s.remaining_budget() == 3);
  CHECK_THROWS_AS(h.with_reserve(s, -1), InvalidInput);
}

TEST_CASE("Inconsistent commitments surface loudly", "[horizon]") {
  RollingHorizon h(small_horizon());
  HorizonSnapshot s = h.commit(h.start(), pick("a", {1}));
  s.capacity[1] = 0; // capacity shrank under an existing commitment
  CHECK_THROWS_AS(h.validate(s), InfeasibleConstraint);
  CHECK_THROWS_AS(h.remaining_problem(s, {}), InfeasibleConstraint);

  HorizonSnapshot over = h.start();
  over.budget_used = 4;
  CHECK_THROWS_AS(h.validate(over), InfeasibleConstraint);
}

TEST_CASE("Status text lists picks and remaining days", "[horizon]") {
  RollingHorizon h(small_horizon());
  const HorizonSnapshot s = h.commit(h.start(), pick("two", {1, 5}));
  const std::string text = s.status_text();
  CHECK(text.find("Day 1/7") != std::string::npos);
  CHECK(text.find("two committed day 0, 2 day(s) left") != std::string::npos);
}

TEST_CASE("Horizon configuration is checked", "[horizon]") {
  HorizonConfig bad = small_horizon();
  bad.capacity = {1, 1};
  CHECK_THROWS_AS(RollingHorizon(bad), InvalidInput);
  bad = small_horizon();
  bad.days = 0;
  CHECK_THROWS_AS(RollingHorizon(bad), InvalidInput);
}
