#include <numeric>

#include <gtest/gtest.h>

#include "constraints.h"
#include "errors.h"
#include "json_io.h"
#include "objectives.h"
#include "test_helpers.h"

using namespace fsched;
using namespace fsched::test;

class ConstraintModelTest : public ::testing::Test {};

TEST_F(ConstraintModelTest, DefaultWeightsAreFilledAndNormalized) {
  ConstraintSet c;
  const ConstraintSet n = normalize_constraints(c);
  ASSERT_EQ(n.objectives.size(), 2U);
  ASSERT_TRUE(n.objectives[0].weight.has_value());
  ASSERT_TRUE(n.objectives[1].weight.has_value());
  EXPECT_NEAR(*n.objectives[0].weight, 0.4 / 0.7, 1e-12);
  EXPECT_NEAR(*n.objectives[1].weight, 0.3 / 0.7, 1e-12);
  EXPECT_NEAR(*n.objectives[0].weight + *n.objectives[1].weight, 1.0, 1e-12);
}

TEST_F(ConstraintModelTest, ExplicitWeightsKeepTheirProportions) {
  ConstraintSet c;
  c.objectives = {{ObjectiveKind::MinimizeTravelTime, 3.0}, {ObjectiveKind::MinimizeCost, 1.0}};
  const ConstraintSet n = normalize_constraints(c);
  EXPECT_DOUBLE_EQ(*n.objectives[0].weight, 0.75);
  EXPECT_DOUBLE_EQ(*n.objectives[1].weight, 0.25);

  const ObjectiveWeights w = weights_of(n);
  EXPECT_DOUBLE_EQ(w.of(ObjectiveKind::MinimizeTravelTime), 0.75);
  EXPECT_DOUBLE_EQ(w.of(ObjectiveKind::MinimizeCost), 0.25);
  EXPECT_DOUBLE_EQ(w.of(ObjectiveKind::BalanceWorkload), 0.0);
}

TEST_F(ConstraintModelTest, EveryViolationIsReported) {
  ConstraintSet c;
  c.max_travel_time = 0;
  c.working_hours = TimeWindow{600, 500};
  c.objectives = {{ObjectiveKind::MinimizeTravelTime, std::nullopt}, {ObjectiveKind::MinimizeTravelTime, 1.0}};
  try {
    normalize_constraints(c);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e.violations().size(), 3U);
  }
}

TEST_F(ConstraintModelTest, NegativeOrZeroWeightsAreRejected) {
  ConstraintSet neg;
  neg.objectives = {{ObjectiveKind::MinimizeCost, -1.0}};
  EXPECT_EQ(constraint_violations(neg).size(), 1U);

  ConstraintSet zero;
  zero.objectives = {{ObjectiveKind::MinimizeCost, 0.0}, {ObjectiveKind::BalanceWorkload, 0.0}};
  const auto bad = constraint_violations(zero);
  ASSERT_EQ(bad.size(), 1U);
  EXPECT_NE(bad[0].find("sum to zero"), std::string::npos);

  ConstraintSet none;
  none.objectives.clear();
  EXPECT_THROW(normalize_constraints(none), ValidationError);
}

TEST_F(ConstraintModelTest, UnknownObjectiveNameIsAValidationError) {
  EXPECT_THROW(parse_objective_kind("fastest_route"), ValidationError);
  EXPECT_EQ(parse_objective_kind("balance_workload"), ObjectiveKind::BalanceWorkload);

  const json j = json::parse(R"({"objectives": [{"kind": "minimize_cost", "weight": 2}, "nonsense"]})");
  EXPECT_THROW(j.get<ConstraintSet>(), ValidationError);
}

TEST_F(ConstraintModelTest, RequestViolationsCoverJobsTechniciansAndHorizon) {
  std::vector<Job> jobs = {make_job("a", 1, 30, 480, 600), make_job("a", 2, 0, 700, 600)};
  Technician t = make_tech("t1", 0, 600, 500);
  t.proficiency["hvac"] = 1.5;
  const auto bad = request_violations(jobs, {t}, TimeWindow{0, 2 * MINUTES_PER_DAY});
  // duplicate id, zero duration, window order, working hours, proficiency, horizon length
  EXPECT_EQ(bad.size(), 6U);
}

TEST_F(ConstraintModelTest, PreferencesMustBeNonNegative) {
  AdaptationPreferences p;
  EXPECT_NO_THROW(validate_preferences(p));
  p.max_schedule_delay = -5;
  p.max_reassignments = -1;
  EXPECT_EQ(preference_violations(p).size(), 2U);
  EXPECT_THROW(validate_preferences(p), ValidationError);
}
