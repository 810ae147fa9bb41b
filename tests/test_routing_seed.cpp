#include <set>

#include <gtest/gtest.h>

#include "constraints.h"
#include "optimizer.h"
#include "problem.h"
#include "route_eval.h"
#include "routing_seed.h"
#include "test_helpers.h"

using namespace fsched;
using namespace fsched::test;

class RoutingSeedTest : public ::testing::Test {
 protected:
  Problem build(const std::vector<Job>& jobs, const std::vector<Technician>& techs) {
    auto provider = std::make_shared<TableProvider>(12.0);
    provider->set(0, 1, 3.0);
    provider->set(1, 2, 4.0);
    provider->set(20, 21, 5.0);
    TravelTimeService svc(provider, fast_settings());
    ProblemInput in;
    in.jobs = jobs;
    in.technicians = techs;
    in.constraints = normalize_constraints(ConstraintSet{});
    return build_problem(in, svc);
  }

  std::vector<Job> jobs() const {
    return {make_job("j1", 1, 45, 480, 700, {"electrical"}), make_job("j2", 2, 30, 500, 900, {"electrical"}),
            make_job("j3", 21, 60, 480, 800), make_job("j4", 22, 30, 600, 1000),
            make_job("j5", 23, 30, 480, 1000, {"gas"}), make_job("j6", 24, 40, 700, 1000)};
  }

  std::vector<Technician> techs() const {
    return {make_tech("t1", 0, 480, 1020, {"electrical"}), make_tech("t2", 20, 480, 1020, {"gas"})};
  }
};

TEST_F(RoutingSeedTest, SeedRoutesAreFeasible) {
  const Problem p = build(jobs(), techs());
  const auto plan = routing_seed(p, 1000);
  ASSERT_TRUE(plan);
  ASSERT_EQ(plan->routes.size(), 2U);

  std::set<int> seen;
  for (int t = 0; t < p.T(); ++t) {
    EXPECT_TRUE(time_route(p, t, plan->routes[t]).feasible) << p.techs[t].id;
    for (int j : plan->routes[t]) {
      EXPECT_TRUE(seen.insert(j).second);
      EXPECT_TRUE(p.skill_ok[t][j]);
    }
  }
}

TEST_F(RoutingSeedTest, JobsWithoutCandidateStayOut) {
  std::vector<Job> js = jobs();
  js.push_back(make_job("j7", 3, 30, 480, 1000, {"hvac"}));
  const Problem p = build(js, techs());
  const auto plan = routing_seed(p, 1000);
  ASSERT_TRUE(plan);
  const int hvac = p.job_index.at("j7");
  for (const auto& r : plan->routes)
    for (int j : r) EXPECT_NE(j, hvac);
}

TEST_F(RoutingSeedTest, NoTechniciansNoSeed) {
  const Problem p = build(jobs(), {});
  EXPECT_FALSE(routing_seed(p, 1000));
}

TEST_F(RoutingSeedTest, OptimizeWithRoutingModelConstruction) {
  const Problem p = build(jobs(), techs());
  OptimizeOptions opts;
  opts.construction = "routing_model";
  opts.time_budget_ms = 5000;
  const OptimizeResult r = optimize(p, opts);

  EXPECT_EQ(r.assignments.size(), 6U);
  EXPECT_TRUE(r.unscheduled.empty());
  for (const auto& a : r.assignments) {
    const Job& j = p.jobs[p.job_index.at(a.job_id)];
    EXPECT_GE(a.scheduled_start, j.window.start);
    EXPECT_LE(a.scheduled_end, j.window.end);
  }
}
