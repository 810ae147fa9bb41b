#include <cstdio>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "run_store.h"

using namespace fsched;

class RunStoreTest : public ::testing::Test {
 protected:
  static OptimizationRun make_run(const std::string& id, const std::string& tenant, int day, long long created_ms,
                                  RunStatus status = RunStatus::Completed) {
    OptimizationRun r;
    r.id = id;
    r.tenant_id = tenant;
    r.planning_day = day;
    r.created_ms = created_ms;
    r.status = status;
    r.algorithm_version = "test";
    return r;
  }

  static JobOutcome make_outcome(const std::string& job, int day) {
    JobOutcome o;
    o.job_id = job;
    o.technician_id = "t1";
    o.planning_day = day;
    o.scheduled_start = 540;
    o.actual_start = 545;
    o.actual_end = 600;
    return o;
  }

  void TearDown() override { std::remove(path_.c_str()); }

  std::string path_ = ::testing::TempDir() + "fieldsched_runs_test.json";
};

TEST_F(RunStoreTest, PutReplacesById) {
  RunStore store;
  store.put(make_run("r1", "acme", 10, 1000, RunStatus::Running));
  store.put(make_run("r1", "acme", 10, 1000, RunStatus::Completed));
  EXPECT_EQ(store.size(), 1U);
  ASSERT_TRUE(store.get("r1"));
  EXPECT_EQ(store.get("r1")->status, RunStatus::Completed);
  EXPECT_FALSE(store.get("r2"));
}

TEST_F(RunStoreTest, SetStatusKeepsReasonWhenNoneGiven) {
  RunStore store;
  store.put(make_run("r1", "acme", 10, 1000, RunStatus::Running));
  EXPECT_TRUE(store.set_status("r1", RunStatus::Cancelled, "preempted by weather"));
  EXPECT_TRUE(store.set_status("r1", RunStatus::Cancelled));
  EXPECT_EQ(store.get("r1")->failure_reason, "preempted by weather");
  EXPECT_FALSE(store.set_status("nope", RunStatus::Failed));
}

TEST_F(RunStoreTest, ListFiltersTenantAndDaysOldestFirst) {
  RunStore store;
  store.put(make_run("b", "acme", 10, 2000));
  store.put(make_run("a", "acme", 11, 2000));
  store.put(make_run("c", "acme", 12, 1000));
  store.put(make_run("d", "acme", 20, 500));
  store.put(make_run("e", "globex", 11, 100));

  const auto runs = store.list("acme", 10, 12);
  ASSERT_EQ(runs.size(), 3U);
  EXPECT_EQ(runs[0].id, "c");
  EXPECT_EQ(runs[1].id, "a");
  EXPECT_EQ(runs[2].id, "b");
  EXPECT_TRUE(store.list("initech", 0, 100).empty());
}

TEST_F(RunStoreTest, OutcomesByTenantAndDay) {
  RunStore store;
  store.add_outcome("acme", make_outcome("j1", 10));
  store.add_outcome("acme", make_outcome("j2", 11));
  store.add_outcome("globex", make_outcome("j3", 10));
  EXPECT_EQ(store.outcomes("acme", 10, 11).size(), 2U);
  EXPECT_EQ(store.outcomes("acme", 11, 11).size(), 1U);
  EXPECT_EQ(store.outcomes("globex", 0, 100).size(), 1U);
  EXPECT_TRUE(store.outcomes("initech", 0, 100).empty());
}

TEST_F(RunStoreTest, PruneDropsOldFinishedRunsAndOutcomes) {
  RunStore store(30);
  const long long now = 100 * MILLIS_PER_DAY;
  store.put(make_run("old", "acme", 60, 60 * MILLIS_PER_DAY));
  store.put(make_run("old-running", "acme", 60, 60 * MILLIS_PER_DAY, RunStatus::Running));
  store.put(make_run("recent", "acme", 95, 95 * MILLIS_PER_DAY));
  store.add_outcome("acme", make_outcome("j-old", 60));
  store.add_outcome("acme", make_outcome("j-new", 80));

  EXPECT_EQ(store.prune(now), 1);
  EXPECT_FALSE(store.get("old"));
  EXPECT_TRUE(store.get("old-running"));
  EXPECT_TRUE(store.get("recent"));
  const auto left = store.outcomes("acme", 0, 1000);
  ASSERT_EQ(left.size(), 1U);
  EXPECT_EQ(left[0].job_id, "j-new");
  EXPECT_EQ(store.prune(now), 0);
}

TEST_F(RunStoreTest, SaveAndLoadKeepRunsAndOutcomes) {
  RunStore store(45);
  OptimizationRun r = make_run("r1", "acme", 12, 123456789LL);
  r.input_hash = "00ff00ff00ff00ff";
  r.metrics.total_jobs = 4;
  r.metrics.scheduled_jobs = 3;
  r.metrics.success_rate = 0.75;
  r.demand_by_category["plumbing"] = 3;
  Assignment a;
  a.job_id = "j1";
  a.technician_id = "t1";
  a.scheduled_start = 540;
  a.scheduled_end = 600;
  a.confidence = 0.8;
  a.alternatives.push_back({"t2", 0.25});
  r.assignments.push_back(a);
  store.put(r);
  store.put(make_run("r2", "acme", 13, 5, RunStatus::Failed));
  store.add_outcome("acme", make_outcome("j1", 12));
  store.save(path_);

  RunStore loaded;
  loaded.put(make_run("stale", "acme", 1, 1));
  loaded.load(path_);
  EXPECT_EQ(loaded.size(), 2U);
  EXPECT_FALSE(loaded.get("stale"));
  auto back = loaded.get("r1");
  ASSERT_TRUE(back);
  EXPECT_EQ(back->input_hash, r.input_hash);
  EXPECT_EQ(back->created_ms, 123456789LL);
  EXPECT_EQ(back->metrics.scheduled_jobs, 3);
  EXPECT_DOUBLE_EQ(back->metrics.success_rate, 0.75);
  EXPECT_EQ(back->demand_by_category.at("plumbing"), 3);
  ASSERT_EQ(back->assignments.size(), 1U);
  EXPECT_EQ(back->assignments[0], a);
  EXPECT_EQ(loaded.get("r2")->status, RunStatus::Failed);
  ASSERT_EQ(loaded.outcomes("acme", 12, 12).size(), 1U);
  EXPECT_EQ(loaded.outcomes("acme", 12, 12)[0].actual_start, 545);
}

TEST_F(RunStoreTest, LoadingAMissingFileThrows) {
  RunStore store;
  EXPECT_THROW(store.load(::testing::TempDir() + "fieldsched_no_such_file.json"), std::runtime_error);
}
