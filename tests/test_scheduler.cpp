#include <chrono>
#include <climits>
#include <future>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

#include "errors.h"
#include "scheduler.h"
#include "test_helpers.h"

using namespace fsched;
using namespace fsched::test;

class SchedulerTest : public ::testing::Test {
 protected:
  static constexpr int DAY = 20000;

  void SetUp() override {
    table_ = std::make_shared<TableProvider>(10.0);
    table_->set(0, 1, 0.0);
    table_->set(1, 2, 5.0);
    cfg_.time_budget_seconds = 5;
    cfg_.travel_timeout_ms = 10000;
    cfg_.preemption_wait_ms = 10000;
  }

  void make_service(std::shared_ptr<TravelTimeProvider> provider) {
    svc_.reset(new SchedulingService(cfg_, std::move(provider)));
  }

  OptimizeRequest two_job_day() const {
    OptimizeRequest req;
    req.jobs = {make_job("A", 1, 5, 540, 700), make_job("B", 2, 30, 600, 800)};
    req.technicians = {make_tech("t1", 0, 540, 1020)};
    req.planning_day = DAY;
    return req;
  }

  // Same day plus a job at a point the travel cache has not seen.
  OptimizeRequest extended_day() const {
    OptimizeRequest req = two_job_day();
    req.jobs.push_back(make_job("C", 5, 30, 540, 1000));
    return req;
  }

  std::vector<OptimizationRun> runs_with(RunStatus status) {
    std::vector<OptimizationRun> out;
    for (const auto& r : svc_->runs().list("acme", INT_MIN, INT_MAX))
      if (r.status == status) out.push_back(r);
    return out;
  }

  bool wait_for_status(RunStatus status, int ms) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < until) {
      if (!runs_with(status).empty()) return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
  }

  EngineConfig cfg_;
  std::shared_ptr<TableProvider> table_;
  std::unique_ptr<SchedulingService> svc_;
};

TEST_F(SchedulerTest, OptimizeCommitsAndRecordsTheRun) {
  make_service(table_);
  const OptimizeResponse resp = svc_->optimize("acme", two_job_day());

  EXPECT_EQ(resp.status, RunStatus::Completed);
  EXPECT_TRUE(resp.committed);
  EXPECT_EQ(resp.assignments.size(), 2U);

  auto snap = svc_->committed_schedule("acme");
  ASSERT_TRUE(snap);
  EXPECT_EQ(snap->version, 1);
  EXPECT_EQ(snap->run_id, resp.run_id);
  EXPECT_EQ(snap->technician("t1")->route, (std::vector<std::string>{"A", "B"}));
  EXPECT_NE(snap->jobs.at("A").status, JobStatus::Unscheduled);

  auto run = svc_->runs().get(resp.run_id);
  ASSERT_TRUE(run);
  EXPECT_EQ(run->status, RunStatus::Completed);
  EXPECT_EQ(run->algorithm_version, ALGORITHM_VERSION);
  EXPECT_EQ(run->planning_day, DAY);
  EXPECT_EQ(run->demand_by_category.at("general"), 2);
  EXPECT_FALSE(svc_->committed_schedule("other"));
}

TEST_F(SchedulerTest, SameRequestHashesTheSame) {
  make_service(table_);
  OptimizeRequest req = two_job_day();
  req.commit = false;
  const OptimizeResponse r1 = svc_->optimize("acme", req);
  const OptimizeResponse r2 = svc_->optimize("acme", req);
  EXPECT_NE(r1.run_id, r2.run_id);
  EXPECT_FALSE(r1.committed);
  EXPECT_EQ(svc_->runs().get(r1.run_id)->input_hash, svc_->runs().get(r2.run_id)->input_hash);
  EXPECT_EQ(r1.assignments, r2.assignments);
  EXPECT_FALSE(svc_->committed_schedule("acme"));
}

TEST_F(SchedulerTest, InvalidRequestIsRejectedBeforeAnyRun) {
  make_service(table_);
  OptimizeRequest req = two_job_day();
  req.time_budget_seconds = 0;
  EXPECT_THROW(svc_->optimize("acme", req), ValidationError);
  EXPECT_THROW(svc_->optimize("", two_job_day()), ValidationError);
  EXPECT_EQ(svc_->runs().size(), 0U);
}

TEST_F(SchedulerTest, SecondWriterIsBusy) {
  auto gate = std::make_shared<GatedProvider>(table_);
  make_service(gate);

  auto first = std::async(std::launch::async, [this] { return svc_->optimize("acme", two_job_day()); });
  ASSERT_TRUE(gate->wait_entered(5000));

  EXPECT_THROW(svc_->optimize("acme", two_job_day()), BusyError);
  EXPECT_THROW(svc_->update_job_status("acme", "A", JobStatus::Completed), BusyError);
  OptimizeRequest other = two_job_day();
  other.commit = false;

  gate->open();
  const OptimizeResponse resp = first.get();
  EXPECT_TRUE(resp.committed);
  EXPECT_NO_THROW(svc_->optimize("globex", other));
}

TEST_F(SchedulerTest, CriticalDisruptionPreemptsRunningOptimization) {
  auto gate = std::make_shared<GatedProvider>(table_, true);
  make_service(gate);
  ASSERT_TRUE(svc_->optimize("acme", two_job_day()).committed);

  gate->close();
  auto running = std::async(std::launch::async, [this] { return svc_->optimize("acme", extended_day()); });
  ASSERT_TRUE(gate->wait_entered(5000));

  AdaptRequest ar;
  ar.event.type = DisruptionType::TrafficDelay;
  ar.event.severity = Severity::Critical;
  ar.event.affected_job_ids = {"A"};
  ar.event.expected_duration_minutes = 10;
  ar.now_minute = 500;
  auto adapting = std::async(std::launch::async, [this, ar] { return svc_->adapt("acme", ar); });

  ASSERT_TRUE(wait_for_status(RunStatus::Cancelled, 5000));
  gate->open();

  const OptimizeResponse resp = running.get();
  const AdaptationResult res = adapting.get();

  EXPECT_EQ(resp.status, RunStatus::Cancelled);
  EXPECT_FALSE(resp.committed);
  const auto cancelled = runs_with(RunStatus::Cancelled);
  ASSERT_EQ(cancelled.size(), 1U);
  EXPECT_EQ(cancelled[0].id, resp.run_id);
  EXPECT_EQ(cancelled[0].failure_reason, "preempted by traffic_delay");

  EXPECT_EQ(res.state, AdaptationState::Notified);
  auto snap = svc_->committed_schedule("acme");
  EXPECT_EQ(snap->version, 2);
  EXPECT_EQ(snap->jobs.count("C"), 0U);
  EXPECT_EQ(snap->assignments.at("A").scheduled_start, 550);
}

TEST_F(SchedulerTest, CancelRunStopsWithoutCommitting) {
  auto gate = std::make_shared<GatedProvider>(table_, true);
  make_service(gate);
  const OptimizeResponse done = svc_->optimize("acme", two_job_day());

  gate->close();
  auto running = std::async(std::launch::async, [this] { return svc_->optimize("acme", extended_day()); });
  ASSERT_TRUE(gate->wait_entered(5000));
  const auto active = runs_with(RunStatus::Running);
  ASSERT_EQ(active.size(), 1U);

  svc_->cancel_run(active[0].id);
  gate->open();
  const OptimizeResponse resp = running.get();

  EXPECT_EQ(resp.status, RunStatus::Cancelled);
  EXPECT_FALSE(resp.committed);
  EXPECT_EQ(svc_->committed_schedule("acme")->version, 1);
  EXPECT_EQ(svc_->runs().get(resp.run_id)->failure_reason, "cancelled");

  // terminal runs stay as they are; unknown runs are reported
  EXPECT_NO_THROW(svc_->cancel_run(done.run_id));
  EXPECT_EQ(svc_->runs().get(done.run_id)->status, RunStatus::Completed);
  EXPECT_THROW(svc_->cancel_run("run-missing"), NotFoundError);
}

TEST_F(SchedulerTest, FreshLocationBecomesTheRouteStart) {
  make_service(table_);
  OptimizeRequest req = two_job_day();
  req.now_minute = 480;

  svc_->update_location("t1", node(5), 478, "en_route");
  svc_->optimize("acme", req);
  EXPECT_EQ(svc_->committed_schedule("acme")->start_points.at("t1"), node(5));
  EXPECT_EQ(svc_->locations().status("t1"), "en_route");
}

TEST_F(SchedulerTest, StaleLocationFallsBackToHome) {
  make_service(table_);
  OptimizeRequest req = two_job_day();
  req.now_minute = 480;

  svc_->update_location("t1", node(5), 100, "idle");
  svc_->optimize("acme", req);
  EXPECT_EQ(svc_->committed_schedule("acme")->start_points.at("t1"), node(0));
}

TEST_F(SchedulerTest, OlderFixNeverReplacesNewer) {
  make_service(table_);
  svc_->update_location("t1", node(5), 478, "en_route");
  svc_->update_location("t1", node(7), 300, "idle");
  ASSERT_TRUE(svc_->locations().latest("t1"));
  EXPECT_EQ(svc_->locations().latest("t1")->point, node(5));
  EXPECT_EQ(svc_->locations().latest("t1")->minute, 478);
}

TEST_F(SchedulerTest, LocationUpdatesAreValidated) {
  make_service(table_);
  EXPECT_THROW(svc_->update_location("", node(1), 0, "idle"), ValidationError);
  EXPECT_THROW(svc_->update_location("t1", GeoPoint{91.0, 0.0}, 0, "idle"), ValidationError);
  EXPECT_THROW(svc_->update_location("t1", GeoPoint{0.0, -181.0}, 0, "idle"), ValidationError);
  EXPECT_FALSE(svc_->locations().latest("t1"));
}

TEST_F(SchedulerTest, CompletingAJobArchivesItAndRecordsTheOutcome) {
  make_service(table_);
  svc_->optimize("acme", two_job_day());
  const Assignment b_before = svc_->committed_schedule("acme")->assignments.at("B");

  svc_->update_job_status("acme", "A", JobStatus::Completed);

  auto snap = svc_->committed_schedule("acme");
  EXPECT_EQ(snap->version, 2);
  EXPECT_EQ(snap->technician("t1")->route, std::vector<std::string>{"B"});
  EXPECT_FALSE(snap->assignment("A"));
  EXPECT_EQ(snap->assignments.at("B"), b_before);
  EXPECT_EQ(snap->jobs.at("A").status, JobStatus::Completed);
  ASSERT_EQ(snap->archived.size(), 1U);
  EXPECT_EQ(snap->archived[0], "A");

  const auto outcomes = svc_->runs().outcomes("acme", DAY, DAY);
  ASSERT_EQ(outcomes.size(), 1U);
  EXPECT_EQ(outcomes[0].job_id, "A");
  EXPECT_EQ(outcomes[0].technician_id, "t1");
  EXPECT_EQ(outcomes[0].actual_start, 540);

  EXPECT_THROW(svc_->update_job_status("acme", "A", JobStatus::Cancelled), ValidationError);
  EXPECT_THROW(svc_->update_job_status("acme", "Z", JobStatus::Completed), NotFoundError);
  EXPECT_THROW(svc_->update_job_status("nobody", "A", JobStatus::Completed), NotFoundError);
}

TEST_F(SchedulerTest, UnschedulingKeepsTheJobOpen) {
  make_service(table_);
  svc_->optimize("acme", two_job_day());
  svc_->update_job_status("acme", "B", JobStatus::Unscheduled);

  auto snap = svc_->committed_schedule("acme");
  EXPECT_EQ(snap->technician("t1")->route, std::vector<std::string>{"A"});
  EXPECT_TRUE(snap->archived.empty());
  EXPECT_EQ(snap->jobs.at("B").status, JobStatus::Unscheduled);
  EXPECT_THROW(svc_->update_job_status("acme", "B", JobStatus::Scheduled), ValidationError);
  EXPECT_TRUE(svc_->runs().outcomes("acme", DAY, DAY).empty());
}

TEST_F(SchedulerTest, AnalyticsOverRecordedRuns) {
  make_service(table_);
  svc_->optimize("acme", two_job_day());
  svc_->update_job_status("acme", "A", JobStatus::Completed);

  const AnalyticsReport rep = svc_->get_analytics("acme", AnalyticsPeriod{DAY, DAY}, AnalyticsFilters{});
  EXPECT_EQ(rep.kpis.runs, 1);
  EXPECT_EQ(rep.kpis.outcomes, 1);
  EXPECT_DOUBLE_EQ(rep.kpis.success_rate, 1.0);
  EXPECT_DOUBLE_EQ(rep.kpis.on_time_rate, 1.0);
  EXPECT_DOUBLE_EQ(rep.kpis.jobs_per_technician_day, 2.0);

  EXPECT_THROW(svc_->get_analytics("acme", AnalyticsPeriod{DAY + 1, DAY}, AnalyticsFilters{}), ValidationError);
  EXPECT_EQ(svc_->get_analytics("acme", AnalyticsPeriod{DAY + 1, DAY + 2}, AnalyticsFilters{}).kpis.runs, 0);
}

TEST_F(SchedulerTest, OutcomesNeedJobAndTechnician) {
  make_service(table_);
  JobOutcome o;
  o.job_id = "A";
  EXPECT_THROW(svc_->record_outcome("acme", o), ValidationError);
  o.technician_id = "t1";
  o.planning_day = DAY;
  svc_->record_outcome("acme", o);
  EXPECT_EQ(svc_->runs().outcomes("acme", DAY, DAY).size(), 1U);
}

TEST_F(SchedulerTest, RestoredScheduleIsCommittedForTheTenant) {
  make_service(table_);
  svc_->optimize("acme", two_job_day());
  Schedule copy = *svc_->committed_schedule("acme");
  svc_->restore_schedule("globex", copy);
  auto snap = svc_->committed_schedule("globex");
  ASSERT_TRUE(snap);
  EXPECT_EQ(snap->tenant_id, "globex");
  EXPECT_EQ(snap->assignments.size(), 2U);
}
