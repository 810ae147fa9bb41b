#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "analytics.h"

using namespace fsched;

class AnalyticsTest : public ::testing::Test {
 protected:
  static Assignment assigned(const std::string& tech, int travel, double confidence) {
    Assignment a;
    a.job_id = tech + "-" + std::to_string(travel);
    a.technician_id = tech;
    a.travel_from_previous = travel;
    a.confidence = confidence;
    return a;
  }

  static OptimizationRun run_on(int day, double utilization, double travel_avg,
                                RunStatus status = RunStatus::Completed) {
    OptimizationRun r;
    r.id = "run-" + std::to_string(day);
    r.tenant_id = "acme";
    r.planning_day = day;
    r.created_ms = day * 1000LL;
    r.status = status;
    r.metrics.utilization = utilization;
    r.metrics.success_rate = 1.0;
    r.metrics.average_travel_minutes = travel_avg;
    return r;
  }

  static JobOutcome outcome(const std::string& tech, int scheduled, int actual, bool completed = true) {
    JobOutcome o;
    o.job_id = tech + "-" + std::to_string(actual);
    o.technician_id = tech;
    o.planning_day = 3;
    o.scheduled_start = scheduled;
    o.actual_start = actual;
    o.actual_end = actual + 30;
    o.completed = completed;
    return o;
  }

  // Two completed runs and one failed run that must not count.
  std::vector<OptimizationRun> two_days() const {
    OptimizationRun r1 = run_on(1, 0.5, 20.0);
    r1.metrics.busy_minutes = 300;
    r1.metrics.available_minutes = 600;
    r1.metrics.baseline_travel_minutes = 100;
    r1.metrics.total_jobs = 4;
    r1.metrics.scheduled_jobs = 3;
    r1.metrics.total_travel_minutes = 60;
    r1.metrics.technicians = 2;
    r1.assignments = {assigned("t1", 10, 0.9), assigned("t1", 20, 0.8), assigned("t2", 30, 0.7)};

    OptimizationRun r2 = run_on(2, 0.5, 10.0);
    r2.metrics.busy_minutes = 200;
    r2.metrics.available_minutes = 400;
    r2.metrics.total_jobs = 2;
    r2.metrics.scheduled_jobs = 2;
    r2.metrics.total_travel_minutes = 20;
    r2.metrics.technicians = 1;
    r2.assignments = {assigned("t1", 10, 0.5), assigned("t1", 12, 0.5)};

    OptimizationRun failed = run_on(2, 0.1, 99.0, RunStatus::Failed);
    failed.id = "run-failed";
    failed.metrics.total_jobs = 50;
    return {r1, r2, failed};
  }

  std::vector<JobOutcome> outcomes() const {
    return {outcome("t1", 540, 540), outcome("t1", 540, 560), outcome("t2", 540, 545),
            outcome("t2", 540, 700, false)};
  }
};

TEST_F(AnalyticsTest, KpisOverCompletedRuns) {
  const Kpis k = compute_kpis(two_days(), outcomes(), AnalyticsFilters{}, 10);
  EXPECT_EQ(k.runs, 2);
  EXPECT_DOUBLE_EQ(k.utilization_rate, 0.5);
  EXPECT_DOUBLE_EQ(k.average_travel_minutes, 16.0);
  EXPECT_NEAR(k.average_confidence, 0.68, 1e-12);
  EXPECT_DOUBLE_EQ(k.travel_savings_percent, 20.0);
  EXPECT_NEAR(k.jobs_per_technician_day, 5.0 / 3.0, 1e-12);
  EXPECT_NEAR(k.success_rate, 5.0 / 6.0, 1e-12);
  EXPECT_EQ(k.outcomes, 3);
  EXPECT_NEAR(k.on_time_rate, 2.0 / 3.0, 1e-12);
}

TEST_F(AnalyticsTest, TechnicianFilterNarrowsAssignmentsAndOutcomes) {
  AnalyticsFilters f;
  f.technician_id = "t1";
  const Kpis k = compute_kpis(two_days(), outcomes(), f, 10);
  EXPECT_DOUBLE_EQ(k.average_travel_minutes, 13.0);
  EXPECT_NEAR(k.average_confidence, 0.675, 1e-12);
  EXPECT_DOUBLE_EQ(k.jobs_per_technician_day, 2.0);
  EXPECT_DOUBLE_EQ(k.travel_savings_percent, 0.0);
  EXPECT_EQ(k.outcomes, 2);
  EXPECT_DOUBLE_EQ(k.on_time_rate, 0.5);
}

TEST_F(AnalyticsTest, OnTimeRatesPerTechnician) {
  const auto rates = on_time_rates(outcomes(), 10);
  ASSERT_EQ(rates.size(), 2U);
  EXPECT_DOUBLE_EQ(rates.at("t1"), 0.5);
  EXPECT_DOUBLE_EQ(rates.at("t2"), 1.0);
  EXPECT_DOUBLE_EQ(on_time_rates(outcomes(), 30).at("t1"), 1.0);
}

TEST_F(AnalyticsTest, TrendsCompareTheTwoHalves) {
  const std::vector<OptimizationRun> runs = {run_on(2, 0.5, 20.0), run_on(8, 0.8, 10.0)};
  const auto trends = compute_trends(runs, AnalyticsPeriod{1, 10});
  ASSERT_EQ(trends.size(), 5U);

  const Trend& util = trends[0];
  EXPECT_EQ(util.metric, "utilization_rate");
  EXPECT_EQ(util.direction, TrendDirection::Up);
  EXPECT_NEAR(util.change_percent, 60.0, 1e-9);
  EXPECT_EQ(util.significance, "high");

  EXPECT_EQ(trends[1].metric, "success_rate");
  EXPECT_EQ(trends[1].direction, TrendDirection::Stable);
  EXPECT_EQ(trends[1].significance, "low");

  EXPECT_EQ(trends[2].metric, "average_travel_minutes");
  EXPECT_EQ(trends[2].direction, TrendDirection::Down);
  EXPECT_NEAR(trends[2].change_percent, -50.0, 1e-9);
}

TEST_F(AnalyticsTest, TrendSignificanceBands) {
  const auto small = compute_trends({run_on(1, 0.50, 10.0), run_on(10, 0.52, 10.0)}, AnalyticsPeriod{1, 10});
  EXPECT_EQ(small[0].direction, TrendDirection::Stable);
  EXPECT_EQ(small[0].significance, "low");

  const auto medium = compute_trends({run_on(1, 0.40, 10.0), run_on(10, 0.46, 10.0)}, AnalyticsPeriod{1, 10});
  EXPECT_EQ(medium[0].direction, TrendDirection::Up);
  EXPECT_EQ(medium[0].significance, "medium");
}

TEST_F(AnalyticsTest, OneSidedPeriodHasNoTrends) {
  EXPECT_TRUE(compute_trends({run_on(1, 0.5, 10.0), run_on(2, 0.6, 10.0)}, AnalyticsPeriod{1, 10}).empty());
}

TEST_F(AnalyticsTest, ConstantDemandForecastsItself) {
  std::vector<std::pair<int, double>> series;
  for (int d = 1; d <= 5; ++d) series.push_back({d, 10.0});
  const DemandForecast f = forecast_demand("plumbing", series, 5, AnalyticsSettings{});
  EXPECT_EQ(f.method, "exponential_smoothing");
  ASSERT_EQ(f.points.size(), 7U);
  EXPECT_EQ(f.points.front().day, 6);
  EXPECT_EQ(f.points.back().day, 12);
  for (const auto& p : f.points) {
    EXPECT_DOUBLE_EQ(p.value, 10.0);
    EXPECT_DOUBLE_EQ(p.lower, 10.0);
    EXPECT_DOUBLE_EQ(p.upper, 10.0);
  }
}

TEST_F(AnalyticsTest, SmoothedForecastWidensWithHorizon) {
  const std::vector<std::pair<int, double>> series = {{1, 4}, {2, 8}, {3, 6}, {4, 10}, {5, 2}};
  const DemandForecast f = forecast_demand("electrical", series, 5, AnalyticsSettings{});
  ASSERT_EQ(f.points.size(), 7U);
  EXPECT_NEAR(f.points[0].value, 5.3656, 1e-9);
  for (size_t h = 1; h < f.points.size(); ++h) {
    EXPECT_GT(f.points[h].upper - f.points[h].value, f.points[h - 1].upper - f.points[h - 1].value);
    EXPECT_GE(f.points[h].lower, 0.0);
  }
}

TEST_F(AnalyticsTest, LowerBoundNeverNegative) {
  const std::vector<std::pair<int, double>> series = {{1, 0}, {2, 5}, {3, 0}, {4, 5}, {5, 0}};
  const DemandForecast f = forecast_demand("general", series, 5, AnalyticsSettings{});
  EXPECT_DOUBLE_EQ(f.points[0].lower, 0.0);
  EXPECT_GT(f.points[0].upper, f.points[0].value);
}

TEST_F(AnalyticsTest, FewPointsFallBackToMovingAverage) {
  // day 1 falls outside the 14-day window ending on day 30
  const std::vector<std::pair<int, double>> series = {{1, 100}, {20, 4}, {25, 6}};
  const DemandForecast f = forecast_demand("general", series, 30, AnalyticsSettings{});
  EXPECT_EQ(f.method, "moving_average");
  const double spread = FORECAST_Z95 * std::sqrt(2.0);
  EXPECT_DOUBLE_EQ(f.points[0].value, 5.0);
  EXPECT_NEAR(f.points[0].lower, 5.0 - spread, 1e-9);
  EXPECT_NEAR(f.points[0].upper, 5.0 + spread, 1e-9);
  EXPECT_EQ(f.points[0].day, 31);
}

TEST_F(AnalyticsTest, ReportRecommendsOnWeakKpis) {
  OptimizationRun r = run_on(3, 0.3, 45.0);
  r.metrics.busy_minutes = 150;
  r.metrics.available_minutes = 500;
  r.metrics.total_jobs = 10;
  r.metrics.scheduled_jobs = 5;
  r.metrics.total_travel_minutes = 225;
  r.metrics.technicians = 1;
  r.demand_by_category = {{"plumbing", 6}, {"electrical", 4}};
  const std::vector<JobOutcome> late = {outcome("t1", 540, 600), outcome("t1", 540, 545)};

  const AnalyticsReport rep = compute_analytics({r}, late, AnalyticsPeriod{1, 5}, AnalyticsFilters{},
                                                AnalyticsSettings{});
  EXPECT_EQ(rep.kpis.runs, 1);
  ASSERT_EQ(rep.predictions.size(), 2U);
  EXPECT_EQ(rep.predictions[0].category, "electrical");
  EXPECT_EQ(rep.predictions[0].method, "moving_average");

  auto mentions = [&rep](const std::string& word) {
    for (const auto& s : rep.recommendations)
      if (s.find(word) != std::string::npos) return true;
    return false;
  };
  EXPECT_TRUE(mentions("Utilization"));
  EXPECT_TRUE(mentions("scheduled"));
  EXPECT_TRUE(mentions("travel"));
  EXPECT_TRUE(mentions("On-time"));
}

TEST_F(AnalyticsTest, CategoryFilterLimitsPredictions) {
  OptimizationRun r = run_on(3, 0.7, 10.0);
  r.demand_by_category = {{"plumbing", 6}, {"electrical", 4}};
  AnalyticsFilters f;
  f.category = "plumbing";
  const AnalyticsReport rep = compute_analytics({r}, {}, AnalyticsPeriod{1, 5}, f, AnalyticsSettings{});
  ASSERT_EQ(rep.predictions.size(), 1U);
  EXPECT_EQ(rep.predictions[0].category, "plumbing");
  EXPECT_EQ(rep.predictions[0].points.front().day, 6);
}

TEST_F(AnalyticsTest, RunsOutsideThePeriodAreIgnored) {
  const AnalyticsReport rep = compute_analytics({run_on(30, 0.5, 10.0)}, {}, AnalyticsPeriod{1, 5},
                                                AnalyticsFilters{}, AnalyticsSettings{});
  EXPECT_EQ(rep.kpis.runs, 0);
  EXPECT_TRUE(rep.predictions.empty());
  EXPECT_TRUE(rep.recommendations.empty());
}
