// analytics.h
#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types.h"

namespace fsched {

constexpr double TREND_STABLE_PERCENT = 5.0;
constexpr double TREND_MEDIUM_PERCENT = 10.0;
constexpr double TREND_HIGH_PERCENT = 20.0;
constexpr double FORECAST_Z95 = 1.96;
constexpr int FORECAST_MIN_POINTS = 3;  // fewer points -> moving average

// Inclusive range of planning days.
struct AnalyticsPeriod {
  int from_day = 0;
  int to_day = 0;
};

struct AnalyticsFilters {
  std::optional<std::string> technician_id;
  std::optional<std::string> category;
};

struct AnalyticsSettings {
  int on_time_grace_minutes = 10;
  int forecast_window_days = 14;
  int forecast_horizon_days = 7;
  double smoothing_alpha = 0.3;
};

struct Kpis {
  double utilization_rate = 0.0;
  double on_time_rate = 0.0;
  double average_travel_minutes = 0.0;
  double travel_savings_percent = 0.0;
  double jobs_per_technician_day = 0.0;
  double success_rate = 0.0;
  double average_confidence = 0.0;
  int runs = 0;
  int outcomes = 0;
};

enum class TrendDirection { Up, Down, Stable };

struct Trend {
  std::string metric;
  TrendDirection direction = TrendDirection::Stable;
  double change_percent = 0.0;
  std::string significance;  // low | medium | high
  double first_half = 0.0;
  double second_half = 0.0;
};

struct ForecastPoint {
  int day = 0;
  double value = 0.0;
  double lower = 0.0;  // never negative
  double upper = 0.0;
};

struct DemandForecast {
  std::string category;
  std::string method;  // exponential_smoothing | moving_average
  std::vector<ForecastPoint> points;
};

struct AnalyticsReport {
  AnalyticsPeriod period;
  Kpis kpis;
  std::vector<Trend> trends;
  std::vector<DemandForecast> predictions;
  std::vector<std::string> recommendations;
};

// Completed runs only; the technician filter narrows the assignment-based KPIs and outcomes.
Kpis compute_kpis(const std::vector<OptimizationRun>& runs, const std::vector<JobOutcome>& outcomes,
                  const AnalyticsFilters& filters, int grace_minutes);

// First half of the period against the second half, per metric. Metrics
// without runs in both halves are left out.
std::vector<Trend> compute_trends(const std::vector<OptimizationRun>& runs, const AnalyticsPeriod& period);

// Forecast for the days after last_day from (day, demand) points sorted by day.
DemandForecast forecast_demand(const std::string& category, const std::vector<std::pair<int, double>>& series,
                               int last_day, const AnalyticsSettings& s);

// Per-technician share of completed jobs started within the grace window.
std::map<std::string, double> on_time_rates(const std::vector<JobOutcome>& outcomes, int grace_minutes);

AnalyticsReport compute_analytics(const std::vector<OptimizationRun>& runs, const std::vector<JobOutcome>& outcomes,
                                  const AnalyticsPeriod& period, const AnalyticsFilters& filters,
                                  const AnalyticsSettings& s);

const char* to_string(TrendDirection d);

}  // namespace fsched
