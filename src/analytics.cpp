#include "analytics.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <functional>

#include "log.h"

namespace fsched {

namespace {

bool counted(const OptimizationRun& r) { return r.status == RunStatus::Completed; }

bool on_time(const JobOutcome& o, int grace) { return o.actual_start <= o.scheduled_start + grace; }

double mean(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  double s = 0.0;
  for (double x : v) s += x;
  return s / static_cast<double>(v.size());
}

double stddev(const std::vector<double>& v) {
  if (v.size() < 2) return 0.0;
  const double m = mean(v);
  double s = 0.0;
  for (double x : v) s += (x - m) * (x - m);
  return std::sqrt(s / static_cast<double>(v.size() - 1));
}

std::string pct(double x) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f%%", x * 100.0);
  return buf;
}

std::string num(double x) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f", x);
  return buf;
}

// Latest completed run per planning day.
std::map<int, const OptimizationRun*> latest_per_day(const std::vector<OptimizationRun>& runs) {
  std::map<int, const OptimizationRun*> out;
  for (const auto& r : runs) {
    if (!counted(r)) continue;
    auto it = out.find(r.planning_day);
    if (it == out.end() || it->second->created_ms < r.created_ms ||
        (it->second->created_ms == r.created_ms && it->second->id < r.id))
      out[r.planning_day] = &r;
  }
  return out;
}

}  // namespace

Kpis compute_kpis(const std::vector<OptimizationRun>& runs, const std::vector<JobOutcome>& outcomes,
                  const AnalyticsFilters& filters, int grace_minutes) {
  Kpis k;
  long long busy = 0, available = 0, travel = 0, baseline = 0;
  long long scheduled = 0, total = 0, tech_days = 0;
  double conf_sum = 0.0;

  for (const auto& r : runs) {
    if (!counted(r)) continue;
    ++k.runs;
    busy += r.metrics.busy_minutes;
    available += r.metrics.available_minutes;
    baseline += r.metrics.baseline_travel_minutes;
    total += r.metrics.total_jobs;

    if (filters.technician_id) {
      int n = 0;
      for (const auto& a : r.assignments) {
        if (a.technician_id != *filters.technician_id) continue;
        ++n;
        travel += a.travel_from_previous;
        conf_sum += a.confidence;
      }
      scheduled += n;
      if (n > 0) ++tech_days;
    } else {
      scheduled += r.metrics.scheduled_jobs;
      travel += r.metrics.total_travel_minutes;
      tech_days += r.metrics.technicians;
      for (const auto& a : r.assignments) conf_sum += a.confidence;
    }
  }

  if (available > 0) k.utilization_rate = static_cast<double>(busy) / static_cast<double>(available);
  if (scheduled > 0) {
    k.average_travel_minutes = static_cast<double>(travel) / static_cast<double>(scheduled);
    k.average_confidence = conf_sum / static_cast<double>(scheduled);
  }
  if (!filters.technician_id && baseline > 0)
    k.travel_savings_percent = 100.0 * static_cast<double>(baseline - travel) / static_cast<double>(baseline);
  if (tech_days > 0) k.jobs_per_technician_day = static_cast<double>(scheduled) / static_cast<double>(tech_days);
  if (total > 0) k.success_rate = static_cast<double>(std::min(scheduled, total)) / static_cast<double>(total);

  int done = 0, in_time = 0;
  for (const auto& o : outcomes) {
    if (!o.completed) continue;
    if (filters.technician_id && o.technician_id != *filters.technician_id) continue;
    ++done;
    if (on_time(o, grace_minutes)) ++in_time;
  }
  k.outcomes = done;
  if (done > 0) k.on_time_rate = static_cast<double>(in_time) / static_cast<double>(done);
  return k;
}

std::vector<Trend> compute_trends(const std::vector<OptimizationRun>& runs, const AnalyticsPeriod& period) {
  using Metric = std::function<double(const RunMetrics&)>;
  const std::vector<std::pair<std::string, Metric>> metrics = {
      {"utilization_rate", [](const RunMetrics& m) { return m.utilization; }},
      {"success_rate", [](const RunMetrics& m) { return m.success_rate; }},
      {"average_travel_minutes", [](const RunMetrics& m) { return m.average_travel_minutes; }},
      {"average_confidence", [](const RunMetrics& m) { return m.average_confidence; }},
      {"travel_savings_percent", [](const RunMetrics& m) { return m.travel_savings_percent; }},
  };

  const int mid = period.from_day + (period.to_day - period.from_day) / 2;
  std::vector<Trend> out;
  for (const auto& metric : metrics) {
    std::vector<double> first, second;
    for (const auto& r : runs) {
      if (!counted(r) || r.planning_day < period.from_day || r.planning_day > period.to_day) continue;
      (r.planning_day <= mid ? first : second).push_back(metric.second(r.metrics));
    }
    if (first.empty() || second.empty()) continue;

    Trend t;
    t.metric = metric.first;
    t.first_half = mean(first);
    t.second_half = mean(second);
    if (t.first_half != 0.0)
      t.change_percent = 100.0 * (t.second_half - t.first_half) / std::fabs(t.first_half);
    else
      t.change_percent = t.second_half == 0.0 ? 0.0 : (t.second_half > 0.0 ? 100.0 : -100.0);

    const double mag = std::fabs(t.change_percent);
    if (mag < TREND_STABLE_PERCENT) t.direction = TrendDirection::Stable;
    else t.direction = t.change_percent > 0.0 ? TrendDirection::Up : TrendDirection::Down;
    t.significance = mag > TREND_HIGH_PERCENT ? "high" : (mag > TREND_MEDIUM_PERCENT ? "medium" : "low");
    out.push_back(t);
  }
  return out;
}

DemandForecast forecast_demand(const std::string& category, const std::vector<std::pair<int, double>>& series,
                               int last_day, const AnalyticsSettings& s) {
  DemandForecast f;
  f.category = category;

  std::vector<double> values;
  const int first_day = last_day - s.forecast_window_days + 1;
  for (const auto& p : series)
    if (p.first >= first_day && p.first <= last_day) values.push_back(p.second);

  const double alpha = s.smoothing_alpha;
  double level = 0.0;
  double sigma = 0.0;
  if (static_cast<int>(values.size()) >= FORECAST_MIN_POINTS) {
    f.method = "exponential_smoothing";
    level = values.front();
    std::vector<double> residuals;
    for (size_t i = 1; i < values.size(); ++i) {
      residuals.push_back(values[i] - level);
      level = alpha * values[i] + (1.0 - alpha) * level;
    }
    sigma = stddev(residuals);
  } else {
    f.method = "moving_average";
    level = mean(values);
    sigma = stddev(values);
  }

  for (int h = 1; h <= s.forecast_horizon_days; ++h) {
    const double spread = FORECAST_Z95 * sigma * std::sqrt(1.0 + (h - 1) * alpha * alpha);
    ForecastPoint pt;
    pt.day = last_day + h;
    pt.value = level;
    pt.lower = std::max(0.0, level - spread);
    pt.upper = level + spread;
    f.points.push_back(pt);
  }
  return f;
}

std::map<std::string, double> on_time_rates(const std::vector<JobOutcome>& outcomes, int grace_minutes) {
  std::map<std::string, std::pair<int, int>> tally;  // on time, completed
  for (const auto& o : outcomes) {
    if (!o.completed) continue;
    auto& t = tally[o.technician_id];
    ++t.second;
    if (on_time(o, grace_minutes)) ++t.first;
  }
  std::map<std::string, double> out;
  for (const auto& kv : tally)
    out[kv.first] = static_cast<double>(kv.second.first) / static_cast<double>(kv.second.second);
  return out;
}

AnalyticsReport compute_analytics(const std::vector<OptimizationRun>& runs, const std::vector<JobOutcome>& outcomes,
                                  const AnalyticsPeriod& period, const AnalyticsFilters& filters,
                                  const AnalyticsSettings& s) {
  AnalyticsReport rep;
  rep.period = period;

  std::vector<OptimizationRun> in_period;
  for (const auto& r : runs)
    if (r.planning_day >= period.from_day && r.planning_day <= period.to_day) in_period.push_back(r);
  std::vector<JobOutcome> outcomes_in_period;
  for (const auto& o : outcomes)
    if (o.planning_day >= period.from_day && o.planning_day <= period.to_day) outcomes_in_period.push_back(o);

  rep.kpis = compute_kpis(in_period, outcomes_in_period, filters, s.on_time_grace_minutes);
  rep.trends = compute_trends(in_period, period);

  // Demand series per category from the latest run of each day.
  std::map<std::string, std::vector<std::pair<int, double>>> series;
  for (const auto& kv : latest_per_day(in_period)) {
    for (const auto& d : kv.second->demand_by_category) {
      if (filters.category && d.first != *filters.category) continue;
      series[d.first].push_back({kv.first, static_cast<double>(d.second)});
    }
  }
  for (const auto& kv : series) rep.predictions.push_back(forecast_demand(kv.first, kv.second, period.to_day, s));
  FSLOG("[analytics] days %d..%d: %d runs, %d outcomes, %zu categories\n", period.from_day, period.to_day,
        rep.kpis.runs, rep.kpis.outcomes, rep.predictions.size());

  const Kpis& k = rep.kpis;
  auto& rec = rep.recommendations;
  if (k.runs > 0) {
    if (k.utilization_rate < 0.6)
      rec.push_back("Utilization is " + pct(k.utilization_rate) + "; consolidate routes or reduce technicians on shift");
    else if (k.utilization_rate > 0.9)
      rec.push_back("Utilization is " + pct(k.utilization_rate) + "; add technician capacity");
    if (k.success_rate < 0.9)
      rec.push_back("Only " + pct(k.success_rate) + " of jobs were scheduled; review skill coverage and working hours");
    if (k.average_travel_minutes > 30.0)
      rec.push_back("Average travel is " + num(k.average_travel_minutes) + " min per job; group jobs by area");
    if (k.average_confidence < 0.6 && k.average_confidence > 0.0)
      rec.push_back("Average confidence is " + num(k.average_confidence) + "; add slack between jobs");
  }
  if (k.outcomes > 0 && k.on_time_rate < 0.85)
    rec.push_back("On-time rate is " + pct(k.on_time_rate) + "; add buffer time before jobs");
  for (const auto& t : rep.trends) {
    if (t.significance != "high") continue;
    const bool worse = (t.metric == "average_travel_minutes") ? t.direction == TrendDirection::Up
                                                              : t.direction == TrendDirection::Down;
    if (worse) rec.push_back(t.metric + " moved " + num(t.change_percent) + "% over the period; investigate");
  }
  for (const auto& f : rep.predictions) {
    const auto& pts = series[f.category];
    std::vector<double> recent;
    for (const auto& p : pts) recent.push_back(p.second);
    const double base = mean(recent);
    if (!f.points.empty() && base > 0.0 && f.points.front().value > 1.2 * base)
      rec.push_back("Demand for " + f.category + " is rising; plan capacity for the coming days");
  }
  return rep;
}

const char* to_string(TrendDirection d) {
  switch (d) {
    case TrendDirection::Up: return "up";
    case TrendDirection::Down: return "down";
    case TrendDirection::Stable: return "stable";
  }
  return "stable";
}

}  // namespace fsched
