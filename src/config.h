// config.h
#pragma once
#include <string>

#include <nlohmann/json.hpp>

namespace fsched {

// Engine-wide knobs. JSON keys are the UPPER_CASE names next to each field.
struct EngineConfig {
  int time_budget_seconds = 30;         // TIME_BUDGET_SECONDS, per optimization run
  int max_iterations = 1000;            // MAX_ITERATIONS, local-search cap
  int travel_timeout_ms = 5000;         // TRAVEL_TIMEOUT_MS, per provider batch
  int weather_timeout_ms = 2000;        // WEATHER_TIMEOUT_MS, per weather lookup
  double average_speed_kmh = 30.0;      // AVERAGE_SPEED_KMH, fallback estimator
  int location_staleness_minutes = 5;   // LOCATION_STALENESS_MINUTES
  int run_retention_days = 90;          // RUN_RETENTION_DAYS
  int alternatives_per_assignment = 3;  // ALTERNATIVES_PER_ASSIGNMENT
  int preemption_wait_ms = 2000;        // PREEMPTION_WAIT_MS
  int adapt_iterations = 50;            // ADAPT_ITERATIONS, local search during repair
  int adapt_time_budget_ms = 2000;      // ADAPT_TIME_BUDGET_MS
  int forecast_window_days = 14;        // FORECAST_WINDOW_DAYS
  int forecast_horizon_days = 7;        // FORECAST_HORIZON_DAYS
  double smoothing_alpha = 0.3;         // SMOOTHING_ALPHA
  int on_time_grace_minutes = 10;       // ON_TIME_GRACE_MINUTES
  int travel_cache_capacity = 4096;     // TRAVEL_CACHE_CAPACITY
  std::string construction = "greedy";  // CONSTRUCTION: greedy | routing_model
  bool verbose = false;                 // VERBOSE
};

EngineConfig parse_engine_config(const nlohmann::json& j);
EngineConfig load_engine_config(const std::string& path);

}  // namespace fsched
