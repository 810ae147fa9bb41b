// scheduler.h
#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "analytics.h"
#include "cancellation.h"
#include "config.h"
#include "disruption.h"
#include "location_store.h"
#include "notification.h"
#include "run_store.h"
#include "schedule.h"
#include "travel_time.h"
#include "types.h"
#include "weather.h"

namespace fsched {

constexpr const char* ALGORITHM_VERSION = "fieldsched-1.0";

struct OptimizeRequest {
  std::vector<Job> jobs;
  std::vector<Technician> technicians;
  ConstraintSet constraints;
  TimeWindow horizon{0, MINUTES_PER_DAY};
  int planning_day = 0;
  int now_minute = 0;
  std::optional<int> baseline_travel_minutes;  // manual plan travel, for savings
  std::optional<int> time_budget_seconds;      // overrides the engine default
  bool commit = true;
};

struct OptimizeResponse {
  std::string run_id;
  std::vector<Assignment> assignments;
  std::vector<UnscheduledJob> unscheduled;
  RunMetrics metrics;
  std::vector<std::string> warnings;
  bool degraded = false;
  bool timed_out = false;
  RunStatus status = RunStatus::Completed;
  bool committed = false;
};

struct AdaptRequest {
  DisruptionEvent event;
  AdaptationPreferences preferences;
  int now_minute = 0;
};

// Entry point for every tenant operation. Each tenant has a lease held by the
// one mutating operation in flight; readers work on immutable snapshots.
class SchedulingService {
 public:
  SchedulingService(const EngineConfig& cfg, std::shared_ptr<TravelTimeProvider> travel,
                    std::shared_ptr<WeatherProvider> weather = nullptr,
                    std::shared_ptr<NotificationDispatcher> notifier = nullptr,
                    std::shared_ptr<RunStore> runs = nullptr);

  // Throws ValidationError, or BusyError while the tenant lease is held.
  OptimizeResponse optimize(const std::string& tenant, const OptimizeRequest& req);

  // High-priority events cancel a running optimization and wait for its lease.
  // Throws NotFoundError without a committed schedule.
  AdaptationResult adapt(const std::string& tenant, const AdaptRequest& req);

  void update_location(const std::string& technician_id, const GeoPoint& point, int minute,
                       const std::string& status);

  AnalyticsReport get_analytics(const std::string& tenant, const AnalyticsPeriod& period,
                                const AnalyticsFilters& filters) const;

  // Requests cancellation of a running run; terminal runs are left as they are.
  void cancel_run(const std::string& run_id);

  // Completed and cancelled jobs leave their route (neighbours untouched) and are archived.
  void update_job_status(const std::string& tenant, const std::string& job_id, JobStatus status,
                         const std::optional<JobOutcome>& outcome = std::nullopt);

  void record_outcome(const std::string& tenant, const JobOutcome& outcome);

  std::shared_ptr<const Schedule> committed_schedule(const std::string& tenant) const;
  void restore_schedule(const std::string& tenant, const Schedule& schedule);

  RunStore& runs() { return *runs_; }
  const LocationStore& locations() const { return locations_; }
  TravelTimeService& travel() { return travel_; }
  const EngineConfig& config() const { return cfg_; }

 private:
  struct TenantState {
    std::timed_mutex lease;
    mutable std::mutex mu;  // guards the fields below
    std::shared_ptr<const Schedule> committed;
    std::shared_ptr<CancellationToken> active;
    std::string active_run;
  };

  TenantState& tenant_state(const std::string& tenant);
  const TenantState* find_tenant(const std::string& tenant) const;
  void commit(TenantState& ts, const Schedule& s);
  std::string next_run_id();
  std::map<std::string, double> tenant_on_time_rates(const std::string& tenant) const;

  EngineConfig cfg_;
  TravelTimeService travel_;
  std::shared_ptr<WeatherProvider> weather_;
  std::shared_ptr<NotificationDispatcher> notifier_;
  std::shared_ptr<RunStore> runs_;
  LocationStore locations_;

  mutable std::mutex tenants_mu_;
  std::map<std::string, std::unique_ptr<TenantState>> tenants_;

  std::mutex tokens_mu_;
  std::map<std::string, std::shared_ptr<CancellationToken>> running_;
  std::atomic<unsigned long long> run_seq_{0};
};

}  // namespace fsched
