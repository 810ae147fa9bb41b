// types.h
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fsched {

// All times are minutes on the planning clock (0 = start of the planning day).
constexpr int MINUTES_PER_DAY = 24 * 60;

struct GeoPoint {
  double lat = 0.0;
  double lng = 0.0;
  bool operator==(const GeoPoint& o) const { return lat == o.lat && lng == o.lng; }
};

struct TimeWindow {
  int start = 0;
  int end = 0;
  int length() const { return end - start; }
  bool operator==(const TimeWindow& o) const { return start == o.start && end == o.end; }
};

enum class JobStatus { Unscheduled, Scheduled, AtRisk, Completed, Cancelled };

enum class Priority { Low = 1, Medium = 2, High = 3, Urgent = 4, Emergency = 5 };

struct Job {
  std::string id;
  std::vector<std::string> required_skills;
  Priority priority = Priority::Medium;
  GeoPoint location;
  int duration_minutes = 60;
  TimeWindow window{0, MINUTES_PER_DAY};  // start >= window.start, end <= window.end
  std::string category;                   // empty -> first required skill or "general"
  JobStatus status = JobStatus::Unscheduled;
};

struct LocationFix {
  GeoPoint point;
  int minute = 0;
};

struct Technician {
  std::string id;
  std::vector<std::string> skills;
  std::map<std::string, double> proficiency;  // skill -> [0,1]; missing = 1.0
  GeoPoint home;
  std::optional<LocationFix> last_known;
  TimeWindow working_hours{8 * 60, 17 * 60};
  int max_jobs_per_day = 8;
  double cost_per_hour = 50.0;
  std::vector<std::string> route;  // job ids of the active day, in visiting order
};

struct AlternativeCandidate {
  std::string technician_id;
  double cost_delta = 0.0;  // marginal cost vs the chosen technician (>= 0 means worse)
  bool operator==(const AlternativeCandidate& o) const {
    return technician_id == o.technician_id && cost_delta == o.cost_delta;
  }
};

struct Assignment {
  std::string job_id;
  std::string technician_id;
  int scheduled_start = 0;
  int scheduled_end = 0;
  int travel_from_previous = 0;  // minutes to reach this job
  int travel_to_next = 0;        // 0 for the last stop
  double confidence = 0.0;
  std::vector<AlternativeCandidate> alternatives;

  bool operator==(const Assignment& o) const {
    return job_id == o.job_id && technician_id == o.technician_id &&
           scheduled_start == o.scheduled_start && scheduled_end == o.scheduled_end &&
           travel_from_previous == o.travel_from_previous && travel_to_next == o.travel_to_next &&
           confidence == o.confidence && alternatives == o.alternatives;
  }
  bool operator!=(const Assignment& o) const { return !(*this == o); }
};

enum class ObjectiveKind {
  MinimizeTravelTime,
  MaximizeUtilization,
  BalanceWorkload,
  MinimizeCost,
  MaximizeCustomerSatisfaction
};
constexpr int OBJECTIVE_KIND_COUNT = 5;

struct Objective {
  ObjectiveKind kind = ObjectiveKind::MinimizeTravelTime;
  std::optional<double> weight;  // normalized by the constraint model
};

struct ConstraintSet {
  int max_travel_time = 120;  // minutes, per leg
  TimeWindow working_hours{8 * 60, 17 * 60};
  int max_jobs_per_technician = 8;
  bool skill_match_required = true;
  bool overtime_allowed = false;
  int max_overtime_minutes = 120;
  std::vector<Objective> objectives{{ObjectiveKind::MinimizeTravelTime, std::nullopt},
                                    {ObjectiveKind::MaximizeUtilization, std::nullopt}};
};

enum class UnscheduledReason { NoCandidate, NoSlot, TravelTimeExceeded };

struct UnscheduledJob {
  std::string job_id;
  UnscheduledReason reason = UnscheduledReason::NoCandidate;
  std::string detail;
};

enum class DisruptionType {
  TrafficDelay,
  Weather,
  EmergencyInsertion,
  ResourceUnavailable,
  CustomerReschedule,
  EquipmentFailure
};

enum class Severity { Low, Medium, High, Critical };

struct DisruptionEvent {
  DisruptionType type = DisruptionType::TrafficDelay;
  std::vector<std::string> affected_job_ids;
  std::vector<std::string> affected_technician_ids;
  Severity severity = Severity::Medium;
  std::optional<int> expected_duration_minutes;
  std::optional<GeoPoint> location;
  std::optional<Job> emergency_job;      // EmergencyInsertion
  std::optional<TimeWindow> new_window;  // CustomerReschedule
  std::string description;
};

struct AdaptationPreferences {
  bool allow_overtime = false;
  int max_schedule_delay = 60;
  int max_reassignments = 5;
  bool prefer_same_technician = true;
  bool notify_customers = true;
  bool notify_technicians = true;
};

struct ScheduleSlot {
  std::string technician_id;
  int start = 0;
  int end = 0;
};

struct AdaptedJob {
  std::string job_id;
  std::optional<ScheduleSlot> original;  // empty for inserted jobs
  std::optional<ScheduleSlot> updated;   // empty when the job was dropped
  std::string reason;
  double impact_score = 0.0;
};

struct ImpactSummary {
  int jobs_rescheduled = 0;
  int technicians_affected = 0;
  int total_delay_minutes = 0;
  int reassignment_count = 0;
  int notifications_sent = 0;
  double adaptation_success_rate = 0.0;
  double overall_impact = 0.0;
};

enum class RunStatus { Queued, Running, Completed, Failed, Cancelled };

struct RunMetrics {
  int total_jobs = 0;
  int scheduled_jobs = 0;
  double success_rate = 0.0;
  int total_travel_minutes = 0;
  double average_travel_minutes = 0.0;
  double average_confidence = 0.0;
  int busy_minutes = 0;       // service + travel over all routes
  int available_minutes = 0;  // shift minutes of technicians considered
  double utilization = 0.0;
  int baseline_travel_minutes = 0;
  double travel_savings_percent = 0.0;
  int technicians = 0;
  int iterations = 0;
  long long elapsed_ms = 0;
  bool degraded = false;
  bool timed_out = false;
};

struct OptimizationRun {
  std::string id;
  std::string tenant_id;
  long long created_ms = 0;  // wall clock, epoch milliseconds
  int planning_day = 0;
  std::string input_hash;
  std::vector<Assignment> assignments;
  RunMetrics metrics;
  std::map<std::string, int> demand_by_category;
  std::string algorithm_version;
  RunStatus status = RunStatus::Queued;
  std::string failure_reason;
};

struct JobOutcome {
  std::string job_id;
  std::string technician_id;
  int planning_day = 0;
  int scheduled_start = 0;
  int actual_start = 0;
  int actual_end = 0;
  bool completed = true;
};

// Read-only view of a matrix in minutes. Access with at(src, dst).
struct TimeMatrix {
  int n = 0;
  std::vector<int> m;
  inline int at(int i, int j) const { return m[i * n + j]; }
};

const char* to_string(JobStatus s);
const char* to_string(Priority p);
const char* to_string(ObjectiveKind k);
const char* to_string(UnscheduledReason r);
const char* to_string(DisruptionType t);
const char* to_string(Severity s);
const char* to_string(RunStatus s);

}  // namespace fsched
