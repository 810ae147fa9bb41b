// json_io.h
#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "analytics.h"
#include "disruption.h"
#include "schedule.h"
#include "scheduler.h"
#include "types.h"

namespace fsched {

using json = nlohmann::json;

// Enum names are the to_string() spellings. Unknown names throw ValidationError.
JobStatus parse_job_status(const std::string& s);
Priority parse_priority(const json& j);  // name or 1..5
ObjectiveKind parse_objective_kind(const std::string& s);
UnscheduledReason parse_unscheduled_reason(const std::string& s);
DisruptionType parse_disruption_type(const std::string& s);
Severity parse_severity(const std::string& s);
RunStatus parse_run_status(const std::string& s);

// nlohmann ADL hooks. Optional fields fall back to the struct defaults.
void to_json(json& j, const GeoPoint& g);
void from_json(const json& j, GeoPoint& g);
void to_json(json& j, const TimeWindow& w);
void from_json(const json& j, TimeWindow& w);
void to_json(json& j, const LocationFix& f);
void from_json(const json& j, LocationFix& f);
void to_json(json& j, const Job& x);
void from_json(const json& j, Job& x);
void to_json(json& j, const Technician& t);
void from_json(const json& j, Technician& t);
void to_json(json& j, const AlternativeCandidate& a);
void from_json(const json& j, AlternativeCandidate& a);
void to_json(json& j, const Assignment& a);
void from_json(const json& j, Assignment& a);
void to_json(json& j, const Objective& o);
void from_json(const json& j, Objective& o);
void to_json(json& j, const ConstraintSet& c);
void from_json(const json& j, ConstraintSet& c);
void to_json(json& j, const UnscheduledJob& u);
void from_json(const json& j, UnscheduledJob& u);
void to_json(json& j, const DisruptionEvent& e);
void from_json(const json& j, DisruptionEvent& e);
void to_json(json& j, const AdaptationPreferences& p);
void from_json(const json& j, AdaptationPreferences& p);
void to_json(json& j, const ScheduleSlot& s);
void to_json(json& j, const AdaptedJob& a);
void to_json(json& j, const ImpactSummary& s);
void to_json(json& j, const RunMetrics& m);
void from_json(const json& j, RunMetrics& m);
void to_json(json& j, const OptimizationRun& r);
void from_json(const json& j, OptimizationRun& r);
void to_json(json& j, const JobOutcome& o);
void from_json(const json& j, JobOutcome& o);
void to_json(json& j, const Schedule& s);
void from_json(const json& j, Schedule& s);
void to_json(json& j, const AdaptationResult& r);
void to_json(json& j, const AnalyticsReport& r);
void from_json(const json& j, AnalyticsPeriod& p);
void from_json(const json& j, AnalyticsFilters& f);
void from_json(const json& j, OptimizeRequest& r);
void to_json(json& j, const OptimizeResponse& r);
void from_json(const json& j, AdaptRequest& r);

json load_json(const std::string& path);
void save_json(const std::string& path, const json& j);

}  // namespace fsched
