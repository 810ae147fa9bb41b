// problem.h
#pragma once
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "objectives.h"
#include "travel_time.h"
#include "types.h"

namespace fsched {

// Immutable-per-run snapshot. Technicians and jobs are sorted by id and
// referenced by index; travel nodes are [technician starts..., jobs...].
struct Problem {
  ConstraintSet constraints;  // normalized
  ObjectiveWeights weights;

  std::vector<Technician> techs;
  std::vector<Job> jobs;  // windows clipped to the horizon

  std::vector<TimeWindow> shift;  // technician hours within constraint hours and horizon
  std::vector<int> cap;           // min(own cap, constraint cap)
  std::vector<int> overtime_cap;  // minutes allowed past shift end
  std::vector<double> on_time;    // historical on-time rate
  std::vector<char> stale;        // a location fix existed but was too old
  std::vector<std::optional<TimeWindow>> blocked;  // technician unavailable

  std::vector<int> min_start;     // per job lower bound on start
  std::vector<int> delay_before;  // per job extra minutes between arrival and start

  std::vector<std::vector<char>> skill_ok;          // [t][j]; hard filter
  std::vector<std::vector<double>> skill_missing;   // [t][j]; fraction of skills missing
  std::vector<std::vector<double>> skill_strength;  // [t][j]; [0,1]

  std::vector<GeoPoint> start_points;
  TimeMatrix travel;
  bool degraded = false;

  std::unordered_map<std::string, int> job_index;
  std::unordered_map<std::string, int> tech_index;

  int T() const { return static_cast<int>(techs.size()); }
  int J() const { return static_cast<int>(jobs.size()); }
  int tech_node(int t) const { return t; }
  int job_node(int j) const { return T() + j; }
  int leg(int from_node, int to_node) const { return travel.at(from_node, to_node); }
};

struct ProblemInput {
  std::vector<Job> jobs;
  std::vector<Technician> technicians;
  ConstraintSet constraints;  // normalized
  TimeWindow horizon{0, MINUTES_PER_DAY};
  int now_minute = 0;
  int staleness_minutes = 5;
  std::map<std::string, GeoPoint> start_points;  // fixed starts of a committed schedule
  std::map<std::string, LocationFix> locations;  // latest fixes from the location store
  std::map<std::string, double> on_time_rates;
};

Problem build_problem(const ProblemInput& in, TravelTimeService& travel);

// Start location of a technician: a fresh fix, else home. Sets stale when a fix was discarded.
GeoPoint resolve_start(const Technician& t, const std::optional<LocationFix>& store_fix,
                       int now_minute, int staleness_minutes, bool& stale);

// Skill, capacity and working-hours filters, independent of the current routes.
bool static_candidate(const Problem& p, int t, int j);

// Demand bucket of a job: explicit category, else first required skill, else "general".
std::string job_category(const Job& j);

}  // namespace fsched
