// schedule.h
#pragma once
#include <map>
#include <string>
#include <vector>

#include "types.h"

namespace fsched {

// Committed schedule of one tenant. Replaced as a whole at commit time.
struct Schedule {
  std::string tenant_id;
  std::string run_id;  // run that produced the base of this schedule
  int version = 0;
  int planning_day = 0;
  TimeWindow horizon{0, MINUTES_PER_DAY};
  ConstraintSet constraints;  // normalized
  bool degraded = false;

  std::vector<Technician> technicians;          // sorted by id; route = job ids in order
  std::map<std::string, Job> jobs;              // every job known to the schedule
  std::map<std::string, Assignment> assignments;  // active assignments by job id
  std::map<std::string, GeoPoint> start_points;   // route origins used at commit
  std::vector<std::string> archived;              // completed or cancelled job ids

  const Technician* technician(const std::string& id) const;
  Technician* technician(const std::string& id);
  const Assignment* assignment(const std::string& job_id) const;
};

}  // namespace fsched
