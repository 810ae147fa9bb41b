// route_eval.h
#pragma once
#include <vector>

#include "problem.h"

namespace fsched {

enum class RouteFailure { None, Skill, Capacity, Window, Shift, Travel };

// Earliest-start timing of one technician route (job indices, visiting order).
struct RouteTiming {
  bool feasible = true;
  RouteFailure failure = RouteFailure::None;
  int fail_pos = -1;
  std::vector<int> start;
  std::vector<int> end;
  std::vector<int> travel_in;  // leg ending at each job
  int travel_total = 0;
  int service_total = 0;
  int overtime = 0;
};

// Start = max(arrival + delay_before, min_start), pushed past a blocked interval.
// A leg over max_travel_time is reported as Travel only when nothing else fails.
RouteTiming time_route(const Problem& p, int t, const std::vector<int>& route);

// Weighted objective terms of a feasible route.
double route_cost(const Problem& p, int t, const std::vector<int>& route, const RouteTiming& timing);

struct CostTerms {
  double travel = 0.0;
  double utilization = 0.0;
  double balance = 0.0;
  double money = 0.0;
  double satisfaction = 0.0;
  double skill_mismatch = 0.0;
  double overtime = 0.0;
};

CostTerms route_terms(const Problem& p, int t, const std::vector<int>& route, const RouteTiming& timing);

const char* to_string(RouteFailure f);

}  // namespace fsched
