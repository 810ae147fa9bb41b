// optimizer.h
#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.h"
#include "problem.h"
#include "route_eval.h"
#include "types.h"

namespace fsched {

// Job indices per technician route, plus jobs left out.
struct Plan {
  std::vector<std::vector<int>> routes;
  std::vector<int> unassigned;
};

// Extra acceptance test on a candidate route (disruption scope, pinned jobs).
// Empty guard accepts everything.
using RouteGuard = std::function<bool(int t, const std::vector<int>& route, const RouteTiming& timing)>;

struct Insertion {
  bool feasible = false;
  int tech = -1;
  int pos = -1;
  int start = 0;
  double delta = 0.0;  // route cost after minus before
};

struct SearchLimits {
  int max_iterations = 1000;
  long long deadline_ms = 0;  // NowMillis() value; 0 = none
  const CancellationToken* cancel = nullptr;
};

struct SearchStats {
  int iterations = 0;
  bool timed_out = false;
  bool cancelled = false;
};

struct OptimizeOptions {
  int time_budget_ms = 30000;
  int max_iterations = 1000;
  int alternatives = 3;
  std::string construction = "greedy";  // greedy | routing_model
  std::optional<int> baseline_travel_minutes;
  const CancellationToken* cancel = nullptr;
};

struct OptimizeResult {
  Plan plan;
  std::vector<Assignment> assignments;  // technician order, then route order
  std::vector<UnscheduledJob> unscheduled;
  std::vector<std::string> warnings;
  RunMetrics metrics;
  bool timed_out = false;
  bool cancelled = false;
  bool degraded = false;
};

// Cost of one route, +inf when infeasible or refused by the guard.
double eval_route(const Problem& p, int t, const std::vector<int>& route, const RouteGuard& guard = nullptr);

// Priority desc, then earliest window start, then lowest job id.
std::vector<int> insertion_order(const Problem& p, std::vector<int> jobs);

// Cheapest feasible position for job j. Ties: lowest technician id, then earliest start.
// only_tech >= 0 restricts the search to one technician.
Insertion best_insertion(const Problem& p, const Plan& plan, const std::vector<double>& route_costs, int j,
                         const RouteGuard& guard = nullptr, int only_tech = -1);

// Inserts jobs in the given order; jobs without a feasible slot go to plan.unassigned.
void greedy_insert(const Problem& p, Plan& plan, const std::vector<int>& order, const RouteGuard& guard = nullptr);

// First-improvement local search: insert-unassigned, relocate, swap.
SearchStats local_search(const Problem& p, Plan& plan, const SearchLimits& limits,
                         const RouteGuard& guard = nullptr);

UnscheduledJob classify_unscheduled(const Problem& p, const Plan& plan, int j);

// Timed, scored assignments of a plan, with up to `alternatives` ranked alternatives each.
std::vector<Assignment> build_assignments(const Problem& p, const Plan& plan, int alternatives);

OptimizeResult optimize(const Problem& p, const OptimizeOptions& opts);

}  // namespace fsched
