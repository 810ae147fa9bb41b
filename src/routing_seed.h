// routing_seed.h
#pragma once
#include <optional>

#include "optimizer.h"
#include "problem.h"

namespace fsched {

// Initial routes from an OR-Tools RoutingModel: time windows, skills as allowed
// vehicles, per-technician job caps, priority-weighted optional visits.
// Returns nullopt when the solver finds nothing within the time limit.
std::optional<Plan> routing_seed(const Problem& p, int time_limit_ms, bool log_search = false);

}  // namespace fsched
