// constraints.h
#pragma once
#include <string>
#include <vector>

#include "types.h"

namespace fsched {

// Every violated field of a constraint set, in field order. Empty when valid.
std::vector<std::string> constraint_violations(const ConstraintSet& c);

// Validates and fills every objective weight, normalized to sum to 1.0.
// Throws ValidationError listing all violations.
ConstraintSet normalize_constraints(const ConstraintSet& c);

std::vector<std::string> preference_violations(const AdaptationPreferences& p);
void validate_preferences(const AdaptationPreferences& p);

// Jobs, technicians and the planning horizon of an optimize request.
std::vector<std::string> request_violations(const std::vector<Job>& jobs,
                                            const std::vector<Technician>& technicians,
                                            const TimeWindow& horizon);

}  // namespace fsched
