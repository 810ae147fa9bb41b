// objectives.h
#pragma once
#include <array>

#include "types.h"

namespace fsched {

// Default weight per objective, before normalization.
constexpr double DEFAULT_W_TRAVEL = 0.4;
constexpr double DEFAULT_W_UTILIZATION = 0.3;
constexpr double DEFAULT_W_BALANCE = 0.1;
constexpr double DEFAULT_W_COST = 0.1;
constexpr double DEFAULT_W_SATISFACTION = 0.1;

// Fixed penalties outside the weighted objective list.
constexpr double W_SKILL_MISMATCH = 0.5;   // per job, scaled by the missing-skill fraction
constexpr double W_OVERTIME = 0.02;        // per overtime minute
constexpr double W_UNASSIGNED = 100.0;     // per unassigned job, times the priority level

// Normalized weights indexed by ObjectiveKind; objectives not listed weigh 0.
struct ObjectiveWeights {
  std::array<double, OBJECTIVE_KIND_COUNT> w{};
  double of(ObjectiveKind k) const { return w[static_cast<int>(k)]; }
};

double default_weight(ObjectiveKind k);

// Weights of an already normalized constraint set.
ObjectiveWeights weights_of(const ConstraintSet& c);

inline double unassigned_penalty(Priority p) { return W_UNASSIGNED * static_cast<int>(p); }

}  // namespace fsched
