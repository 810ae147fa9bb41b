// objectives.cpp
#include "objectives.h"

namespace fsched {

double default_weight(ObjectiveKind k) {
  switch (k) {
    case ObjectiveKind::MinimizeTravelTime: return DEFAULT_W_TRAVEL;
    case ObjectiveKind::MaximizeUtilization: return DEFAULT_W_UTILIZATION;
    case ObjectiveKind::BalanceWorkload: return DEFAULT_W_BALANCE;
    case ObjectiveKind::MinimizeCost: return DEFAULT_W_COST;
    case ObjectiveKind::MaximizeCustomerSatisfaction: return DEFAULT_W_SATISFACTION;
  }
  return 0.0;
}

ObjectiveWeights weights_of(const ConstraintSet& c) {
  ObjectiveWeights out;
  for (auto& o : c.objectives)
    out.w[static_cast<int>(o.kind)] = o.weight ? *o.weight : default_weight(o.kind);
  return out;
}

}  // namespace fsched
