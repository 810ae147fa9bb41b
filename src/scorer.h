// scorer.h
#pragma once
#include <optional>

namespace fsched {

constexpr double AT_RISK_THRESHOLD = 0.3;  // confidence below this marks a job AtRisk

constexpr double W_CONF_SLACK = 0.35;
constexpr double W_CONF_TRAVEL = 0.20;
constexpr double W_CONF_SKILL = 0.25;
constexpr double W_CONF_ON_TIME = 0.20;
constexpr int SLACK_SATURATION_MINUTES = 60;
constexpr double DEFAULT_ON_TIME_RATE = 0.9;  // technician without history

constexpr double W_IMPACT_TIME = 0.5;
constexpr double W_IMPACT_REASSIGN = 0.3;
constexpr double W_IMPACT_COST = 0.2;

struct ConfidenceInputs {
  int slack_minutes = 0;  // free time before the next commitment
  bool degraded_travel = false;
  bool stale_location = false;
  double skill_strength = 1.0;  // [0,1]
  std::optional<double> on_time_rate;
};

// Always in [0,1].
double score_confidence(const ConfidenceInputs& in);

struct ImpactInputs {
  int time_delta_minutes = 0;  // new start minus old start
  bool reassigned = false;
  double cost_before = 0.0;
  double cost_after = 0.0;
  int max_schedule_delay = 60;
};

// Always in [0,1], so never negative.
double score_impact(const ImpactInputs& in);

}  // namespace fsched
