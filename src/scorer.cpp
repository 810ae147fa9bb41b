#include "scorer.h"

#include <cmath>
#include <cstdlib>

#include "utils.h"

namespace fsched
{

    double score_confidence(const ConfidenceInputs &in)
    {
        const double slack = clampd((double)in.slack_minutes / SLACK_SATURATION_MINUTES, 0.0, 1.0);

        double certainty = 1.0;
        if (in.degraded_travel)
            certainty = 0.6;
        else if (in.stale_location)
            certainty = 0.8;

        double skill = std::isfinite(in.skill_strength) ? clampd(in.skill_strength, 0.0, 1.0) : 0.0;
        double on_time = in.on_time_rate ? *in.on_time_rate : DEFAULT_ON_TIME_RATE;
        on_time = std::isfinite(on_time) ? clampd(on_time, 0.0, 1.0) : DEFAULT_ON_TIME_RATE;

        const double c = W_CONF_SLACK * slack + W_CONF_TRAVEL * certainty + W_CONF_SKILL * skill +
                         W_CONF_ON_TIME * on_time;
        return clampd(c, 0.0, 1.0);
    }

    double score_impact(const ImpactInputs &in)
    {
        const int dt = std::abs(in.time_delta_minutes);
        double time_term;
        if (in.max_schedule_delay > 0)
            time_term = std::min(1.0, (double)dt / in.max_schedule_delay);
        else
            time_term = dt > 0 ? 1.0 : 0.0;

        double cost_term = 0.0;
        const double diff = std::fabs(in.cost_after - in.cost_before);
        if (diff > 0.0)
        {
            const double base = std::fabs(in.cost_before);
            cost_term = base > 1e-9 ? std::min(1.0, diff / base) : 1.0;
        }
        if (!std::isfinite(cost_term))
            cost_term = 1.0;

        const double v = W_IMPACT_TIME * time_term + W_IMPACT_REASSIGN * (in.reassigned ? 1.0 : 0.0) +
                         W_IMPACT_COST * cost_term;
        return clampd(v, 0.0, 1.0);
    }

} // namespace fsched
