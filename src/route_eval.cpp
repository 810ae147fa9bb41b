#include "route_eval.h"

#include <algorithm>

#include "utils.h"

namespace fsched
{

    RouteTiming time_route(const Problem &p, int t, const std::vector<int> &route)
    {
        RouteTiming rt;
        const int n = (int)route.size();
        rt.start.resize(n);
        rt.end.resize(n);
        rt.travel_in.resize(n);

        auto fail = [&rt](RouteFailure f, int pos)
        {
            rt.feasible = false;
            rt.failure = f;
            rt.fail_pos = pos;
            return rt;
        };

        if (n > p.cap[t])
            return fail(RouteFailure::Capacity, p.cap[t]);

        const TimeWindow &shift = p.shift[t];
        const int limit = shift.end + p.overtime_cap[t];
        int travel_pos = -1;
        int cur = shift.start;
        int at = p.tech_node(t);

        for (int k = 0; k < n; ++k)
        {
            const int j = route[k];
            const Job &job = p.jobs[j];
            if (!p.skill_ok[t][j])
                return fail(RouteFailure::Skill, k);

            const int tr = p.leg(at, p.job_node(j));
            if (tr > p.constraints.max_travel_time && travel_pos < 0)
                travel_pos = k;

            int s = std::max(cur + tr + p.delay_before[j], p.min_start[j]);
            if (p.blocked[t])
            {
                const TimeWindow &b = *p.blocked[t];
                if (s < b.end && s + job.duration_minutes > b.start)
                    s = b.end;
            }
            const int e = s + job.duration_minutes;
            if (e > job.window.end)
                return fail(RouteFailure::Window, k);
            if (e > limit)
                return fail(RouteFailure::Shift, k);

            rt.start[k] = s;
            rt.end[k] = e;
            rt.travel_in[k] = tr;
            rt.travel_total += tr;
            rt.service_total += job.duration_minutes;
            rt.overtime = std::max(rt.overtime, e - shift.end);
            cur = e;
            at = p.job_node(j);
        }

        if (travel_pos >= 0)
        {
            rt.feasible = false;
            rt.failure = RouteFailure::Travel;
            rt.fail_pos = travel_pos;
        }
        return rt;
    }

    CostTerms route_terms(const Problem &p, int t, const std::vector<int> &route, const RouteTiming &rt)
    {
        CostTerms c;
        const int n = (int)route.size();
        const double max_leg = (double)p.constraints.max_travel_time;
        for (int k = 0; k < n; ++k)
        {
            const Job &job = p.jobs[route[k]];
            c.travel += rt.travel_in[k] / max_leg;
            const int slack = std::max(1, job.window.end - job.duration_minutes - job.window.start);
            c.satisfaction += clampd((double)(rt.start[k] - job.window.start) / slack, 0.0, 1.0);
            c.skill_mismatch += W_SKILL_MISMATCH * p.skill_missing[t][route[k]];
        }

        const int busy = rt.service_total + rt.travel_total;
        const int avail = std::max(1, p.shift[t].length());
        c.utilization = 1.0 - clampd((double)busy / avail, 0.0, 1.0);
        if (p.cap[t] > 0)
        {
            const double load = (double)n / p.cap[t];
            c.balance = load * load;
        }
        c.money = busy / 60.0 * p.techs[t].cost_per_hour / 100.0;
        c.overtime = W_OVERTIME * rt.overtime;
        return c;
    }

    double route_cost(const Problem &p, int t, const std::vector<int> &route, const RouteTiming &rt)
    {
        const CostTerms c = route_terms(p, t, route, rt);
        const ObjectiveWeights &w = p.weights;
        return w.of(ObjectiveKind::MinimizeTravelTime) * c.travel +
               w.of(ObjectiveKind::MaximizeUtilization) * c.utilization +
               w.of(ObjectiveKind::BalanceWorkload) * c.balance +
               w.of(ObjectiveKind::MinimizeCost) * c.money +
               w.of(ObjectiveKind::MaximizeCustomerSatisfaction) * c.satisfaction +
               c.skill_mismatch + c.overtime;
    }

    const char *to_string(RouteFailure f)
    {
        switch (f)
        {
        case RouteFailure::None: return "none";
        case RouteFailure::Skill: return "skill";
        case RouteFailure::Capacity: return "capacity";
        case RouteFailure::Window: return "window";
        case RouteFailure::Shift: return "shift";
        case RouteFailure::Travel: return "travel";
        }
        return "none";
    }

} // namespace fsched
