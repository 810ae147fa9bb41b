#include "optimizer.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

#include "log.h"
#include "routing_seed.h"
#include "scorer.h"
#include "utils.h"

namespace fsched
{

    namespace
    {

        constexpr double EPS = 1e-9;
        constexpr double INF = std::numeric_limits<double>::infinity();

        std::vector<double> route_costs(const Problem &p, const Plan &plan, const RouteGuard &guard)
        {
            std::vector<double> c(p.T(), 0.0);
            for (int t = 0; t < p.T(); ++t)
                c[t] = eval_route(p, t, plan.routes[t], guard);
            return c;
        }

        bool limits_hit(const SearchLimits &l, SearchStats &st)
        {
            if (l.cancel && l.cancel->cancelled())
            {
                st.cancelled = true;
                return true;
            }
            if (l.deadline_ms > 0 && NowMillis() >= l.deadline_ms)
            {
                st.timed_out = true;
                return true;
            }
            return false;
        }

        bool has_room(const Problem &p, const Plan &plan, int t, int j)
        {
            return static_candidate(p, t, j) && (int)plan.routes[t].size() < p.cap[t];
        }

        bool try_insert_unassigned(const Problem &p, Plan &plan, std::vector<double> &costs, const RouteGuard &guard)
        {
            for (int j : insertion_order(p, plan.unassigned))
            {
                Insertion ins = best_insertion(p, plan, costs, j, guard);
                if (!ins.feasible || ins.delta >= unassigned_penalty(p.jobs[j].priority) - EPS)
                    continue;
                auto &r = plan.routes[ins.tech];
                r.insert(r.begin() + ins.pos, j);
                costs[ins.tech] = eval_route(p, ins.tech, r, guard);
                plan.unassigned.erase(std::find(plan.unassigned.begin(), plan.unassigned.end(), j));
                FSLOG("[ls] insert job=%s tech=%s\n", p.jobs[j].id.c_str(), p.techs[ins.tech].id.c_str());
                return true;
            }
            return false;
        }

        bool try_relocate(const Problem &p, Plan &plan, std::vector<double> &costs, const RouteGuard &guard,
                          const SearchLimits &limits, SearchStats &st)
        {
            const int T = p.T();
            for (int t1 = 0; t1 < T; ++t1)
            {
                if (limits_hit(limits, st))
                    return false;
                const std::vector<int> r1 = plan.routes[t1];
                for (int k = 0; k < (int)r1.size(); ++k)
                {
                    const int j = r1[k];
                    std::vector<int> reduced = r1;
                    reduced.erase(reduced.begin() + k);
                    const double c1 = eval_route(p, t1, reduced, guard);
                    if (!std::isfinite(c1))
                        continue;

                    // within the route
                    for (int pos = 0; pos <= (int)reduced.size(); ++pos)
                    {
                        if (pos == k)
                            continue;
                        std::vector<int> trial = reduced;
                        trial.insert(trial.begin() + pos, j);
                        const double c = eval_route(p, t1, trial, guard);
                        if (c < costs[t1] - EPS)
                        {
                            plan.routes[t1] = trial;
                            costs[t1] = c;
                            return true;
                        }
                    }

                    // to another route
                    for (int t2 = 0; t2 < T; ++t2)
                    {
                        if (t2 == t1 || !has_room(p, plan, t2, j) || !std::isfinite(costs[t2]))
                            continue;
                        const auto &r2 = plan.routes[t2];
                        for (int pos = 0; pos <= (int)r2.size(); ++pos)
                        {
                            std::vector<int> trial = r2;
                            trial.insert(trial.begin() + pos, j);
                            const double c2 = eval_route(p, t2, trial, guard);
                            if (!std::isfinite(c2))
                                continue;
                            if (c1 + c2 < costs[t1] + costs[t2] - EPS)
                            {
                                FSLOG("[ls] relocate job=%s %s -> %s\n", p.jobs[j].id.c_str(),
                                      p.techs[t1].id.c_str(), p.techs[t2].id.c_str());
                                plan.routes[t1] = reduced;
                                plan.routes[t2] = trial;
                                costs[t1] = c1;
                                costs[t2] = c2;
                                return true;
                            }
                        }
                    }
                }
            }
            return false;
        }

        bool try_swap(const Problem &p, Plan &plan, std::vector<double> &costs, const RouteGuard &guard,
                      const SearchLimits &limits, SearchStats &st)
        {
            const int T = p.T();
            for (int t1 = 0; t1 < T; ++t1)
            {
                if (limits_hit(limits, st))
                    return false;
                const std::vector<int> r1 = plan.routes[t1];

                // within the route
                for (int a = 0; a < (int)r1.size(); ++a)
                {
                    for (int b = a + 1; b < (int)r1.size(); ++b)
                    {
                        std::vector<int> trial = r1;
                        std::swap(trial[a], trial[b]);
                        const double c = eval_route(p, t1, trial, guard);
                        if (c < costs[t1] - EPS)
                        {
                            plan.routes[t1] = trial;
                            costs[t1] = c;
                            return true;
                        }
                    }
                }

                // across routes
                for (int t2 = t1 + 1; t2 < T; ++t2)
                {
                    const std::vector<int> &r2 = plan.routes[t2];
                    for (int a = 0; a < (int)r1.size(); ++a)
                    {
                        for (int b = 0; b < (int)r2.size(); ++b)
                        {
                            const int j1 = r1[a], j2 = r2[b];
                            if (!static_candidate(p, t2, j1) || !static_candidate(p, t1, j2))
                                continue;
                            std::vector<int> n1 = r1, n2 = r2;
                            n1[a] = j2;
                            n2[b] = j1;
                            const double c1 = eval_route(p, t1, n1, guard);
                            if (!std::isfinite(c1))
                                continue;
                            const double c2 = eval_route(p, t2, n2, guard);
                            if (!std::isfinite(c2))
                                continue;
                            if (c1 + c2 < costs[t1] + costs[t2] - EPS)
                            {
                                FSLOG("[ls] swap %s@%s <-> %s@%s\n", p.jobs[j1].id.c_str(), p.techs[t1].id.c_str(),
                                      p.jobs[j2].id.c_str(), p.techs[t2].id.c_str());
                                plan.routes[t1] = n1;
                                plan.routes[t2] = n2;
                                costs[t1] = c1;
                                costs[t2] = c2;
                                return true;
                            }
                        }
                    }
                }
            }
            return false;
        }

        // Keeps the longest feasible subsequence of each seeded route, in order.
        void repair_seed(const Problem &p, Plan &plan)
        {
            for (int t = 0; t < p.T(); ++t)
            {
                std::vector<int> kept;
                for (int j : plan.routes[t])
                {
                    std::vector<int> trial = kept;
                    trial.push_back(j);
                    if (static_candidate(p, t, j) && time_route(p, t, trial).feasible)
                        kept = std::move(trial);
                    else
                        plan.unassigned.push_back(j);
                }
                plan.routes[t] = std::move(kept);
            }
        }

        int plan_travel(const Problem &p, const Plan &plan)
        {
            int total = 0;
            for (int t = 0; t < p.T(); ++t)
            {
                RouteTiming rt = time_route(p, t, plan.routes[t]);
                total += rt.travel_total;
            }
            return total;
        }

        RunMetrics compute_metrics(const Problem &p, const Plan &plan, const std::vector<Assignment> &assignments,
                                   int baseline_travel)
        {
            RunMetrics m;
            m.total_jobs = p.J();
            m.scheduled_jobs = (int)assignments.size();
            m.success_rate = m.total_jobs > 0 ? (double)m.scheduled_jobs / m.total_jobs : 1.0;

            double conf = 0.0;
            for (const auto &a : assignments)
            {
                m.total_travel_minutes += a.travel_from_previous;
                conf += a.confidence;
            }
            if (m.scheduled_jobs > 0)
            {
                m.average_travel_minutes = (double)m.total_travel_minutes / m.scheduled_jobs;
                m.average_confidence = conf / m.scheduled_jobs;
            }

            for (int t = 0; t < p.T(); ++t)
            {
                RouteTiming rt = time_route(p, t, plan.routes[t]);
                m.busy_minutes += rt.service_total + rt.travel_total;
                m.available_minutes += p.shift[t].length();
                if (!plan.routes[t].empty())
                    ++m.technicians;
            }
            m.utilization = m.available_minutes > 0 ? (double)m.busy_minutes / m.available_minutes : 0.0;

            m.baseline_travel_minutes = baseline_travel;
            if (baseline_travel > 0)
                m.travel_savings_percent = 100.0 * (baseline_travel - m.total_travel_minutes) / baseline_travel;
            m.degraded = p.degraded;
            return m;
        }

    } // namespace

    double eval_route(const Problem &p, int t, const std::vector<int> &route, const RouteGuard &guard)
    {
        RouteTiming rt = time_route(p, t, route);
        if (!rt.feasible)
            return INF;
        if (guard && !guard(t, route, rt))
            return INF;
        return route_cost(p, t, route, rt);
    }

    std::vector<int> insertion_order(const Problem &p, std::vector<int> jobs)
    {
        std::sort(jobs.begin(), jobs.end(), [&p](int a, int b)
                  {
                      const Job &ja = p.jobs[a];
                      const Job &jb = p.jobs[b];
                      if (ja.priority != jb.priority)
                          return static_cast<int>(ja.priority) > static_cast<int>(jb.priority);
                      if (ja.window.start != jb.window.start)
                          return ja.window.start < jb.window.start;
                      return a < b; // jobs are sorted by id
                  });
        return jobs;
    }

    Insertion best_insertion(const Problem &p, const Plan &plan, const std::vector<double> &route_costs, int j,
                             const RouteGuard &guard, int only_tech)
    {
        Insertion best;
        for (int t = 0; t < p.T(); ++t)
        {
            if (only_tech >= 0 && t != only_tech)
                continue;
            if (!has_room(p, plan, t, j) || !std::isfinite(route_costs[t]))
                continue;
            const auto &r = plan.routes[t];
            for (int pos = 0; pos <= (int)r.size(); ++pos)
            {
                std::vector<int> trial = r;
                trial.insert(trial.begin() + pos, j);
                RouteTiming rt = time_route(p, t, trial);
                if (!rt.feasible)
                    continue;
                if (guard && !guard(t, trial, rt))
                    continue;
                const double delta = route_cost(p, t, trial, rt) - route_costs[t];
                const int start = rt.start[pos];
                // technicians are scanned in id order, so a tie keeps the lower id
                const bool better = !best.feasible || delta < best.delta - EPS ||
                                    (std::fabs(delta - best.delta) <= EPS && t == best.tech && start < best.start);
                if (better)
                {
                    best.feasible = true;
                    best.tech = t;
                    best.pos = pos;
                    best.start = start;
                    best.delta = delta;
                }
            }
        }
        return best;
    }

    void greedy_insert(const Problem &p, Plan &plan, const std::vector<int> &order, const RouteGuard &guard)
    {
        std::vector<double> costs = route_costs(p, plan, guard);
        for (int j : order)
        {
            auto it = std::find(plan.unassigned.begin(), plan.unassigned.end(), j);
            if (it != plan.unassigned.end())
                plan.unassigned.erase(it);

            Insertion ins = best_insertion(p, plan, costs, j, guard);
            if (!ins.feasible)
            {
                FSLOG("[greedy] job=%s has no feasible slot\n", p.jobs[j].id.c_str());
                plan.unassigned.push_back(j);
                continue;
            }
            auto &r = plan.routes[ins.tech];
            r.insert(r.begin() + ins.pos, j);
            costs[ins.tech] = eval_route(p, ins.tech, r, guard);
            FSLOG("[greedy] job=%s -> tech=%s pos=%d start=%s delta=%.4f\n", p.jobs[j].id.c_str(),
                  p.techs[ins.tech].id.c_str(), ins.pos, hhmm(ins.start).c_str(), ins.delta);
        }
        std::sort(plan.unassigned.begin(), plan.unassigned.end());
    }

    SearchStats local_search(const Problem &p, Plan &plan, const SearchLimits &limits, const RouteGuard &guard)
    {
        SearchStats st;
        std::vector<double> costs = route_costs(p, plan, guard);
        while (st.iterations < limits.max_iterations)
        {
            if (limits_hit(limits, st))
                break;
            const bool moved = try_insert_unassigned(p, plan, costs, guard) ||
                               try_relocate(p, plan, costs, guard, limits, st) ||
                               try_swap(p, plan, costs, guard, limits, st);
            if (!moved)
                break;
            ++st.iterations;
        }
        std::sort(plan.unassigned.begin(), plan.unassigned.end());
        FSLOG("[ls] iterations=%d timed_out=%d cancelled=%d\n", st.iterations, st.timed_out ? 1 : 0,
              st.cancelled ? 1 : 0);
        return st;
    }

    UnscheduledJob classify_unscheduled(const Problem &p, const Plan &plan, int j)
    {
        UnscheduledJob u;
        const Job &job = p.jobs[j];
        u.job_id = job.id;

        std::vector<int> cands;
        int skilled = 0;
        for (int t = 0; t < p.T(); ++t)
        {
            if (p.skill_ok[t][j])
                ++skilled;
            if (has_room(p, plan, t, j))
                cands.push_back(t);
        }
        if (cands.empty())
        {
            u.reason = UnscheduledReason::NoCandidate;
            u.detail = skilled == 0 ? "no technician has the required skills"
                                    : "no qualified technician has capacity and hours for the window";
            return u;
        }

        for (int t : cands)
        {
            const auto &r = plan.routes[t];
            for (int pos = 0; pos <= (int)r.size(); ++pos)
            {
                std::vector<int> trial = r;
                trial.insert(trial.begin() + pos, j);
                RouteTiming rt = time_route(p, t, trial);
                if (rt.failure == RouteFailure::Travel)
                {
                    u.reason = UnscheduledReason::TravelTimeExceeded;
                    u.detail = "every reachable slot needs a leg over " +
                               std::to_string(p.constraints.max_travel_time) + " min";
                    return u;
                }
            }
        }

        for (int t : cands)
        {
            if (time_route(p, t, {j}).feasible)
            {
                u.reason = UnscheduledReason::NoCandidate;
                u.detail = "every qualified technician is committed during the window";
                return u;
            }
        }

        u.reason = UnscheduledReason::NoSlot;
        u.detail = "no feasible slot within " + hhmm(job.window.start) + "-" + hhmm(job.window.end);
        return u;
    }

    std::vector<Assignment> build_assignments(const Problem &p, const Plan &plan, int alternatives)
    {
        std::vector<Assignment> out;
        const std::vector<double> costs = route_costs(p, plan, nullptr);

        for (int t = 0; t < p.T(); ++t)
        {
            const auto &r = plan.routes[t];
            const int n = (int)r.size();
            if (n == 0)
                continue;
            RouteTiming rt = time_route(p, t, r);
            if (!rt.feasible)
                throw std::runtime_error("infeasible route for technician " + p.techs[t].id + " (" +
                                         to_string(rt.failure) + ")");

            for (int k = 0; k < n; ++k)
            {
                const int j = r[k];
                const Job &job = p.jobs[j];
                Assignment a;
                a.job_id = job.id;
                a.technician_id = p.techs[t].id;
                a.scheduled_start = rt.start[k];
                a.scheduled_end = rt.end[k];
                a.travel_from_previous = rt.travel_in[k];
                a.travel_to_next = k + 1 < n ? rt.travel_in[k + 1] : 0;

                const int slack = k + 1 < n ? rt.start[k + 1] - (rt.end[k] + rt.travel_in[k + 1])
                                            : std::min(job.window.end, p.shift[t].end) - rt.end[k];
                ConfidenceInputs ci;
                ci.slack_minutes = slack;
                ci.degraded_travel = p.degraded;
                ci.stale_location = p.stale[t] != 0;
                ci.skill_strength = p.skill_strength[t][j];
                ci.on_time_rate = p.on_time[t];
                a.confidence = score_confidence(ci);

                if (alternatives > 0)
                {
                    std::vector<int> reduced = r;
                    reduced.erase(reduced.begin() + k);
                    RouteTiming rr = time_route(p, t, reduced);
                    const bool usable = rr.feasible || rr.failure == RouteFailure::Travel;
                    const double marginal = usable ? costs[t] - route_cost(p, t, reduced, rr) : 0.0;

                    std::vector<AlternativeCandidate> alts;
                    for (int t2 = 0; t2 < p.T(); ++t2)
                    {
                        if (t2 == t)
                            continue;
                        Insertion ins = best_insertion(p, plan, costs, j, nullptr, t2);
                        if (ins.feasible)
                            alts.push_back({p.techs[t2].id, ins.delta - marginal});
                    }
                    std::sort(alts.begin(), alts.end(), [](const AlternativeCandidate &x, const AlternativeCandidate &y)
                              {
                                  if (x.cost_delta != y.cost_delta)
                                      return x.cost_delta < y.cost_delta;
                                  return x.technician_id < y.technician_id;
                              });
                    if ((int)alts.size() > alternatives)
                        alts.resize(alternatives);
                    a.alternatives = std::move(alts);
                }
                out.push_back(std::move(a));
            }
        }
        return out;
    }

    OptimizeResult optimize(const Problem &p, const OptimizeOptions &opts)
    {
        OptimizeResult res;
        const long long t0 = NowMillis();
        const long long deadline = t0 + opts.time_budget_ms;

        Plan plan;
        plan.routes.assign(p.T(), {});

        if (opts.construction == "routing_model")
        {
            const int limit_ms = std::max(1000, opts.time_budget_ms / 3);
            std::optional<Plan> seeded = routing_seed(p, limit_ms);
            if (seeded)
            {
                plan = std::move(*seeded);
                repair_seed(p, plan);
            }
            else
            {
                FSWARN("[optimize] routing model found no solution; greedy construction\n");
            }
        }

        std::vector<char> placed(p.J(), 0);
        for (const auto &r : plan.routes)
            for (int j : r)
                placed[j] = 1;
        std::vector<int> pending;
        for (int j = 0; j < p.J(); ++j)
            if (!placed[j])
                pending.push_back(j);
        plan.unassigned.clear();
        greedy_insert(p, plan, insertion_order(p, pending));

        const int constructed_travel = plan_travel(p, plan);

        SearchLimits lim;
        lim.max_iterations = opts.max_iterations;
        lim.deadline_ms = deadline;
        lim.cancel = opts.cancel;
        SearchStats st = local_search(p, plan, lim);

        res.timed_out = st.timed_out;
        res.cancelled = st.cancelled;
        res.degraded = p.degraded;
        res.assignments = build_assignments(p, plan, opts.alternatives);
        for (int j : plan.unassigned)
        {
            UnscheduledJob u = classify_unscheduled(p, plan, j);
            res.warnings.push_back("job " + u.job_id + " unscheduled: " + to_string(u.reason) + " (" + u.detail + ")");
            res.unscheduled.push_back(std::move(u));
        }
        if (p.degraded)
            res.warnings.push_back("travel times estimated from distance (provider degraded)");

        res.metrics = compute_metrics(p, plan, res.assignments,
                                      opts.baseline_travel_minutes ? *opts.baseline_travel_minutes : constructed_travel);
        res.metrics.iterations = st.iterations;
        res.metrics.elapsed_ms = NowMillis() - t0;
        res.metrics.timed_out = st.timed_out;
        res.plan = std::move(plan);

        FSLOG("[optimize] scheduled=%d/%d travel=%d baseline=%d iters=%d elapsed=%lldms\n",
              res.metrics.scheduled_jobs, res.metrics.total_jobs, res.metrics.total_travel_minutes,
              res.metrics.baseline_travel_minutes, res.metrics.iterations, res.metrics.elapsed_ms);
        return res;
    }

} // namespace fsched
