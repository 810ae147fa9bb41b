#include "disruption.h"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "constraints.h"
#include "errors.h"
#include "log.h"
#include "optimizer.h"
#include "problem.h"
#include "scorer.h"
#include "utils.h"

namespace fsched
{

    namespace
    {

        // Committed slot of a job at scoping time; tech < 0 for jobs not yet placed.
        struct Committed
        {
            int tech = -1;
            int start = 0;
            int end = 0;
            int travel_in = 0;
            int travel_next = 0;
        };

        std::string slot_text(const ScheduleSlot &s)
        {
            return s.technician_id + " " + hhmm(s.start) + "-" + hhmm(s.end);
        }

    } // namespace

    int severity_delay_minutes(Severity s)
    {
        switch (s)
        {
        case Severity::Low: return 15;
        case Severity::Medium: return 30;
        case Severity::High: return 60;
        case Severity::Critical: return 120;
        }
        return 30;
    }

    bool is_high_priority(const DisruptionEvent &ev)
    {
        return ev.type == DisruptionType::EmergencyInsertion || ev.severity == Severity::High ||
               ev.severity == Severity::Critical;
    }

    std::vector<std::string> event_violations(const Schedule &s, const DisruptionEvent &ev)
    {
        std::vector<std::string> bad;
        const std::set<std::string> archived(s.archived.begin(), s.archived.end());

        for (const auto &id : ev.affected_job_ids)
        {
            if (!s.jobs.count(id))
                bad.push_back("affected job " + id + ": unknown");
            else if (archived.count(id))
                bad.push_back("affected job " + id + ": already completed or cancelled");
        }
        for (const auto &id : ev.affected_technician_ids)
            if (!s.technician(id))
                bad.push_back("affected technician " + id + ": unknown");
        if (ev.expected_duration_minutes && *ev.expected_duration_minutes < 0)
            bad.push_back("expected_duration must be >= 0");

        switch (ev.type)
        {
        case DisruptionType::TrafficDelay:
        case DisruptionType::Weather:
            if (ev.affected_job_ids.empty() && ev.affected_technician_ids.empty())
                bad.push_back(std::string(to_string(ev.type)) + ": needs affected jobs or technicians");
            break;
        case DisruptionType::EmergencyInsertion:
            if (!ev.emergency_job)
            {
                bad.push_back("emergency_insertion: emergency_job is required");
            }
            else
            {
                const Job &j = *ev.emergency_job;
                if (j.id.empty())
                    bad.push_back("emergency_job: empty id");
                else if (s.jobs.count(j.id))
                    bad.push_back("emergency_job " + j.id + ": id already in the schedule");
                if (j.duration_minutes <= 0)
                    bad.push_back("emergency_job: duration must be > 0");
                if (j.window.end < j.window.start)
                    bad.push_back("emergency_job: window end before start");
            }
            break;
        case DisruptionType::ResourceUnavailable:
        case DisruptionType::EquipmentFailure:
            if (ev.affected_technician_ids.empty())
                bad.push_back(std::string(to_string(ev.type)) + ": needs affected technicians");
            break;
        case DisruptionType::CustomerReschedule:
            if (ev.affected_job_ids.empty())
                bad.push_back("customer_reschedule: needs affected jobs");
            if (!ev.new_window)
                bad.push_back("customer_reschedule: new_window is required");
            else if (ev.new_window->end <= ev.new_window->start)
                bad.push_back("customer_reschedule: new_window end must be after start");
            break;
        }
        return bad;
    }

    int DisruptionHandler::event_delay(const Schedule &s, const DisruptionEvent &ev, int weather_timeout_ms,
                                       std::vector<std::string> &actions)
    {
        if (ev.expected_duration_minutes)
            return *ev.expected_duration_minutes;
        if (ev.type == DisruptionType::Weather && weather_)
        {
            GeoPoint where;
            if (ev.location)
                where = *ev.location;
            else if (!ev.affected_job_ids.empty())
                where = s.jobs.at(ev.affected_job_ids.front()).location;
            else if (s.start_points.count(ev.affected_technician_ids.front()))
                where = s.start_points.at(ev.affected_technician_ids.front());
            WeatherAssessment wa = assess_weather(fetch_weather(weather_, where, weather_timeout_ms));
            actions = weather_recommendations(wa);
            FSLOG("[adapt] weather impact=%s adjustment=%d feasibility=%.2f\n", to_string(wa.impact),
                  wa.adjustment_minutes, wa.feasibility);
            if (wa.adjustment_minutes > 0)
                return wa.adjustment_minutes;
        }
        return severity_delay_minutes(ev.severity);
    }

    AdaptationResult DisruptionHandler::adapt(const Schedule &sched, const DisruptionEvent &ev,
                                              const AdaptationPreferences &prefs, const AdaptContext &ctx,
                                              const CommitFn &commit)
    {
        AdaptationResult res;
        res.trace.push_back(AdaptationState::Received);

        // ---- Received ----
        std::vector<std::string> bad = preference_violations(prefs);
        std::vector<std::string> ev_bad = event_violations(sched, ev);
        bad.insert(bad.end(), ev_bad.begin(), ev_bad.end());
        if (!bad.empty())
            throw ValidationError(bad);

        const int now = ctx.now_minute;
        FSLOG("[adapt] %s severity=%s jobs=%zu techs=%zu now=%s\n", to_string(ev.type), to_string(ev.severity),
              ev.affected_job_ids.size(), ev.affected_technician_ids.size(), hhmm(now).c_str());

        ProblemInput in;
        in.constraints = sched.constraints;
        if (prefs.allow_overtime)
            in.constraints.overtime_allowed = true;
        in.horizon = sched.horizon;
        in.now_minute = now;
        in.start_points = sched.start_points;
        in.on_time_rates = ctx.on_time_rates;
        in.technicians = sched.technicians;
        std::set<std::string> added;
        for (const auto &kv : sched.assignments)
        {
            auto it = sched.jobs.find(kv.first);
            if (it == sched.jobs.end())
                throw std::runtime_error("schedule has an assignment for unknown job " + kv.first);
            in.jobs.push_back(it->second);
            added.insert(kv.first);
        }
        for (const auto &id : ev.affected_job_ids)
            if (added.insert(id).second)
                in.jobs.push_back(sched.jobs.at(id));
        if (ev.type == DisruptionType::EmergencyInsertion)
            in.jobs.push_back(*ev.emergency_job);

        Problem p = build_problem(in, travel_);
        const int T = p.T();
        const int J = p.J();

        // Committed routes, with their legs pinned so retiming reproduces committed times.
        std::vector<Committed> orig(J);
        std::vector<std::vector<int>> base(T);
        for (int t = 0; t < T; ++t)
        {
            int prev = p.tech_node(t);
            for (const auto &jid : p.techs[t].route)
            {
                auto ji = p.job_index.find(jid);
                const Assignment *a = sched.assignment(jid);
                if (ji == p.job_index.end() || !a)
                    throw std::runtime_error("route of " + p.techs[t].id + " names unassigned job " + jid);
                const int j = ji->second;
                base[t].push_back(j);
                orig[j] = {t, a->scheduled_start, a->scheduled_end, a->travel_from_previous, a->travel_to_next};
                p.travel.m[prev * p.travel.n + p.job_node(j)] = a->travel_from_previous;
                p.min_start[j] = a->scheduled_start;
                prev = p.job_node(j);
            }
        }
        for (int j = 0; j < J; ++j)
            if (orig[j].tech < 0)
                p.min_start[j] = std::max(p.jobs[j].window.start, now);

        std::vector<double> base_cost(T);
        for (int t = 0; t < T; ++t)
            base_cost[t] = eval_route(p, t, base[t]);

        auto upcoming = [&](int t)
        {
            std::vector<int> out;
            for (int j : base[t])
                if (orig[j].start >= now)
                    out.push_back(j);
            return out;
        };

        // A technician stopped mid-job still finishes that job; the block starts after it.
        auto free_from = [&](int t)
        {
            int from = now;
            for (int j : base[t])
                if (orig[j].start < now)
                    from = std::max(from, orig[j].end);
            return from;
        };

        // ---- per-type effect ----
        std::vector<char> in_scope(J, 0), pending(J, 0), rescheduled(J, 0);
        std::vector<int> techs;
        for (const auto &id : ev.affected_technician_ids)
            techs.push_back(p.tech_index.at(id));
        for (const auto &id : ev.affected_job_ids)
        {
            const int j = p.job_index.at(id);
            if (orig[j].tech >= 0)
                in_scope[j] = 1;
        }

        std::vector<std::string> weather_actions;
        const int delay = event_delay(sched, ev, ctx.weather_timeout_ms, weather_actions);

        switch (ev.type)
        {
        case DisruptionType::TrafficDelay:
        case DisruptionType::Weather:
        {
            std::set<int> targets;
            for (const auto &id : ev.affected_job_ids)
            {
                const int j = p.job_index.at(id);
                if (orig[j].tech >= 0)
                    targets.insert(j);
            }
            for (int t : techs)
            {
                std::vector<int> ups = upcoming(t);
                bool hit = false;
                for (int j : ups)
                {
                    in_scope[j] = 1;
                    hit = hit || targets.count(j);
                }
                if (!hit && !ups.empty())
                    targets.insert(ups.front());
            }
            for (int j : targets)
                p.delay_before[j] += delay;
            break;
        }
        case DisruptionType::EquipmentFailure:
            for (int t : techs)
            {
                const int from = free_from(t);
                p.blocked[t] = TimeWindow{from, from + delay};
                for (int j : upcoming(t))
                    in_scope[j] = 1;
            }
            break;
        case DisruptionType::ResourceUnavailable:
        {
            const int until = ev.expected_duration_minutes ? now + *ev.expected_duration_minutes : 2 * MINUTES_PER_DAY;
            for (int t : techs)
            {
                const int from = free_from(t);
                p.blocked[t] = TimeWindow{from, std::max(from, until)};
                for (int j : upcoming(t))
                {
                    in_scope[j] = 1;
                    if (orig[j].start < until && orig[j].end > from)
                        pending[j] = 1;
                }
            }
            break;
        }
        case DisruptionType::CustomerReschedule:
            for (const auto &id : ev.affected_job_ids)
            {
                const int j = p.job_index.at(id);
                Job &job = p.jobs[j];
                job.window.start = std::max(ev.new_window->start, sched.horizon.start);
                job.window.end = std::min(ev.new_window->end, sched.horizon.end);
                p.min_start[j] = std::max(job.window.start, now);
                in_scope[j] = 1;
                pending[j] = 1;
                rescheduled[j] = 1;
            }
            break;
        case DisruptionType::EmergencyInsertion:
        {
            const int j = p.job_index.at(ev.emergency_job->id);
            in_scope[j] = 1;
            pending[j] = 1;
            break;
        }
        }

        // ---- Scoped: closure along routes, bounded by max_reassignments ----
        int budget = prefs.max_reassignments;
        for (int t = 0; t < T; ++t)
        {
            const auto &r = base[t];
            auto first = std::find_if(r.begin(), r.end(), [&](int j)
                                      { return in_scope[j] != 0; });
            for (auto it = first; it != r.end() && budget > 0; ++it)
                if (!in_scope[*it])
                {
                    in_scope[*it] = 1;
                    --budget;
                }
        }
        for (int t = 0; t < T; ++t)
        {
            const auto &r = base[t];
            auto first = std::find_if(r.begin(), r.end(), [&](int j)
                                      { return in_scope[j] != 0; });
            if (first == r.begin() || first == r.end() || budget <= 0)
                continue;
            // Its outgoing leg follows the scope; a started job joins but stays locked.
            const int pj = *(first - 1);
            if (!in_scope[pj])
            {
                in_scope[pj] = 1;
                --budget;
            }
        }

        std::vector<int> pending_list;
        for (int j = 0; j < J; ++j)
            if (pending[j])
                pending_list.push_back(j);
        pending_list = insertion_order(p, pending_list);

        // Candidate technicians for displaced jobs: nearest first, their route tails join the scope.
        for (int j : pending_list)
        {
            std::vector<int> cands;
            for (int t = 0; t < T; ++t)
                if (static_candidate(p, t, j) && !p.blocked[t])
                    cands.push_back(t);
            std::sort(cands.begin(), cands.end(), [&](int a, int b)
                      {
                          const int la = p.leg(p.tech_node(a), p.job_node(j));
                          const int lb = p.leg(p.tech_node(b), p.job_node(j));
                          return la != lb ? la < lb : a < b;
                      });
            if ((int)cands.size() > std::max(1, prefs.max_reassignments))
                cands.resize(std::max(1, prefs.max_reassignments));
            for (int t : cands)
            {
                std::vector<int> ups = upcoming(t);
                for (int k = (int)ups.size() - 1; k >= 0 && budget > 0; --k)
                {
                    if (in_scope[ups[k]])
                        continue;
                    in_scope[ups[k]] = 1;
                    --budget;
                }
            }
        }

        std::vector<char> locked(J, 0);
        std::vector<int> pinned_count(T, 0);
        for (int j = 0; j < J; ++j)
        {
            if (in_scope[j])
                res.affected_job_ids.push_back(p.jobs[j].id);
            if (orig[j].tech >= 0 && orig[j].start < now)
                locked[j] = 1;
            if (orig[j].tech >= 0 && !in_scope[j])
                ++pinned_count[orig[j].tech];
        }
        std::sort(res.affected_job_ids.begin(), res.affected_job_ids.end());
        res.trace.push_back(AdaptationState::Scoped);
        FSLOG("[adapt] scope=%zu pending=%zu delay=%d\n", res.affected_job_ids.size(), pending_list.size(), delay);

        // Out-of-scope jobs keep technician, times and both legs; locked jobs keep their technician;
        // with prefer_same_technician, committed jobs stay with their technician.
        RouteGuard guard = [&](int t, const std::vector<int> &route, const RouteTiming &rt)
        {
            const int n = (int)route.size();
            int pinned = 0;
            for (int k = 0; k < n; ++k)
            {
                const int j = route[k];
                const Committed &c = orig[j];
                if (!in_scope[j])
                {
                    if (c.tech != t)
                        return false;
                    const int next_in = k + 1 < n ? rt.travel_in[k + 1] : 0;
                    if (rt.start[k] != c.start || rt.end[k] != c.end || rt.travel_in[k] != c.travel_in ||
                        next_in != c.travel_next)
                        return false;
                    ++pinned;
                }
                else if (c.tech >= 0 && c.tech != t && (locked[j] || (prefs.prefer_same_technician && !pending[j])))
                {
                    return false;
                }
            }
            return pinned == pinned_count[t];
        };

        auto reject = [&](const std::string &why, std::vector<std::string> recs)
        {
            res.state = AdaptationState::Rejected;
            res.trace.push_back(AdaptationState::Rejected);
            res.rejection_reason = why;
            res.recommendations = std::move(recs);
            res.recommendations.insert(res.recommendations.end(), weather_actions.begin(), weather_actions.end());
            FSWARN("[adapt] rejected: %s\n", why.c_str());
            return res;
        };

        // ---- Reoptimized ----
        Plan plan;
        plan.routes = base;
        for (auto &r : plan.routes)
            r.erase(std::remove_if(r.begin(), r.end(), [&](int j)
                                   { return pending[j] != 0; }),
                    r.end());
        plan.unassigned = pending_list;

        for (int t = 0; t < T; ++t)
        {
            auto &r = plan.routes[t];
            RouteTiming rt = time_route(p, t, r);
            while (!rt.feasible)
            {
                const int from = std::min(std::max(rt.fail_pos, 0), (int)r.size() - 1);
                int victim = -1;
                for (int k = from; k >= 0; --k)
                    if (in_scope[r[k]] && !locked[r[k]])
                    {
                        victim = k;
                        break;
                    }
                if (victim < 0)
                {
                    std::vector<std::string> recs;
                    if (!prefs.allow_overtime)
                        recs.push_back("Allow overtime for technician " + p.techs[t].id);
                    recs.push_back("Extend working hours of technician " + p.techs[t].id);
                    recs.push_back("Raise max_reassignments to widen the affected scope");
                    return reject("route of " + p.techs[t].id + " cannot absorb the disruption (" +
                                      to_string(rt.failure) + ")",
                                  recs);
                }
                const int j = r[victim];
                r.erase(r.begin() + victim);
                pending[j] = 1;
                plan.unassigned.push_back(j);
                rt = time_route(p, t, r);
            }
        }

        std::vector<double> costs(T);
        for (int t = 0; t < T; ++t)
            costs[t] = eval_route(p, t, plan.routes[t], guard);
        for (int j : insertion_order(p, plan.unassigned))
        {
            Insertion ins;
            if (prefs.prefer_same_technician && orig[j].tech >= 0)
                ins = best_insertion(p, plan, costs, j, guard, orig[j].tech);
            if (!ins.feasible)
                ins = best_insertion(p, plan, costs, j, guard);
            if (!ins.feasible)
                continue;
            auto &r = plan.routes[ins.tech];
            r.insert(r.begin() + ins.pos, j);
            costs[ins.tech] = eval_route(p, ins.tech, r, guard);
            plan.unassigned.erase(std::find(plan.unassigned.begin(), plan.unassigned.end(), j));
        }

        SearchLimits lim;
        lim.max_iterations = ctx.adapt_iterations;
        lim.deadline_ms = NowMillis() + ctx.time_budget_ms;
        SearchStats st = local_search(p, plan, lim, guard);
        res.trace.push_back(AdaptationState::Reoptimized);

        // ---- Applied: validate the whole result before committing anything ----
        struct Slot
        {
            int tech = -1;
            int start = 0;
            int end = 0;
        };
        std::vector<Slot> now_slot(J);
        std::vector<std::string> issues;
        std::vector<std::string> recs;
        bool locality_ok = true;
        for (int t = 0; t < T; ++t)
        {
            RouteTiming rt = time_route(p, t, plan.routes[t]);
            if (!rt.feasible)
            {
                issues.push_back("route of " + p.techs[t].id + " infeasible (" + to_string(rt.failure) + ")");
                continue;
            }
            if (!guard(t, plan.routes[t], rt))
                locality_ok = false;
            for (size_t k = 0; k < plan.routes[t].size(); ++k)
                now_slot[plan.routes[t][k]] = {t, rt.start[k], rt.end[k]};
        }
        if (!locality_ok)
        {
            issues.push_back("the change reaches assignments outside the affected scope");
            recs.push_back("Raise max_reassignments to widen the affected scope");
        }

        if (!plan.unassigned.empty())
        {
            std::string ids;
            std::set<std::string> skills;
            for (int j : plan.unassigned)
            {
                ids += (ids.empty() ? "" : ", ") + p.jobs[j].id;
                skills.insert(p.jobs[j].required_skills.begin(), p.jobs[j].required_skills.end());
            }
            issues.push_back("no feasible slot for " + ids);
            if (!prefs.allow_overtime)
                recs.push_back("Assign overtime to absorb " + ids);
            recs.push_back("Extend working hours of the affected technicians");
            if (!skills.empty())
            {
                std::string sk;
                for (const auto &s : skills)
                    sk += (sk.empty() ? "" : ", ") + s;
                recs.push_back("Add a technician with skills: " + sk);
            }
        }

        int reassigned = 0;
        int worst_delay = 0;
        for (int j = 0; j < J; ++j)
        {
            if (orig[j].tech < 0 || now_slot[j].tech < 0)
                continue;
            if (now_slot[j].tech != orig[j].tech)
                ++reassigned;
            if (!rescheduled[j])
                worst_delay = std::max(worst_delay, now_slot[j].start - orig[j].start);
        }
        if (worst_delay > prefs.max_schedule_delay)
        {
            issues.push_back("delay of " + std::to_string(worst_delay) + " min exceeds max_schedule_delay " +
                             std::to_string(prefs.max_schedule_delay));
            recs.push_back("Extend max_schedule_delay to " + std::to_string(worst_delay) + " minutes");
            if (!prefs.allow_overtime)
                recs.push_back("Allow overtime so later jobs can shift");
        }
        if (reassigned > prefs.max_reassignments)
        {
            issues.push_back(std::to_string(reassigned) + " reassignments exceed max_reassignments " +
                             std::to_string(prefs.max_reassignments));
            recs.push_back("Raise max_reassignments to " + std::to_string(reassigned));
        }
        res.reassignment_count = reassigned;

        if (!issues.empty())
        {
            std::string why;
            for (const auto &s : issues)
                why += (why.empty() ? "" : "; ") + s;
            return reject(why, recs);
        }

        // ---- build the adapted schedule ----
        Schedule next = sched;
        next.version = sched.version + 1;
        next.degraded = sched.degraded || p.degraded;
        std::vector<Assignment> fresh = build_assignments(p, plan, ctx.alternatives);
        std::map<std::string, const Assignment *> by_job;
        for (const auto &a : fresh)
            by_job[a.job_id] = &a;

        for (int t = 0; t < T; ++t)
        {
            Technician *tech = next.technician(p.techs[t].id);
            tech->route.clear();
            for (int j : plan.routes[t])
                tech->route.push_back(p.jobs[j].id);
        }

        double impact_sum = 0.0;
        int total_delay = 0;
        std::set<std::string> techs_touched;
        int placed_in_scope = 0, scope_size = 0;
        for (int j = 0; j < J; ++j)
        {
            if (!in_scope[j])
                continue;
            ++scope_size;
            const Job &job = p.jobs[j];
            const Assignment &a = *by_job.at(job.id);
            ++placed_in_scope;

            Job stored = job;
            stored.status = a.confidence < AT_RISK_THRESHOLD ? JobStatus::AtRisk : JobStatus::Scheduled;
            next.jobs[job.id] = stored;
            next.assignments[job.id] = a;

            const Committed &c = orig[j];
            const bool moved = c.tech < 0 || c.tech != now_slot[j].tech || c.start != a.scheduled_start ||
                               c.end != a.scheduled_end;
            if (!moved)
                continue;

            AdaptedJob aj;
            aj.job_id = job.id;
            if (c.tech >= 0)
                aj.original = ScheduleSlot{p.techs[c.tech].id, c.start, c.end};
            aj.updated = ScheduleSlot{a.technician_id, a.scheduled_start, a.scheduled_end};

            std::string what;
            if (c.tech < 0)
                what = "inserted";
            else if (rescheduled[j])
                what = "rescheduled to a new window";
            else if (c.tech != now_slot[j].tech)
                what = "reassigned";
            else
                what = "retimed by " + std::to_string(a.scheduled_start - c.start) + " min";
            aj.reason = std::string(to_string(ev.type)) + ": " + what;

            ImpactInputs ii;
            ii.time_delta_minutes = c.tech >= 0 ? a.scheduled_start - c.start : 0;
            ii.reassigned = c.tech >= 0 && c.tech != now_slot[j].tech;
            ii.max_schedule_delay = prefs.max_schedule_delay;
            const int nt = now_slot[j].tech;
            if (c.tech >= 0)
            {
                ii.cost_before = base_cost[c.tech] + (ii.reassigned ? base_cost[nt] : 0.0);
                ii.cost_after = eval_route(p, c.tech, plan.routes[c.tech]) +
                                (ii.reassigned ? eval_route(p, nt, plan.routes[nt]) : 0.0);
            }
            else
            {
                ii.cost_before = base_cost[nt];
                ii.cost_after = eval_route(p, nt, plan.routes[nt]);
            }
            aj.impact_score = score_impact(ii);

            impact_sum += aj.impact_score;
            if (ii.time_delta_minutes > 0)
                total_delay += ii.time_delta_minutes;
            if (aj.original)
                techs_touched.insert(aj.original->technician_id);
            techs_touched.insert(aj.updated->technician_id);
            if (stored.status == JobStatus::AtRisk)
                res.recommendations.push_back("Confirm the new arrival time with the customer of job " + job.id);
            res.adapted.push_back(std::move(aj));
        }

        res.impact.jobs_rescheduled = (int)res.adapted.size();
        res.impact.technicians_affected = (int)techs_touched.size();
        res.impact.total_delay_minutes = total_delay;
        res.impact.reassignment_count = reassigned;
        res.impact.adaptation_success_rate = scope_size > 0 ? (double)placed_in_scope / scope_size : 1.0;
        res.impact.overall_impact = res.adapted.empty() ? 0.0 : impact_sum / res.adapted.size();
        res.recommendations.insert(res.recommendations.end(), weather_actions.begin(), weather_actions.end());

        if (commit)
            commit(next);
        res.schedule = std::move(next);
        res.state = AdaptationState::Applied;
        res.trace.push_back(AdaptationState::Applied);
        FSLOG("[adapt] applied v%d adapted=%zu reassigned=%d delay=%d iters=%d\n", res.schedule->version,
              res.adapted.size(), reassigned, total_delay, st.iterations);

        // ---- Notified: best effort ----
        res.impact.notifications_sent = notify(res, prefs);
        res.state = AdaptationState::Notified;
        res.trace.push_back(AdaptationState::Notified);
        return res;
    }

    int DisruptionHandler::notify(const AdaptationResult &res, const AdaptationPreferences &prefs)
    {
        if (!notifier_)
            return 0;
        int sent = 0;
        auto send = [&](const NotificationPayload &n)
        {
            try
            {
                notifier_->dispatch(n);
                ++sent;
            }
            catch (const std::exception &e)
            {
                FSWARN("[notify] %s %s for job %s failed: %s\n",
                       n.recipient == Recipient::Technician ? "technician" : "customer", n.recipient_id.c_str(),
                       n.job_id.c_str(), e.what());
            }
        };

        for (const auto &aj : res.adapted)
        {
            NotificationPayload n;
            n.job_id = aj.job_id;
            n.previous = aj.original;
            n.current = aj.updated;
            n.message = "Job " + aj.job_id + ": " +
                        (aj.original ? slot_text(*aj.original) + " -> " : std::string("new -> ")) +
                        slot_text(*aj.updated) + " (" + aj.reason + ")";
            if (prefs.notify_technicians)
            {
                n.recipient = Recipient::Technician;
                n.recipient_id = aj.updated->technician_id;
                send(n);
                if (aj.original && aj.original->technician_id != aj.updated->technician_id)
                {
                    n.recipient_id = aj.original->technician_id;
                    send(n);
                }
            }
            if (prefs.notify_customers)
            {
                n.recipient = Recipient::Customer;
                n.recipient_id = aj.job_id;
                send(n);
            }
        }
        return sent;
    }

    const char *to_string(AdaptationState s)
    {
        switch (s)
        {
        case AdaptationState::Received: return "received";
        case AdaptationState::Scoped: return "scoped";
        case AdaptationState::Reoptimized: return "reoptimized";
        case AdaptationState::Applied: return "applied";
        case AdaptationState::Notified: return "notified";
        case AdaptationState::Rejected: return "rejected";
        }
        return "received";
    }

} // namespace fsched
