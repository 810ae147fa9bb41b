#include "problem.h"

#include <algorithm>

#include "log.h"
#include "scorer.h"

namespace fsched
{

    GeoPoint resolve_start(const Technician &t, const std::optional<LocationFix> &store_fix,
                           int now_minute, int staleness_minutes, bool &stale)
    {
        stale = false;
        std::optional<LocationFix> fix = t.last_known;
        if (store_fix && (!fix || store_fix->minute >= fix->minute))
            fix = store_fix;
        if (!fix)
            return t.home;
        if (now_minute - fix->minute > staleness_minutes)
        {
            stale = true;
            return t.home;
        }
        return fix->point;
    }

    std::string job_category(const Job &j)
    {
        if (!j.category.empty())
            return j.category;
        if (!j.required_skills.empty())
            return j.required_skills.front();
        return "general";
    }

    bool static_candidate(const Problem &p, int t, int j)
    {
        if (!p.skill_ok[t][j])
            return false;
        if (p.cap[t] <= 0)
            return false;
        const Job &job = p.jobs[j];
        const int lo = std::max(p.shift[t].start, job.window.start);
        const int hi = std::min(p.shift[t].end + p.overtime_cap[t], job.window.end);
        return hi - lo >= job.duration_minutes;
    }

    Problem build_problem(const ProblemInput &in, TravelTimeService &travel)
    {
        Problem p;
        p.constraints = in.constraints;
        p.weights = weights_of(in.constraints);

        p.techs = in.technicians;
        std::sort(p.techs.begin(), p.techs.end(),
                  [](const Technician &a, const Technician &b)
                  { return a.id < b.id; });
        p.jobs = in.jobs;
        std::sort(p.jobs.begin(), p.jobs.end(),
                  [](const Job &a, const Job &b)
                  { return a.id < b.id; });

        const int T = p.T();
        const int J = p.J();
        const ConstraintSet &c = p.constraints;

        for (int j = 0; j < J; ++j)
        {
            Job &job = p.jobs[j];
            p.job_index[job.id] = j;
            job.window.start = std::max(job.window.start, in.horizon.start);
            job.window.end = std::min(job.window.end, in.horizon.end);
            p.min_start.push_back(job.window.start);
            p.delay_before.push_back(0);
        }

        int stale_count = 0;
        for (int t = 0; t < T; ++t)
        {
            const Technician &tech = p.techs[t];
            p.tech_index[tech.id] = t;

            TimeWindow s;
            s.start = std::max({tech.working_hours.start, c.working_hours.start, in.horizon.start});
            s.end = std::min({tech.working_hours.end, c.working_hours.end, in.horizon.end});
            if (s.end < s.start)
                s.end = s.start;
            p.shift.push_back(s);
            p.cap.push_back(std::min(tech.max_jobs_per_day, c.max_jobs_per_technician));
            p.overtime_cap.push_back(c.overtime_allowed ? c.max_overtime_minutes : 0);

            auto rate = in.on_time_rates.find(tech.id);
            p.on_time.push_back(rate != in.on_time_rates.end() ? rate->second : DEFAULT_ON_TIME_RATE);
            p.blocked.emplace_back();

            auto fixed = in.start_points.find(tech.id);
            if (fixed != in.start_points.end())
            {
                p.start_points.push_back(fixed->second);
                p.stale.push_back(0);
            }
            else
            {
                std::optional<LocationFix> store_fix;
                auto it = in.locations.find(tech.id);
                if (it != in.locations.end())
                    store_fix = it->second;
                bool stale = false;
                p.start_points.push_back(resolve_start(tech, store_fix, in.now_minute, in.staleness_minutes, stale));
                p.stale.push_back(stale ? 1 : 0);
                if (stale)
                    ++stale_count;
            }

            std::vector<char> ok(J, 0);
            std::vector<double> missing(J, 0.0), strength(J, 1.0);
            for (int j = 0; j < J; ++j)
            {
                const auto &req = p.jobs[j].required_skills;
                int have = 0;
                double prof = 0.0;
                for (const auto &sk : req)
                {
                    if (std::find(tech.skills.begin(), tech.skills.end(), sk) == tech.skills.end())
                        continue;
                    ++have;
                    auto pr = tech.proficiency.find(sk);
                    prof += pr != tech.proficiency.end() ? pr->second : 1.0;
                }
                const bool all = have == (int)req.size();
                ok[j] = (all || !c.skill_match_required) ? 1 : 0;
                missing[j] = req.empty() ? 0.0 : 1.0 - (double)have / (double)req.size();
                strength[j] = req.empty() ? 1.0 : prof / (double)req.size();
            }
            p.skill_ok.push_back(std::move(ok));
            p.skill_missing.push_back(std::move(missing));
            p.skill_strength.push_back(std::move(strength));
        }

        std::vector<GeoPoint> nodes = p.start_points;
        for (const auto &job : p.jobs)
            nodes.push_back(job.location);
        TravelMatrix tm = travel.build_time_matrix(nodes);
        p.travel = std::move(tm.matrix);
        p.degraded = tm.degraded;

        FSLOG("[problem] techs=%d jobs=%d stale_locations=%d degraded=%d\n", T, J, stale_count, p.degraded ? 1 : 0);
        return p;
    }

} // namespace fsched
