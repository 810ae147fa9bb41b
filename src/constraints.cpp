#include "constraints.h"

#include <cmath>
#include <set>

#include "errors.h"
#include "objectives.h"

namespace fsched
{

    std::vector<std::string> constraint_violations(const ConstraintSet &c)
    {
        std::vector<std::string> bad;
        if (c.max_travel_time <= 0)
            bad.push_back("max_travel_time must be > 0 (got " + std::to_string(c.max_travel_time) + ")");
        if (c.working_hours.end <= c.working_hours.start)
            bad.push_back("working_hours end must be after start");
        if (c.working_hours.start < 0 || c.working_hours.end > MINUTES_PER_DAY)
            bad.push_back("working_hours must lie within the planning day");
        if (c.max_jobs_per_technician < 0)
            bad.push_back("max_jobs_per_technician must be >= 0");
        if (c.max_overtime_minutes < 0)
            bad.push_back("max_overtime_minutes must be >= 0");
        if (c.objectives.empty())
            bad.push_back("objectives must not be empty");

        std::set<ObjectiveKind> seen;
        double total = 0.0;
        for (const auto &o : c.objectives)
        {
            const std::string name = to_string(o.kind);
            if (!seen.insert(o.kind).second)
                bad.push_back("objectives: duplicate " + name);
            if (o.weight)
            {
                if (!std::isfinite(*o.weight) || *o.weight < 0.0)
                    bad.push_back("objectives: weight of " + name + " must be finite and >= 0");
                else
                    total += *o.weight;
            }
            else
            {
                total += default_weight(o.kind);
            }
        }
        if (!c.objectives.empty() && total <= 0.0 && bad.empty())
            bad.push_back("objectives: weights sum to zero");
        return bad;
    }

    ConstraintSet normalize_constraints(const ConstraintSet &c)
    {
        auto bad = constraint_violations(c);
        if (!bad.empty())
            throw ValidationError(bad);

        ConstraintSet out = c;
        double total = 0.0;
        for (auto &o : out.objectives)
        {
            if (!o.weight)
                o.weight = default_weight(o.kind);
            total += *o.weight;
        }
        for (auto &o : out.objectives)
            o.weight = *o.weight / total;
        return out;
    }

    std::vector<std::string> preference_violations(const AdaptationPreferences &p)
    {
        std::vector<std::string> bad;
        if (p.max_schedule_delay < 0)
            bad.push_back("max_schedule_delay must be >= 0");
        if (p.max_reassignments < 0)
            bad.push_back("max_reassignments must be >= 0");
        return bad;
    }

    void validate_preferences(const AdaptationPreferences &p)
    {
        auto bad = preference_violations(p);
        if (!bad.empty())
            throw ValidationError(bad);
    }

    std::vector<std::string> request_violations(const std::vector<Job> &jobs,
                                                const std::vector<Technician> &technicians,
                                                const TimeWindow &horizon)
    {
        std::vector<std::string> bad;
        if (horizon.end <= horizon.start)
            bad.push_back("horizon end must be after start");
        if (horizon.length() > MINUTES_PER_DAY)
            bad.push_back("horizon longer than one day (" + std::to_string(horizon.length()) + " min)");

        std::set<std::string> ids;
        for (const auto &j : jobs)
        {
            if (j.id.empty())
            {
                bad.push_back("job with empty id");
                continue;
            }
            if (!ids.insert(j.id).second)
                bad.push_back("job " + j.id + ": duplicate id");
            if (j.duration_minutes <= 0)
                bad.push_back("job " + j.id + ": duration must be > 0");
            if (j.window.end < j.window.start)
                bad.push_back("job " + j.id + ": window end before start");
            if (std::abs(j.location.lat) > 90.0 || std::abs(j.location.lng) > 180.0)
                bad.push_back("job " + j.id + ": location out of range");
        }

        ids.clear();
        for (const auto &t : technicians)
        {
            if (t.id.empty())
            {
                bad.push_back("technician with empty id");
                continue;
            }
            if (!ids.insert(t.id).second)
                bad.push_back("technician " + t.id + ": duplicate id");
            if (t.working_hours.end <= t.working_hours.start)
                bad.push_back("technician " + t.id + ": working_hours end must be after start");
            if (t.max_jobs_per_day < 0)
                bad.push_back("technician " + t.id + ": max_jobs_per_day must be >= 0");
            if (t.cost_per_hour < 0.0)
                bad.push_back("technician " + t.id + ": cost_per_hour must be >= 0");
            for (const auto &kv : t.proficiency)
                if (!(kv.second >= 0.0 && kv.second <= 1.0))
                    bad.push_back("technician " + t.id + ": proficiency of " + kv.first + " must be in [0,1]");
            if (std::abs(t.home.lat) > 90.0 || std::abs(t.home.lng) > 180.0)
                bad.push_back("technician " + t.id + ": home out of range");
        }
        return bad;
    }

} // namespace fsched
