#include "json_io.h"

#include <fstream>
#include <stdexcept>

#include "errors.h"

namespace fsched
{

    namespace
    {

        template <typename E, size_t N>
        E parse_enum(const std::string &s, const E (&all)[N], const char *what)
        {
            for (E e : all)
                if (s == to_string(e))
                    return e;
            throw ValidationError({std::string("unknown ") + what + ": " + s});
        }

        template <typename T>
        void put_optional(json &j, const char *key, const std::optional<T> &v)
        {
            if (v)
                j[key] = *v;
            else
                j[key] = nullptr;
        }

        template <typename T>
        void get_optional(const json &j, const char *key, std::optional<T> &v)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                v.reset();
            else
                v = it->template get<T>();
        }

    } // namespace

    JobStatus parse_job_status(const std::string &s)
    {
        static const JobStatus all[] = {JobStatus::Unscheduled, JobStatus::Scheduled, JobStatus::AtRisk,
                                        JobStatus::Completed, JobStatus::Cancelled};
        return parse_enum(s, all, "job status");
    }

    Priority parse_priority(const json &j)
    {
        if (j.is_number_integer())
        {
            const int v = j.get<int>();
            if (v < 1 || v > 5)
                throw ValidationError({"priority out of range: " + std::to_string(v)});
            return static_cast<Priority>(v);
        }
        static const Priority all[] = {Priority::Low, Priority::Medium, Priority::High, Priority::Urgent,
                                       Priority::Emergency};
        return parse_enum(j.get<std::string>(), all, "priority");
    }

    ObjectiveKind parse_objective_kind(const std::string &s)
    {
        static const ObjectiveKind all[] = {ObjectiveKind::MinimizeTravelTime, ObjectiveKind::MaximizeUtilization,
                                            ObjectiveKind::BalanceWorkload, ObjectiveKind::MinimizeCost,
                                            ObjectiveKind::MaximizeCustomerSatisfaction};
        return parse_enum(s, all, "objective");
    }

    UnscheduledReason parse_unscheduled_reason(const std::string &s)
    {
        static const UnscheduledReason all[] = {UnscheduledReason::NoCandidate, UnscheduledReason::NoSlot,
                                                UnscheduledReason::TravelTimeExceeded};
        return parse_enum(s, all, "unscheduled reason");
    }

    DisruptionType parse_disruption_type(const std::string &s)
    {
        static const DisruptionType all[] = {DisruptionType::TrafficDelay, DisruptionType::Weather,
                                             DisruptionType::EmergencyInsertion, DisruptionType::ResourceUnavailable,
                                             DisruptionType::CustomerReschedule, DisruptionType::EquipmentFailure};
        return parse_enum(s, all, "disruption type");
    }

    Severity parse_severity(const std::string &s)
    {
        static const Severity all[] = {Severity::Low, Severity::Medium, Severity::High, Severity::Critical};
        return parse_enum(s, all, "severity");
    }

    RunStatus parse_run_status(const std::string &s)
    {
        static const RunStatus all[] = {RunStatus::Queued, RunStatus::Running, RunStatus::Completed,
                                        RunStatus::Failed, RunStatus::Cancelled};
        return parse_enum(s, all, "run status");
    }

    // ---- domain types ----

    void to_json(json &j, const GeoPoint &g) { j = json{{"lat", g.lat}, {"lng", g.lng}}; }

    void from_json(const json &j, GeoPoint &g)
    {
        g.lat = j.at("lat").get<double>();
        g.lng = j.at("lng").get<double>();
    }

    void to_json(json &j, const TimeWindow &w) { j = json{{"start", w.start}, {"end", w.end}}; }

    void from_json(const json &j, TimeWindow &w)
    {
        w.start = j.at("start").get<int>();
        w.end = j.at("end").get<int>();
    }

    void to_json(json &j, const LocationFix &f) { j = json{{"point", f.point}, {"minute", f.minute}}; }

    void from_json(const json &j, LocationFix &f)
    {
        f.point = j.at("point").get<GeoPoint>();
        f.minute = j.value("minute", 0);
    }

    void to_json(json &j, const Job &x)
    {
        j = json{{"id", x.id},
                 {"required_skills", x.required_skills},
                 {"priority", to_string(x.priority)},
                 {"location", x.location},
                 {"duration_minutes", x.duration_minutes},
                 {"window", x.window},
                 {"category", x.category},
                 {"status", to_string(x.status)}};
    }

    void from_json(const json &j, Job &x)
    {
        Job d;
        x.id = j.at("id").get<std::string>();
        x.required_skills = j.value("required_skills", d.required_skills);
        x.priority = j.contains("priority") ? parse_priority(j["priority"]) : d.priority;
        x.location = j.at("location").get<GeoPoint>();
        x.duration_minutes = j.value("duration_minutes", d.duration_minutes);
        x.window = j.contains("window") ? j["window"].get<TimeWindow>() : d.window;
        x.category = j.value("category", d.category);
        x.status = j.contains("status") ? parse_job_status(j["status"].get<std::string>()) : d.status;
    }

    void to_json(json &j, const Technician &t)
    {
        j = json{{"id", t.id},
                 {"skills", t.skills},
                 {"proficiency", t.proficiency},
                 {"home", t.home},
                 {"working_hours", t.working_hours},
                 {"max_jobs_per_day", t.max_jobs_per_day},
                 {"cost_per_hour", t.cost_per_hour},
                 {"route", t.route}};
        put_optional(j, "last_known", t.last_known);
    }

    void from_json(const json &j, Technician &t)
    {
        Technician d;
        t.id = j.at("id").get<std::string>();
        t.skills = j.value("skills", d.skills);
        t.proficiency = j.value("proficiency", d.proficiency);
        t.home = j.at("home").get<GeoPoint>();
        get_optional(j, "last_known", t.last_known);
        t.working_hours = j.contains("working_hours") ? j["working_hours"].get<TimeWindow>() : d.working_hours;
        t.max_jobs_per_day = j.value("max_jobs_per_day", d.max_jobs_per_day);
        t.cost_per_hour = j.value("cost_per_hour", d.cost_per_hour);
        t.route = j.value("route", d.route);
    }

    void to_json(json &j, const AlternativeCandidate &a)
    {
        j = json{{"technician_id", a.technician_id}, {"cost_delta", a.cost_delta}};
    }

    void from_json(const json &j, AlternativeCandidate &a)
    {
        a.technician_id = j.at("technician_id").get<std::string>();
        a.cost_delta = j.value("cost_delta", 0.0);
    }

    void to_json(json &j, const Assignment &a)
    {
        j = json{{"job_id", a.job_id},
                 {"technician_id", a.technician_id},
                 {"scheduled_start", a.scheduled_start},
                 {"scheduled_end", a.scheduled_end},
                 {"travel_from_previous", a.travel_from_previous},
                 {"travel_to_next", a.travel_to_next},
                 {"confidence", a.confidence},
                 {"alternatives", a.alternatives}};
    }

    void from_json(const json &j, Assignment &a)
    {
        a.job_id = j.at("job_id").get<std::string>();
        a.technician_id = j.at("technician_id").get<std::string>();
        a.scheduled_start = j.at("scheduled_start").get<int>();
        a.scheduled_end = j.at("scheduled_end").get<int>();
        a.travel_from_previous = j.value("travel_from_previous", 0);
        a.travel_to_next = j.value("travel_to_next", 0);
        a.confidence = j.value("confidence", 0.0);
        a.alternatives = j.value("alternatives", std::vector<AlternativeCandidate>{});
    }

    void to_json(json &j, const Objective &o)
    {
        j = json{{"kind", to_string(o.kind)}};
        put_optional(j, "weight", o.weight);
    }

    void from_json(const json &j, Objective &o)
    {
        if (j.is_string())
        {
            o.kind = parse_objective_kind(j.get<std::string>());
            o.weight.reset();
            return;
        }
        o.kind = parse_objective_kind(j.at("kind").get<std::string>());
        get_optional(j, "weight", o.weight);
    }

    void to_json(json &j, const ConstraintSet &c)
    {
        j = json{{"max_travel_time", c.max_travel_time},
                 {"working_hours", c.working_hours},
                 {"max_jobs_per_technician", c.max_jobs_per_technician},
                 {"skill_match_required", c.skill_match_required},
                 {"overtime_allowed", c.overtime_allowed},
                 {"max_overtime_minutes", c.max_overtime_minutes},
                 {"objectives", c.objectives}};
    }

    void from_json(const json &j, ConstraintSet &c)
    {
        ConstraintSet d;
        c.max_travel_time = j.value("max_travel_time", d.max_travel_time);
        c.working_hours = j.contains("working_hours") ? j["working_hours"].get<TimeWindow>() : d.working_hours;
        c.max_jobs_per_technician = j.value("max_jobs_per_technician", d.max_jobs_per_technician);
        c.skill_match_required = j.value("skill_match_required", d.skill_match_required);
        c.overtime_allowed = j.value("overtime_allowed", d.overtime_allowed);
        c.max_overtime_minutes = j.value("max_overtime_minutes", d.max_overtime_minutes);
        c.objectives = j.contains("objectives") ? j["objectives"].get<std::vector<Objective>>() : d.objectives;
    }

    void to_json(json &j, const UnscheduledJob &u)
    {
        j = json{{"job_id", u.job_id}, {"reason", to_string(u.reason)}, {"detail", u.detail}};
    }

    void from_json(const json &j, UnscheduledJob &u)
    {
        u.job_id = j.at("job_id").get<std::string>();
        u.reason = parse_unscheduled_reason(j.at("reason").get<std::string>());
        u.detail = j.value("detail", std::string());
    }

    void to_json(json &j, const DisruptionEvent &e)
    {
        j = json{{"type", to_string(e.type)},
                 {"affected_job_ids", e.affected_job_ids},
                 {"affected_technician_ids", e.affected_technician_ids},
                 {"severity", to_string(e.severity)},
                 {"description", e.description}};
        put_optional(j, "expected_duration_minutes", e.expected_duration_minutes);
        put_optional(j, "location", e.location);
        put_optional(j, "emergency_job", e.emergency_job);
        put_optional(j, "new_window", e.new_window);
    }

    void from_json(const json &j, DisruptionEvent &e)
    {
        e.type = parse_disruption_type(j.at("type").get<std::string>());
        e.affected_job_ids = j.value("affected_job_ids", std::vector<std::string>{});
        e.affected_technician_ids = j.value("affected_technician_ids", std::vector<std::string>{});
        e.severity = j.contains("severity") ? parse_severity(j["severity"].get<std::string>()) : Severity::Medium;
        get_optional(j, "expected_duration_minutes", e.expected_duration_minutes);
        get_optional(j, "location", e.location);
        get_optional(j, "emergency_job", e.emergency_job);
        get_optional(j, "new_window", e.new_window);
        e.description = j.value("description", std::string());
    }

    void to_json(json &j, const AdaptationPreferences &p)
    {
        j = json{{"allow_overtime", p.allow_overtime},
                 {"max_schedule_delay", p.max_schedule_delay},
                 {"max_reassignments", p.max_reassignments},
                 {"prefer_same_technician", p.prefer_same_technician},
                 {"notify_customers", p.notify_customers},
                 {"notify_technicians", p.notify_technicians}};
    }

    void from_json(const json &j, AdaptationPreferences &p)
    {
        AdaptationPreferences d;
        p.allow_overtime = j.value("allow_overtime", d.allow_overtime);
        p.max_schedule_delay = j.value("max_schedule_delay", d.max_schedule_delay);
        p.max_reassignments = j.value("max_reassignments", d.max_reassignments);
        p.prefer_same_technician = j.value("prefer_same_technician", d.prefer_same_technician);
        p.notify_customers = j.value("notify_customers", d.notify_customers);
        p.notify_technicians = j.value("notify_technicians", d.notify_technicians);
    }

    void to_json(json &j, const ScheduleSlot &s)
    {
        j = json{{"technician_id", s.technician_id}, {"start", s.start}, {"end", s.end}};
    }

    void to_json(json &j, const AdaptedJob &a)
    {
        j = json{{"job_id", a.job_id}, {"reason", a.reason}, {"impact_score", a.impact_score}};
        put_optional(j, "original", a.original);
        put_optional(j, "updated", a.updated);
    }

    void to_json(json &j, const ImpactSummary &s)
    {
        j = json{{"jobs_rescheduled", s.jobs_rescheduled},
                 {"technicians_affected", s.technicians_affected},
                 {"total_delay_minutes", s.total_delay_minutes},
                 {"reassignment_count", s.reassignment_count},
                 {"notifications_sent", s.notifications_sent},
                 {"adaptation_success_rate", s.adaptation_success_rate},
                 {"overall_impact", s.overall_impact}};
    }

    void to_json(json &j, const RunMetrics &m)
    {
        j = json{{"total_jobs", m.total_jobs},
                 {"scheduled_jobs", m.scheduled_jobs},
                 {"success_rate", m.success_rate},
                 {"total_travel_minutes", m.total_travel_minutes},
                 {"average_travel_minutes", m.average_travel_minutes},
                 {"average_confidence", m.average_confidence},
                 {"busy_minutes", m.busy_minutes},
                 {"available_minutes", m.available_minutes},
                 {"utilization", m.utilization},
                 {"baseline_travel_minutes", m.baseline_travel_minutes},
                 {"travel_savings_percent", m.travel_savings_percent},
                 {"technicians", m.technicians},
                 {"iterations", m.iterations},
                 {"elapsed_ms", m.elapsed_ms},
                 {"degraded", m.degraded},
                 {"timed_out", m.timed_out}};
    }

    void from_json(const json &j, RunMetrics &m)
    {
        m.total_jobs = j.value("total_jobs", 0);
        m.scheduled_jobs = j.value("scheduled_jobs", 0);
        m.success_rate = j.value("success_rate", 0.0);
        m.total_travel_minutes = j.value("total_travel_minutes", 0);
        m.average_travel_minutes = j.value("average_travel_minutes", 0.0);
        m.average_confidence = j.value("average_confidence", 0.0);
        m.busy_minutes = j.value("busy_minutes", 0);
        m.available_minutes = j.value("available_minutes", 0);
        m.utilization = j.value("utilization", 0.0);
        m.baseline_travel_minutes = j.value("baseline_travel_minutes", 0);
        m.travel_savings_percent = j.value("travel_savings_percent", 0.0);
        m.technicians = j.value("technicians", 0);
        m.iterations = j.value("iterations", 0);
        m.elapsed_ms = j.value("elapsed_ms", 0LL);
        m.degraded = j.value("degraded", false);
        m.timed_out = j.value("timed_out", false);
    }

    void to_json(json &j, const OptimizationRun &r)
    {
        j = json{{"id", r.id},
                 {"tenant_id", r.tenant_id},
                 {"created_ms", r.created_ms},
                 {"planning_day", r.planning_day},
                 {"input_hash", r.input_hash},
                 {"assignments", r.assignments},
                 {"metrics", r.metrics},
                 {"demand_by_category", r.demand_by_category},
                 {"algorithm_version", r.algorithm_version},
                 {"status", to_string(r.status)},
                 {"failure_reason", r.failure_reason}};
    }

    void from_json(const json &j, OptimizationRun &r)
    {
        r.id = j.at("id").get<std::string>();
        r.tenant_id = j.at("tenant_id").get<std::string>();
        r.created_ms = j.value("created_ms", 0LL);
        r.planning_day = j.value("planning_day", 0);
        r.input_hash = j.value("input_hash", std::string());
        r.assignments = j.value("assignments", std::vector<Assignment>{});
        r.metrics = j.contains("metrics") ? j["metrics"].get<RunMetrics>() : RunMetrics{};
        r.demand_by_category = j.value("demand_by_category", std::map<std::string, int>{});
        r.algorithm_version = j.value("algorithm_version", std::string());
        r.status = parse_run_status(j.value("status", std::string("Completed")));
        r.failure_reason = j.value("failure_reason", std::string());
    }

    void to_json(json &j, const JobOutcome &o)
    {
        j = json{{"job_id", o.job_id},
                 {"technician_id", o.technician_id},
                 {"planning_day", o.planning_day},
                 {"scheduled_start", o.scheduled_start},
                 {"actual_start", o.actual_start},
                 {"actual_end", o.actual_end},
                 {"completed", o.completed}};
    }

    void from_json(const json &j, JobOutcome &o)
    {
        o.job_id = j.at("job_id").get<std::string>();
        o.technician_id = j.at("technician_id").get<std::string>();
        o.planning_day = j.value("planning_day", 0);
        o.scheduled_start = j.at("scheduled_start").get<int>();
        o.actual_start = j.at("actual_start").get<int>();
        o.actual_end = j.value("actual_end", o.actual_start);
        o.completed = j.value("completed", true);
    }

    void to_json(json &j, const Schedule &s)
    {
        json jobs = json::array();
        for (const auto &kv : s.jobs)
            jobs.push_back(kv.second);
        json assignments = json::array();
        for (const auto &kv : s.assignments)
            assignments.push_back(kv.second);
        j = json{{"tenant_id", s.tenant_id},
                 {"run_id", s.run_id},
                 {"version", s.version},
                 {"planning_day", s.planning_day},
                 {"horizon", s.horizon},
                 {"constraints", s.constraints},
                 {"degraded", s.degraded},
                 {"technicians", s.technicians},
                 {"jobs", jobs},
                 {"assignments", assignments},
                 {"start_points", s.start_points},
                 {"archived", s.archived}};
    }

    void from_json(const json &j, Schedule &s)
    {
        s.tenant_id = j.value("tenant_id", std::string());
        s.run_id = j.value("run_id", std::string());
        s.version = j.value("version", 0);
        s.planning_day = j.value("planning_day", 0);
        s.horizon = j.contains("horizon") ? j["horizon"].get<TimeWindow>() : TimeWindow{0, MINUTES_PER_DAY};
        s.constraints = j.contains("constraints") ? j["constraints"].get<ConstraintSet>() : ConstraintSet{};
        s.degraded = j.value("degraded", false);
        s.technicians = j.value("technicians", std::vector<Technician>{});
        s.jobs.clear();
        for (const auto &x : j.value("jobs", json::array()))
        {
            Job job = x.get<Job>();
            s.jobs[job.id] = std::move(job);
        }
        s.assignments.clear();
        for (const auto &x : j.value("assignments", json::array()))
        {
            Assignment a = x.get<Assignment>();
            s.assignments[a.job_id] = std::move(a);
        }
        s.start_points = j.value("start_points", std::map<std::string, GeoPoint>{});
        s.archived = j.value("archived", std::vector<std::string>{});
    }

    void to_json(json &j, const AdaptationResult &r)
    {
        json trace = json::array();
        for (auto st : r.trace)
            trace.push_back(to_string(st));
        j = json{{"state", to_string(r.state)},
                 {"trace", trace},
                 {"adapted", r.adapted},
                 {"impact", r.impact},
                 {"recommendations", r.recommendations},
                 {"reassignment_count", r.reassignment_count},
                 {"affected_job_ids", r.affected_job_ids},
                 {"rejection_reason", r.rejection_reason}};
        if (r.schedule)
            j["schedule_version"] = r.schedule->version;
    }

    void to_json(json &j, const AnalyticsReport &r)
    {
        const Kpis &k = r.kpis;
        json trends = json::array();
        for (const auto &t : r.trends)
            trends.push_back({{"metric", t.metric},
                              {"direction", to_string(t.direction)},
                              {"change_percent", t.change_percent},
                              {"significance", t.significance},
                              {"first_half", t.first_half},
                              {"second_half", t.second_half}});
        json predictions = json::array();
        for (const auto &f : r.predictions)
        {
            json pts = json::array();
            for (const auto &p : f.points)
                pts.push_back({{"day", p.day}, {"value", p.value}, {"lower", p.lower}, {"upper", p.upper}});
            predictions.push_back({{"category", f.category}, {"method", f.method}, {"points", pts}});
        }
        j = json{{"period", {{"from_day", r.period.from_day}, {"to_day", r.period.to_day}}},
                 {"kpis",
                  {{"utilization_rate", k.utilization_rate},
                   {"on_time_rate", k.on_time_rate},
                   {"average_travel_minutes", k.average_travel_minutes},
                   {"travel_savings_percent", k.travel_savings_percent},
                   {"jobs_per_technician_day", k.jobs_per_technician_day},
                   {"success_rate", k.success_rate},
                   {"average_confidence", k.average_confidence},
                   {"runs", k.runs},
                   {"outcomes", k.outcomes}}},
                 {"trends", trends},
                 {"predictions", predictions},
                 {"recommendations", r.recommendations}};
    }

    void from_json(const json &j, AnalyticsPeriod &p)
    {
        p.from_day = j.at("from_day").get<int>();
        p.to_day = j.at("to_day").get<int>();
    }

    void from_json(const json &j, AnalyticsFilters &f)
    {
        get_optional(j, "technician_id", f.technician_id);
        get_optional(j, "category", f.category);
    }

    void from_json(const json &j, OptimizeRequest &r)
    {
        r.jobs = j.value("jobs", std::vector<Job>{});
        r.technicians = j.value("technicians", std::vector<Technician>{});
        r.constraints = j.contains("constraints") ? j["constraints"].get<ConstraintSet>() : ConstraintSet{};
        r.horizon = j.contains("horizon") ? j["horizon"].get<TimeWindow>() : TimeWindow{0, MINUTES_PER_DAY};
        r.planning_day = j.value("planning_day", 0);
        r.now_minute = j.value("now_minute", r.horizon.start);
        get_optional(j, "baseline_travel_minutes", r.baseline_travel_minutes);
        get_optional(j, "time_budget_seconds", r.time_budget_seconds);
        r.commit = j.value("commit", true);
    }

    void to_json(json &j, const OptimizeResponse &r)
    {
        j = json{{"run_id", r.run_id},
                 {"assignments", r.assignments},
                 {"unscheduled", r.unscheduled},
                 {"metrics", r.metrics},
                 {"warnings", r.warnings},
                 {"degraded", r.degraded},
                 {"timed_out", r.timed_out},
                 {"status", to_string(r.status)},
                 {"committed", r.committed}};
    }

    void from_json(const json &j, AdaptRequest &r)
    {
        r.event = j.at("event").get<DisruptionEvent>();
        r.preferences = j.contains("preferences") ? j["preferences"].get<AdaptationPreferences>()
                                                  : AdaptationPreferences{};
        r.now_minute = j.value("now_minute", 0);
    }

    // ---- files ----

    json load_json(const std::string &path)
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error("Cannot open file: " + path);
        json j;
        in >> j;
        return j;
    }

    void save_json(const std::string &path, const json &j)
    {
        std::ofstream out(path);
        if (!out)
            throw std::runtime_error("Cannot open " + path + " for writing.");
        out << j.dump(2) << "\n";
    }

} // namespace fsched
