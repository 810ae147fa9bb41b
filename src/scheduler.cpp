#include "scheduler.h"

#include <algorithm>
#include <chrono>
#include <climits>
#include <stdexcept>

#include "constraints.h"
#include "errors.h"
#include "json_io.h"
#include "log.h"
#include "optimizer.h"
#include "problem.h"
#include "scorer.h"
#include "utils.h"

namespace fsched
{

    namespace
    {

        std::string request_hash(const std::string &tenant, const OptimizeRequest &req)
        {
            json j = {{"tenant", tenant},
                      {"jobs", req.jobs},
                      {"technicians", req.technicians},
                      {"constraints", req.constraints},
                      {"horizon", req.horizon},
                      {"planning_day", req.planning_day},
                      {"now_minute", req.now_minute}};
            return hex64(fnv1a(j.dump()));
        }

        bool closed(JobStatus s) { return s == JobStatus::Completed || s == JobStatus::Cancelled; }

        // Takes a job off its route. The neighbours keep their slots; the leg that
        // now joins them is looked up so both sides record the same travel.
        void drop_from_route(Schedule &s, const std::string &job_id, TravelTimeService &travel)
        {
            for (auto &t : s.technicians)
            {
                auto it = std::find(t.route.begin(), t.route.end(), job_id);
                if (it == t.route.end())
                    continue;
                Assignment *prev = it == t.route.begin() ? nullptr : &s.assignments.at(*(it - 1));
                it = t.route.erase(it);
                if (it == t.route.end())
                {
                    if (prev)
                        prev->travel_to_next = 0;
                    continue;
                }

                GeoPoint from = t.home;
                auto sp = s.start_points.find(t.id);
                if (prev)
                    from = s.jobs.at(prev->job_id).location;
                else if (sp != s.start_points.end())
                    from = sp->second;
                const TravelBatch leg = travel.batch({{from, s.jobs.at(*it).location}});
                s.degraded = s.degraded || leg.degraded;
                s.assignments.at(*it).travel_from_previous = leg.minutes.front();
                if (prev)
                    prev->travel_to_next = leg.minutes.front();
            }
            s.assignments.erase(job_id);
        }

    } // namespace

    SchedulingService::SchedulingService(const EngineConfig &cfg, std::shared_ptr<TravelTimeProvider> travel,
                                         std::shared_ptr<WeatherProvider> weather,
                                         std::shared_ptr<NotificationDispatcher> notifier,
                                         std::shared_ptr<RunStore> runs)
        : cfg_(cfg),
          travel_(std::move(travel), TravelSettings{cfg.travel_timeout_ms, cfg.average_speed_kmh,
                                                    static_cast<size_t>(cfg.travel_cache_capacity)}),
          weather_(std::move(weather)),
          notifier_(std::move(notifier)),
          runs_(runs ? std::move(runs) : std::make_shared<RunStore>(cfg.run_retention_days))
    {
    }

    SchedulingService::TenantState &SchedulingService::tenant_state(const std::string &tenant)
    {
        std::lock_guard<std::mutex> lk(tenants_mu_);
        auto &slot = tenants_[tenant];
        if (!slot)
            slot.reset(new TenantState());
        return *slot;
    }

    const SchedulingService::TenantState *SchedulingService::find_tenant(const std::string &tenant) const
    {
        std::lock_guard<std::mutex> lk(tenants_mu_);
        auto it = tenants_.find(tenant);
        return it == tenants_.end() ? nullptr : it->second.get();
    }

    void SchedulingService::commit(TenantState &ts, const Schedule &s)
    {
        auto snap = std::make_shared<const Schedule>(s);
        std::lock_guard<std::mutex> lk(ts.mu);
        ts.committed = std::move(snap);
        FSLOG("[commit] tenant %s version %d (%zu assignments)\n", s.tenant_id.c_str(), s.version,
              s.assignments.size());
    }

    std::string SchedulingService::next_run_id()
    {
        return "run-" + std::to_string(WallMillis()) + "-" + std::to_string(++run_seq_);
    }

    std::map<std::string, double> SchedulingService::tenant_on_time_rates(const std::string &tenant) const
    {
        return on_time_rates(runs_->outcomes(tenant, INT_MIN, INT_MAX), cfg_.on_time_grace_minutes);
    }

    // ---- optimize ----

    OptimizeResponse SchedulingService::optimize(const std::string &tenant, const OptimizeRequest &req)
    {
        std::vector<std::string> bad = request_violations(req.jobs, req.technicians, req.horizon);
        const std::vector<std::string> cbad = constraint_violations(req.constraints);
        bad.insert(bad.end(), cbad.begin(), cbad.end());
        if (tenant.empty())
            bad.push_back("tenant: must not be empty");
        if (req.time_budget_seconds && *req.time_budget_seconds <= 0)
            bad.push_back("time_budget_seconds: must be positive");
        if (req.baseline_travel_minutes && *req.baseline_travel_minutes < 0)
            bad.push_back("baseline_travel_minutes: must not be negative");
        if (!bad.empty())
            throw ValidationError(bad);
        const ConstraintSet constraints = normalize_constraints(req.constraints);

        TenantState &ts = tenant_state(tenant);
        std::unique_lock<std::timed_mutex> lease(ts.lease, std::try_to_lock);
        if (!lease.owns_lock())
        {
            FSLOG("[optimize] tenant %s busy\n", tenant.c_str());
            throw BusyError(tenant);
        }

        OptimizationRun run;
        run.id = next_run_id();
        run.tenant_id = tenant;
        run.created_ms = WallMillis();
        run.planning_day = req.planning_day;
        run.input_hash = request_hash(tenant, req);
        run.algorithm_version = ALGORITHM_VERSION;
        run.status = RunStatus::Running;
        runs_->put(run);

        auto token = std::make_shared<CancellationToken>();
        {
            std::lock_guard<std::mutex> lk(tokens_mu_);
            running_[run.id] = token;
        }
        {
            std::lock_guard<std::mutex> lk(ts.mu);
            ts.active = token;
            ts.active_run = run.id;
        }

        // Unregisters the run on every exit path.
        struct ActiveRun
        {
            SchedulingService &svc;
            TenantState &ts;
            const std::string &id;
            ~ActiveRun()
            {
                {
                    std::lock_guard<std::mutex> lk(svc.tokens_mu_);
                    svc.running_.erase(id);
                }
                std::lock_guard<std::mutex> lk(ts.mu);
                if (ts.active_run == id)
                {
                    ts.active.reset();
                    ts.active_run.clear();
                }
            }
        } active{*this, ts, run.id};

        FSLOG("[optimize] tenant %s run %s: %zu jobs, %zu technicians, hash %s\n", tenant.c_str(), run.id.c_str(),
              req.jobs.size(), req.technicians.size(), run.input_hash.c_str());

        OptimizeResponse resp;
        resp.run_id = run.id;
        try
        {
            ProblemInput in;
            for (const auto &j : req.jobs)
                if (!closed(j.status))
                    in.jobs.push_back(j);
            in.technicians = req.technicians;
            in.constraints = constraints;
            in.horizon = req.horizon;
            in.now_minute = req.now_minute;
            in.staleness_minutes = cfg_.location_staleness_minutes;
            in.locations = locations_.snapshot();
            in.on_time_rates = tenant_on_time_rates(tenant);
            const Problem p = build_problem(in, travel_);

            OptimizeOptions opts;
            opts.time_budget_ms = 1000 * req.time_budget_seconds.value_or(cfg_.time_budget_seconds);
            opts.max_iterations = cfg_.max_iterations;
            opts.alternatives = cfg_.alternatives_per_assignment;
            opts.construction = cfg_.construction;
            opts.baseline_travel_minutes = req.baseline_travel_minutes;
            opts.cancel = token.get();
            const OptimizeResult r = fsched::optimize(p, opts);

            for (const auto &job : p.jobs)
                ++run.demand_by_category[job_category(job)];
            run.assignments = r.assignments;
            run.metrics = r.metrics;

            resp.assignments = r.assignments;
            resp.unscheduled = r.unscheduled;
            resp.metrics = r.metrics;
            resp.warnings = r.warnings;
            resp.degraded = r.degraded;
            resp.timed_out = r.timed_out;

            Schedule next;
            if (req.commit && !r.cancelled)
            {
                next.tenant_id = tenant;
                next.run_id = run.id;
                next.planning_day = req.planning_day;
                next.horizon = req.horizon;
                next.constraints = constraints;
                next.degraded = r.degraded;
                next.technicians = p.techs;
                for (int t = 0; t < p.T(); ++t)
                {
                    next.technicians[t].route.clear();
                    for (int j : r.plan.routes[t])
                        next.technicians[t].route.push_back(p.jobs[j].id);
                    next.start_points[p.techs[t].id] = p.start_points[t];
                }
                for (const auto &a : r.assignments)
                    next.assignments[a.job_id] = a;
                for (Job job : req.jobs)
                {
                    if (closed(job.status))
                        next.archived.push_back(job.id);
                    else if (const Assignment *a = next.assignment(job.id))
                        job.status = a->confidence < AT_RISK_THRESHOLD ? JobStatus::AtRisk : JobStatus::Scheduled;
                    else
                        job.status = JobStatus::Unscheduled;
                    next.jobs[job.id] = job;
                }
            }

            // Cancellation and commit are decided under the tenant lock, so a
            // cancelled run never installs anything.
            {
                std::lock_guard<std::mutex> lk(ts.mu);
                if (r.cancelled || token->cancelled())
                {
                    resp.status = RunStatus::Cancelled;
                }
                else
                {
                    resp.status = RunStatus::Completed;
                    if (req.commit)
                    {
                        next.version = ts.committed ? ts.committed->version + 1 : 1;
                        ts.committed = std::make_shared<const Schedule>(std::move(next));
                        resp.committed = true;
                    }
                }
                ts.active.reset();
                ts.active_run.clear();
            }
        }
        catch (const std::exception &e)
        {
            FSWARN("[optimize] run %s failed: %s\n", run.id.c_str(), e.what());
            run.status = RunStatus::Failed;
            run.failure_reason = e.what();
            runs_->put(run);
            throw;
        }

        run.status = resp.status;
        if (resp.status == RunStatus::Cancelled)
        {
            std::optional<OptimizationRun> prev = runs_->get(run.id);
            run.failure_reason = prev && !prev->failure_reason.empty() ? prev->failure_reason : "cancelled";
        }
        runs_->put(run);
        runs_->prune(WallMillis());

        FSLOG("[optimize] run %s %s: %d/%d scheduled, travel %d min, %lld ms%s%s\n", run.id.c_str(),
              to_string(resp.status), resp.metrics.scheduled_jobs, resp.metrics.total_jobs,
              resp.metrics.total_travel_minutes, resp.metrics.elapsed_ms, resp.degraded ? ", degraded" : "",
              resp.committed ? ", committed" : "");
        return resp;
    }

    // ---- adapt ----

    AdaptationResult SchedulingService::adapt(const std::string &tenant, const AdaptRequest &req)
    {
        std::shared_ptr<const Schedule> snap = committed_schedule(tenant);
        if (!snap)
            throw NotFoundError("no committed schedule for tenant " + tenant);

        std::vector<std::string> bad = preference_violations(req.preferences);
        const std::vector<std::string> ev_bad = event_violations(*snap, req.event);
        bad.insert(bad.end(), ev_bad.begin(), ev_bad.end());
        if (!bad.empty())
            throw ValidationError(bad);

        TenantState &ts = tenant_state(tenant);
        std::unique_lock<std::timed_mutex> lease(ts.lease, std::defer_lock);
        if (is_high_priority(req.event))
        {
            std::string preempted;
            {
                std::lock_guard<std::mutex> lk(ts.mu);
                if (ts.active)
                {
                    ts.active->cancel();
                    preempted = ts.active_run;
                    runs_->set_status(preempted, RunStatus::Cancelled, "preempted by " +
                                                                           std::string(to_string(req.event.type)));
                }
            }
            if (!preempted.empty())
                FSWARN("[adapt] %s preempts run %s\n", to_string(req.event.type), preempted.c_str());
            if (!lease.try_lock_for(std::chrono::milliseconds(cfg_.preemption_wait_ms)))
                throw BusyError(tenant);
        }
        else if (!lease.try_lock())
        {
            throw BusyError(tenant);
        }

        // A preempted run never commits, but another writer may have.
        snap = committed_schedule(tenant);

        AdaptContext ctx;
        ctx.now_minute = req.now_minute;
        ctx.adapt_iterations = cfg_.adapt_iterations;
        ctx.time_budget_ms = cfg_.adapt_time_budget_ms;
        ctx.weather_timeout_ms = cfg_.weather_timeout_ms;
        ctx.alternatives = cfg_.alternatives_per_assignment;
        ctx.on_time_rates = tenant_on_time_rates(tenant);

        DisruptionHandler handler(travel_, weather_, notifier_.get());
        return handler.adapt(*snap, req.event, req.preferences, ctx,
                             [this, &ts](const Schedule &s) { commit(ts, s); });
    }

    // ---- the rest ----

    void SchedulingService::update_location(const std::string &technician_id, const GeoPoint &point, int minute,
                                            const std::string &status)
    {
        if (technician_id.empty())
            throw ValidationError({"technician_id: must not be empty"});
        if (point.lat < -90.0 || point.lat > 90.0 || point.lng < -180.0 || point.lng > 180.0)
            throw ValidationError({"location: out of range"});
        locations_.update(technician_id, point, minute, status);
    }

    AnalyticsReport SchedulingService::get_analytics(const std::string &tenant, const AnalyticsPeriod &period,
                                                     const AnalyticsFilters &filters) const
    {
        if (period.from_day > period.to_day)
            throw ValidationError({"period: from_day after to_day"});
        AnalyticsSettings s;
        s.on_time_grace_minutes = cfg_.on_time_grace_minutes;
        s.forecast_window_days = cfg_.forecast_window_days;
        s.forecast_horizon_days = cfg_.forecast_horizon_days;
        s.smoothing_alpha = cfg_.smoothing_alpha;
        return compute_analytics(runs_->list(tenant, period.from_day, period.to_day),
                                 runs_->outcomes(tenant, period.from_day, period.to_day), period, filters, s);
    }

    void SchedulingService::cancel_run(const std::string &run_id)
    {
        std::shared_ptr<CancellationToken> token;
        {
            std::lock_guard<std::mutex> lk(tokens_mu_);
            auto it = running_.find(run_id);
            if (it != running_.end())
                token = it->second;
        }
        if (token)
        {
            token->cancel();
            FSLOG("[cancel] run %s\n", run_id.c_str());
            return;
        }
        if (!runs_->get(run_id))
            throw NotFoundError("unknown run " + run_id);
    }

    void SchedulingService::update_job_status(const std::string &tenant, const std::string &job_id, JobStatus status,
                                              const std::optional<JobOutcome> &outcome)
    {
        if (!find_tenant(tenant))
            throw NotFoundError("unknown tenant " + tenant);
        TenantState &ts = tenant_state(tenant);
        std::unique_lock<std::timed_mutex> lease(ts.lease, std::try_to_lock);
        if (!lease.owns_lock())
            throw BusyError(tenant);

        std::shared_ptr<const Schedule> snap = committed_schedule(tenant);
        if (!snap)
            throw NotFoundError("no committed schedule for tenant " + tenant);
        auto jt = snap->jobs.find(job_id);
        if (jt == snap->jobs.end())
            throw NotFoundError("unknown job " + job_id);
        if (closed(jt->second.status))
            throw ValidationError({"job " + job_id + " is already " + to_string(jt->second.status)});

        Schedule next = *snap;
        next.version = snap->version + 1;
        const Assignment *a = snap->assignment(job_id);
        switch (status)
        {
        case JobStatus::Completed:
        case JobStatus::Cancelled:
            drop_from_route(next, job_id, travel_);
            next.archived.push_back(job_id);
            break;
        case JobStatus::Unscheduled:
            drop_from_route(next, job_id, travel_);
            break;
        case JobStatus::Scheduled:
        case JobStatus::AtRisk:
            if (!a)
                throw ValidationError({"job " + job_id + " has no assignment"});
            break;
        }
        next.jobs[job_id].status = status;

        if (status == JobStatus::Completed && (outcome || a))
        {
            JobOutcome o;
            if (outcome)
            {
                o = *outcome;
            }
            else
            {
                o.technician_id = a->technician_id;
                o.scheduled_start = a->scheduled_start;
                o.actual_start = a->scheduled_start;
                o.actual_end = a->scheduled_end;
                o.planning_day = snap->planning_day;
            }
            o.job_id = job_id;
            o.completed = true;
            runs_->add_outcome(tenant, o);
        }
        commit(ts, next);
    }

    void SchedulingService::record_outcome(const std::string &tenant, const JobOutcome &outcome)
    {
        if (outcome.job_id.empty() || outcome.technician_id.empty())
            throw ValidationError({"outcome: job_id and technician_id are required"});
        runs_->add_outcome(tenant, outcome);
    }

    std::shared_ptr<const Schedule> SchedulingService::committed_schedule(const std::string &tenant) const
    {
        const TenantState *ts = find_tenant(tenant);
        if (!ts)
            return nullptr;
        std::lock_guard<std::mutex> lk(ts->mu);
        return ts->committed;
    }

    void SchedulingService::restore_schedule(const std::string &tenant, const Schedule &schedule)
    {
        TenantState &ts = tenant_state(tenant);
        std::unique_lock<std::timed_mutex> lease(ts.lease, std::try_to_lock);
        if (!lease.owns_lock())
            throw BusyError(tenant);
        Schedule s = schedule;
        s.tenant_id = tenant;
        commit(ts, s);
    }

} // namespace fsched
