#include "routing_seed.h"

#include <algorithm>
#include <vector>

#include <ortools/constraint_solver/routing.h>
#include <ortools/constraint_solver/routing_index_manager.h>
#include <ortools/constraint_solver/routing_parameters.h>

#include "log.h"

using operations_research::RoutingIndexManager;
using operations_research::RoutingModel;
using operations_research::RoutingSearchParameters;

namespace fsched
{

    std::optional<Plan> routing_seed(const Problem &p, int time_limit_ms, bool log_search)
    {
        const int T = p.T();
        if (T == 0)
            return std::nullopt;

        // Jobs the model can place at all; the rest stay for the greedy pass.
        std::vector<int> model_jobs;
        std::vector<std::vector<int>> allowed;
        for (int j = 0; j < p.J(); ++j)
        {
            const Job &job = p.jobs[j];
            if (job.window.end - job.duration_minutes < p.min_start[j])
                continue;
            std::vector<int> vs;
            for (int t = 0; t < T; ++t)
                if (static_candidate(p, t, j))
                    vs.push_back(t);
            if (vs.empty())
                continue; // an empty allowed list would mean "any vehicle"
            model_jobs.push_back(j);
            allowed.push_back(std::move(vs));
        }
        if (model_jobs.empty())
        {
            Plan empty;
            empty.routes.assign(T, {});
            return empty;
        }

        // Nodes: 0..T-1 technician starts, T..T+K-1 jobs, T+K shared end.
        const int K = (int)model_jobs.size();
        const int N = T + K + 1;
        const int END = T + K;

        auto matrix_node = [&](int node) -> int
        {
            return node < T ? p.tech_node(node) : p.job_node(model_jobs[node - T]);
        };
        auto service = [&](int node) -> int
        {
            return (node >= T && node < END) ? p.jobs[model_jobs[node - T]].duration_minutes : 0;
        };

        const int64_t horizon = 2 * MINUTES_PER_DAY;
        const int64_t infeasible = horizon + 1;

        std::vector<RoutingIndexManager::NodeIndex> starts, ends;
        for (int t = 0; t < T; ++t)
        {
            starts.emplace_back(t);
            ends.emplace_back(END);
        }
        RoutingIndexManager manager(N, T, starts, ends);
        RoutingModel routing(manager);

        // Travel (minutes), arc cost
        auto travel = [&](int from, int to) -> int64_t
        {
            if (to == END || from == END)
                return 0;
            return p.leg(matrix_node(from), matrix_node(to));
        };
        const int dist_cb = routing.RegisterTransitCallback(
            [&manager, &travel](int64_t from_index, int64_t to_index) -> int64_t
            {
                const int from = manager.IndexToNode(from_index).value();
                const int to = manager.IndexToNode(to_index).value();
                return travel(from, to);
            });
        routing.SetArcCostEvaluatorOfAllVehicles(dist_cb);

        // Time = travel + service(from) + delay before the destination
        const int time_cb = routing.RegisterTransitCallback(
            [&](int64_t from_index, int64_t to_index) -> int64_t
            {
                const int from = manager.IndexToNode(from_index).value();
                const int to = manager.IndexToNode(to_index).value();
                const int64_t tr = travel(from, to);
                if (to != END && tr > p.constraints.max_travel_time)
                    return infeasible;
                const int64_t delay = (to >= T && to < END) ? p.delay_before[model_jobs[to - T]] : 0;
                return tr + service(from) + delay;
            });

        routing.AddDimension(time_cb, /*slack_max=*/horizon, /*capacity=*/horizon,
                             /*fix_start_cumul_to_zero=*/false, "Time");
        auto *time_dim = routing.GetMutableDimension("Time");

        for (int k = 0; k < K; ++k)
        {
            const int j = model_jobs[k];
            const Job &job = p.jobs[j];
            const int64_t idx = manager.NodeToIndex(RoutingIndexManager::NodeIndex(T + k));
            time_dim->CumulVar(idx)->SetRange(p.min_start[j], job.window.end - job.duration_minutes);
            routing.SetAllowedVehiclesForIndex(allowed[k], idx);
            routing.AddDisjunction({idx}, 100000 * static_cast<int64_t>(job.priority));
        }
        for (int t = 0; t < T; ++t)
        {
            const int64_t limit = p.shift[t].end + p.overtime_cap[t];
            time_dim->CumulVar(routing.Start(t))->SetRange(p.shift[t].start, limit);
            time_dim->CumulVar(routing.End(t))->SetRange(p.shift[t].start, limit);
        }

        // Job count per technician
        const int count_cb = routing.RegisterUnaryTransitCallback(
            [&manager, T, END](int64_t from_index) -> int64_t
            {
                const int node = manager.IndexToNode(from_index).value();
                return (node >= T && node < END) ? 1 : 0;
            });
        std::vector<int64_t> caps;
        for (int t = 0; t < T; ++t)
            caps.push_back(std::max(0, p.cap[t]));
        routing.AddDimensionWithVehicleCapacity(count_cb, 0, caps, true, "Count");

        RoutingSearchParameters sp = operations_research::DefaultRoutingSearchParameters();
        sp.set_first_solution_strategy(operations_research::FirstSolutionStrategy::PARALLEL_CHEAPEST_INSERTION);
        sp.set_local_search_metaheuristic(operations_research::LocalSearchMetaheuristic::GREEDY_DESCENT);
        sp.mutable_time_limit()->set_seconds(time_limit_ms / 1000);
        sp.mutable_time_limit()->set_nanos((time_limit_ms % 1000) * 1000000);
        sp.set_log_search(log_search);

        const operations_research::Assignment *sol = routing.SolveWithParameters(sp);
        if (!sol)
        {
            FSWARN("[routing_seed] no solution: techs=%d jobs=%d limit=%dms\n", T, K, time_limit_ms);
            return std::nullopt;
        }

        Plan plan;
        plan.routes.assign(T, {});
        int placed = 0;
        for (int t = 0; t < T; ++t)
        {
            int64_t idx = sol->Value(routing.NextVar(routing.Start(t)));
            while (!routing.IsEnd(idx))
            {
                const int node = manager.IndexToNode(idx).value();
                plan.routes[t].push_back(model_jobs[node - T]);
                ++placed;
                idx = sol->Value(routing.NextVar(idx));
            }
        }
        FSLOG("[routing_seed] placed=%d/%d of %d jobs\n", placed, K, p.J());
        return plan;
    }

} // namespace fsched
