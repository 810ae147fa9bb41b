#include "config.h"

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "errors.h"

namespace fsched
{

    using json = nlohmann::json;

    namespace
    {

        // A key of the wrong JSON type is reported with the other violations.
        template <typename T>
        void read_key(const json &j, const char *key, T &field, std::vector<std::string> &bad)
        {
            try
            {
                field = j.value(key, field);
            }
            catch (const json::type_error &)
            {
                bad.push_back(std::string(key) + " has the wrong type (" + j.at(key).type_name() + ")");
            }
        }

    } // namespace

    EngineConfig parse_engine_config(const json &j)
    {
        if (!j.is_object())
            throw ValidationError({"config: expected a JSON object"});

        EngineConfig c;
        std::vector<std::string> bad;
        read_key(j, "TIME_BUDGET_SECONDS", c.time_budget_seconds, bad);
        read_key(j, "MAX_ITERATIONS", c.max_iterations, bad);
        read_key(j, "TRAVEL_TIMEOUT_MS", c.travel_timeout_ms, bad);
        read_key(j, "WEATHER_TIMEOUT_MS", c.weather_timeout_ms, bad);
        read_key(j, "AVERAGE_SPEED_KMH", c.average_speed_kmh, bad);
        read_key(j, "LOCATION_STALENESS_MINUTES", c.location_staleness_minutes, bad);
        read_key(j, "RUN_RETENTION_DAYS", c.run_retention_days, bad);
        read_key(j, "ALTERNATIVES_PER_ASSIGNMENT", c.alternatives_per_assignment, bad);
        read_key(j, "PREEMPTION_WAIT_MS", c.preemption_wait_ms, bad);
        read_key(j, "ADAPT_ITERATIONS", c.adapt_iterations, bad);
        read_key(j, "ADAPT_TIME_BUDGET_MS", c.adapt_time_budget_ms, bad);
        read_key(j, "FORECAST_WINDOW_DAYS", c.forecast_window_days, bad);
        read_key(j, "FORECAST_HORIZON_DAYS", c.forecast_horizon_days, bad);
        read_key(j, "SMOOTHING_ALPHA", c.smoothing_alpha, bad);
        read_key(j, "ON_TIME_GRACE_MINUTES", c.on_time_grace_minutes, bad);
        read_key(j, "TRAVEL_CACHE_CAPACITY", c.travel_cache_capacity, bad);
        read_key(j, "CONSTRUCTION", c.construction, bad);
        read_key(j, "VERBOSE", c.verbose, bad);

        if (c.time_budget_seconds <= 0)
            bad.push_back("TIME_BUDGET_SECONDS must be > 0");
        if (c.max_iterations < 0)
            bad.push_back("MAX_ITERATIONS must be >= 0");
        if (c.travel_timeout_ms <= 0)
            bad.push_back("TRAVEL_TIMEOUT_MS must be > 0");
        if (c.weather_timeout_ms <= 0)
            bad.push_back("WEATHER_TIMEOUT_MS must be > 0");
        if (!(c.average_speed_kmh > 0.0))
            bad.push_back("AVERAGE_SPEED_KMH must be > 0");
        if (c.location_staleness_minutes < 0)
            bad.push_back("LOCATION_STALENESS_MINUTES must be >= 0");
        if (c.run_retention_days <= 0)
            bad.push_back("RUN_RETENTION_DAYS must be > 0");
        if (c.alternatives_per_assignment < 0)
            bad.push_back("ALTERNATIVES_PER_ASSIGNMENT must be >= 0");
        if (c.preemption_wait_ms < 0)
            bad.push_back("PREEMPTION_WAIT_MS must be >= 0");
        if (c.adapt_iterations < 0)
            bad.push_back("ADAPT_ITERATIONS must be >= 0");
        if (c.adapt_time_budget_ms <= 0)
            bad.push_back("ADAPT_TIME_BUDGET_MS must be > 0");
        if (c.forecast_window_days < 2)
            bad.push_back("FORECAST_WINDOW_DAYS must be >= 2");
        if (c.forecast_horizon_days < 1)
            bad.push_back("FORECAST_HORIZON_DAYS must be >= 1");
        if (!(c.smoothing_alpha > 0.0 && c.smoothing_alpha <= 1.0))
            bad.push_back("SMOOTHING_ALPHA must be in (0,1]");
        if (c.on_time_grace_minutes < 0)
            bad.push_back("ON_TIME_GRACE_MINUTES must be >= 0");
        if (c.travel_cache_capacity < 0)
            bad.push_back("TRAVEL_CACHE_CAPACITY must be >= 0");
        if (c.construction != "greedy" && c.construction != "routing_model")
            bad.push_back("CONSTRUCTION must be greedy or routing_model");
        if (!bad.empty())
            throw ValidationError(bad);
        return c;
    }

    EngineConfig load_engine_config(const std::string &path)
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error("Cannot open file: " + path);
        json j;
        in >> j;
        return parse_engine_config(j);
    }

} // namespace fsched
