#include "travel_time.h"

#include <chrono>
#include <cmath>
#include <future>
#include <stdexcept>
#include <thread>

#include "log.h"
#include "utils.h"

namespace fsched
{

    std::vector<double> GreatCircleProvider::travel_minutes(const std::vector<OdPair> &pairs)
    {
        std::vector<double> out;
        out.reserve(pairs.size());
        for (const auto &p : pairs)
            out.push_back(haversine_km(p.origin, p.destination) / speed_kmh_ * 60.0);
        return out;
    }

    int fallback_minutes(const GeoPoint &from, const GeoPoint &to, double speed_kmh)
    {
        const double km = haversine_km(from, to);
        return static_cast<int>(std::ceil(km / speed_kmh * 60.0 - 1e-9));
    }

    TravelTimeService::TravelTimeService(std::shared_ptr<TravelTimeProvider> provider, const TravelSettings &s)
        : provider_(std::move(provider)), settings_(s), cache_(s.cache_capacity)
    {
    }

    // Runs the provider on a detached worker so a hung call cannot hold the caller
    // past the timeout. Returns an empty vector and sets failure on any problem.
    std::vector<double> TravelTimeService::call_with_timeout(const std::vector<OdPair> &pairs, std::string &failure)
    {
        if (!provider_)
        {
            failure = "no provider";
            return {};
        }

        auto promise = std::make_shared<std::promise<std::vector<double>>>();
        std::future<std::vector<double>> fut = promise->get_future();
        std::shared_ptr<TravelTimeProvider> provider = provider_;
        std::thread([promise, provider, pairs]()
                    {
                        try
                        {
                            promise->set_value(provider->travel_minutes(pairs));
                        }
                        catch (...)
                        {
                            promise->set_exception(std::current_exception());
                        } })
            .detach();

        if (fut.wait_for(std::chrono::milliseconds(settings_.timeout_ms)) != std::future_status::ready)
        {
            failure = "timeout after " + std::to_string(settings_.timeout_ms) + " ms";
            return {};
        }

        std::vector<double> vals;
        try
        {
            vals = fut.get();
        }
        catch (const std::exception &e)
        {
            failure = std::string("provider error: ") + e.what();
            return {};
        }

        if (vals.size() != pairs.size())
        {
            failure = "provider returned " + std::to_string(vals.size()) + " values for " +
                      std::to_string(pairs.size()) + " pairs";
            return {};
        }
        for (double v : vals)
        {
            if (!std::isfinite(v) || v < 0.0)
            {
                failure = "provider returned a negative or non-finite value";
                return {};
            }
        }
        return vals;
    }

    TravelBatch TravelTimeService::batch(const std::vector<OdPair> &pairs)
    {
        TravelBatch out;
        out.minutes.assign(pairs.size(), 0);
        if (pairs.empty())
            return out;

        // Serve what we can from the cache; ask the provider for the rest.
        std::vector<std::string> keys(pairs.size());
        std::vector<int> miss_idx;
        std::vector<OdPair> miss;
        for (size_t i = 0; i < pairs.size(); ++i)
        {
            keys[i] = TravelCache::key(pairs[i].origin, pairs[i].destination);
            double v = 0.0;
            if (cache_.get(keys[i], v))
            {
                out.minutes[i] = static_cast<int>(std::ceil(v - 1e-9));
            }
            else
            {
                miss_idx.push_back(static_cast<int>(i));
                miss.push_back(pairs[i]);
            }
        }
        if (miss.empty())
            return out;

        std::string failure;
        std::vector<double> vals = call_with_timeout(miss, failure);
        if (!failure.empty())
        {
            FSWARN("[travel] degraded: %s; great-circle fallback for %zu pairs\n", failure.c_str(), pairs.size());
            out.degraded = true;
            out.reason = failure;
            for (size_t i = 0; i < pairs.size(); ++i)
                out.minutes[i] = fallback_minutes(pairs[i].origin, pairs[i].destination, settings_.average_speed_kmh);
            return out;
        }

        for (size_t k = 0; k < miss_idx.size(); ++k)
        {
            const int i = miss_idx[k];
            cache_.put(keys[i], vals[k]);
            out.minutes[i] = static_cast<int>(std::ceil(vals[k] - 1e-9));
        }
        FSLOG("[travel] batch=%zu provider=%zu cached=%zu\n", pairs.size(), miss.size(), pairs.size() - miss.size());
        return out;
    }

    TravelMatrix TravelTimeService::build_time_matrix(const std::vector<GeoPoint> &points)
    {
        TravelMatrix out;
        const int n = static_cast<int>(points.size());
        out.matrix.n = n;
        out.matrix.m.assign(static_cast<size_t>(n) * n, 0);

        std::vector<OdPair> pairs;
        pairs.reserve(static_cast<size_t>(n) * (n > 0 ? n - 1 : 0));
        for (int i = 0; i < n; ++i)
            for (int j = 0; j < n; ++j)
                if (i != j)
                    pairs.push_back({points[i], points[j]});

        TravelBatch b = batch(pairs);
        out.degraded = b.degraded;
        size_t k = 0;
        for (int i = 0; i < n; ++i)
            for (int j = 0; j < n; ++j)
                if (i != j)
                    out.matrix.m[i * n + j] = b.minutes[k++];
        return out;
    }

} // namespace fsched
