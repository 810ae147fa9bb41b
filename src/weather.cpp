#include "weather.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <future>
#include <stdexcept>
#include <thread>

#include "log.h"
#include "utils.h"

namespace fsched
{

    WeatherReport fetch_weather(const std::shared_ptr<WeatherProvider> &provider, const GeoPoint &where,
                                int timeout_ms)
    {
        if (!provider)
            return WeatherReport{};

        // Same worker scheme as the travel adapter: a hung provider is left behind.
        auto promise = std::make_shared<std::promise<WeatherReport>>();
        std::future<WeatherReport> fut = promise->get_future();
        std::thread([promise, provider, where]()
                    {
                        try
                        {
                            promise->set_value(provider->current(where));
                        }
                        catch (...)
                        {
                            promise->set_exception(std::current_exception());
                        } })
            .detach();

        if (fut.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready)
        {
            FSWARN("[weather] provider timed out after %d ms; assuming no adverse weather\n", timeout_ms);
            return WeatherReport{};
        }
        try
        {
            return fut.get();
        }
        catch (const std::exception &e)
        {
            FSWARN("[weather] provider failed (%s); assuming no adverse weather\n", e.what());
            return WeatherReport{};
        }
    }

    WeatherAssessment assess_weather(const WeatherReport &w)
    {
        WeatherAssessment a;
        auto raise = [&a](WeatherImpact lvl)
        { a.impact = std::max(a.impact, lvl); };

        if (w.temperature_c < -10.0)
        {
            raise(WeatherImpact::High);
            a.safety.push_back("Extreme cold conditions");
            a.adjustment_minutes += 30;
            a.feasibility -= 0.3;
        }
        else if (w.temperature_c > 35.0)
        {
            raise(WeatherImpact::Moderate);
            a.safety.push_back("High temperature - ensure hydration");
            a.adjustment_minutes += 15;
            a.feasibility -= 0.2;
        }

        switch (w.condition)
        {
        case WeatherCondition::HeavyRain:
            raise(WeatherImpact::High);
            a.actions.push_back("Consider rescheduling outdoor work");
            a.adjustment_minutes += 45;
            a.feasibility -= 0.4;
            break;
        case WeatherCondition::LightRain:
            raise(WeatherImpact::Low);
            a.actions.push_back("Bring weather protection equipment");
            a.adjustment_minutes += 15;
            a.feasibility -= 0.1;
            break;
        case WeatherCondition::Snow:
            raise(WeatherImpact::High);
            a.safety.push_back("Slippery conditions - use caution");
            a.actions.push_back("Allow extra travel time");
            a.adjustment_minutes += 60;
            a.feasibility -= 0.5;
            break;
        case WeatherCondition::Storm:
            raise(WeatherImpact::Severe);
            a.safety.push_back("Dangerous weather conditions");
            a.actions.push_back("Reschedule all outdoor work");
            a.adjustment_minutes += 120;
            a.feasibility = 0.1;
            break;
        default:
            break;
        }

        if (w.wind_kmh > 50.0)
        {
            raise(WeatherImpact::High);
            a.safety.push_back("High wind conditions");
            a.adjustment_minutes += 30;
            a.feasibility -= 0.3;
        }
        if (w.visibility_km < 1.0)
        {
            raise(WeatherImpact::Moderate);
            a.safety.push_back("Poor visibility conditions");
            a.actions.push_back("Use extra lighting and caution");
            a.adjustment_minutes += 20;
            a.feasibility -= 0.2;
        }

        a.feasibility = clampd(a.feasibility, 0.0, 1.0);
        return a;
    }

    std::vector<std::string> weather_recommendations(const WeatherAssessment &a)
    {
        std::vector<std::string> out = a.actions;
        for (const auto &note : a.safety)
            out.push_back("Safety: " + note);
        if (a.feasibility < LOW_WORK_FEASIBILITY)
        {
            char buf[128];
            std::snprintf(buf, sizeof(buf), "Work feasibility %.2f: postpone non-urgent jobs to a better weather window",
                          a.feasibility);
            out.push_back(buf);
        }
        return out;
    }

    const char *to_string(WeatherCondition c)
    {
        switch (c)
        {
        case WeatherCondition::Clear: return "clear";
        case WeatherCondition::Cloudy: return "cloudy";
        case WeatherCondition::LightRain: return "light_rain";
        case WeatherCondition::HeavyRain: return "heavy_rain";
        case WeatherCondition::Snow: return "snow";
        case WeatherCondition::Storm: return "storm";
        case WeatherCondition::Fog: return "fog";
        }
        return "clear";
    }

    const char *to_string(WeatherImpact i)
    {
        switch (i)
        {
        case WeatherImpact::None: return "none";
        case WeatherImpact::Low: return "low";
        case WeatherImpact::Moderate: return "moderate";
        case WeatherImpact::High: return "high";
        case WeatherImpact::Severe: return "severe";
        }
        return "none";
    }

} // namespace fsched
