// weather.h
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "types.h"

namespace fsched {

enum class WeatherCondition { Clear, Cloudy, LightRain, HeavyRain, Snow, Storm, Fog };

struct WeatherReport {
  WeatherCondition condition = WeatherCondition::Clear;
  double temperature_c = 20.0;
  double wind_kmh = 10.0;
  double precipitation_mm = 0.0;
  double visibility_km = 10.0;
};

enum class WeatherImpact { None, Low, Moderate, High, Severe };

struct WeatherAssessment {
  WeatherImpact impact = WeatherImpact::None;
  int adjustment_minutes = 0;
  double feasibility = 1.0;  // [0,1]
  std::vector<std::string> actions;
  std::vector<std::string> safety;
};

// Optional external weather signal. Must be safe to call from a worker thread.
class WeatherProvider {
 public:
  virtual ~WeatherProvider() = default;
  virtual WeatherReport current(const GeoPoint& where) = 0;
};

// Provider answer, or the default clear report when the provider is absent, throws,
// or does not answer within timeout_ms.
WeatherReport fetch_weather(const std::shared_ptr<WeatherProvider>& provider, const GeoPoint& where,
                            int timeout_ms);

WeatherAssessment assess_weather(const WeatherReport& w);

// Below this feasibility outdoor work should move to another window.
constexpr double LOW_WORK_FEASIBILITY = 0.5;

// Actions, then safety notes, then a postponement hint when feasibility is low.
std::vector<std::string> weather_recommendations(const WeatherAssessment& a);

const char* to_string(WeatherCondition c);
const char* to_string(WeatherImpact i);

}  // namespace fsched
