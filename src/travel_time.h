// travel_time.h
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "travel_cache.h"
#include "types.h"

namespace fsched {

struct OdPair {
  GeoPoint origin;
  GeoPoint destination;
};

// External travel-time source. One value (minutes) per pair, same order.
// Implementations must be safe to call from a worker thread; a call that
// overruns the timeout keeps running detached.
class TravelTimeProvider {
 public:
  virtual ~TravelTimeProvider() = default;
  virtual std::vector<double> travel_minutes(const std::vector<OdPair>& pairs) = 0;
};

// Deterministic built-in provider: great-circle distance at a fixed speed.
class GreatCircleProvider : public TravelTimeProvider {
 public:
  explicit GreatCircleProvider(double speed_kmh = 30.0) : speed_kmh_(speed_kmh) {}
  std::vector<double> travel_minutes(const std::vector<OdPair>& pairs) override;

 private:
  double speed_kmh_;
};

// Distance estimate used when the provider cannot be trusted; rounded up.
int fallback_minutes(const GeoPoint& from, const GeoPoint& to, double speed_kmh);

struct TravelBatch {
  std::vector<int> minutes;
  bool degraded = false;
  std::string reason;  // why the fallback was used
};

struct TravelMatrix {
  TimeMatrix matrix;
  bool degraded = false;
};

struct TravelSettings {
  int timeout_ms = 5000;
  double average_speed_kmh = 30.0;
  size_t cache_capacity = 4096;
};

// Bounded-time adapter around a provider, with fallback and LRU cache.
class TravelTimeService {
 public:
  TravelTimeService(std::shared_ptr<TravelTimeProvider> provider, const TravelSettings& s);

  TravelBatch batch(const std::vector<OdPair>& pairs);

  // Full matrix over the given points; diagonal is 0.
  TravelMatrix build_time_matrix(const std::vector<GeoPoint>& points);

  const TravelSettings& settings() const { return settings_; }
  const TravelCache& cache() const { return cache_; }

 private:
  std::vector<double> call_with_timeout(const std::vector<OdPair>& pairs, std::string& failure);

  std::shared_ptr<TravelTimeProvider> provider_;
  TravelSettings settings_;
  TravelCache cache_;
};

}  // namespace fsched
