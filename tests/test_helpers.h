// test_helpers.h
#pragma once
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "notification.h"
#include "travel_time.h"
#include "types.h"
#include "weather.h"

namespace fsched {
namespace test {

// Point k of a synthetic map. Travel between points comes from a table, not geometry.
inline GeoPoint node(int k) { return GeoPoint{k * 0.01, 0.0}; }
inline int node_of(const GeoPoint& g) { return static_cast<int>(std::lround(g.lat * 100.0)); }

// Symmetric minutes between map points; unlisted legs take the default.
class TableProvider : public TravelTimeProvider {
 public:
  explicit TableProvider(double default_minutes = 10.0) : default_(default_minutes) {}

  void set(int a, int b, double minutes) {
    legs_[{a, b}] = minutes;
    legs_[{b, a}] = minutes;
  }

  std::vector<double> travel_minutes(const std::vector<OdPair>& pairs) override {
    ++calls_;
    std::vector<double> out;
    for (const auto& p : pairs) {
      const int a = node_of(p.origin), b = node_of(p.destination);
      if (a == b) {
        out.push_back(0.0);
        continue;
      }
      auto it = legs_.find({a, b});
      out.push_back(it == legs_.end() ? default_ : it->second);
    }
    return out;
  }

  int calls() const { return calls_; }

 private:
  double default_;
  std::map<std::pair<int, int>, double> legs_;
  std::atomic<int> calls_{0};
};

class ThrowingProvider : public TravelTimeProvider {
 public:
  std::vector<double> travel_minutes(const std::vector<OdPair>&) override {
    throw std::runtime_error("routing backend unavailable");
  }
};

class ShortProvider : public TravelTimeProvider {
 public:
  std::vector<double> travel_minutes(const std::vector<OdPair>&) override { return {1.0}; }
};

class SlowProvider : public TravelTimeProvider {
 public:
  explicit SlowProvider(int sleep_ms) : sleep_ms_(sleep_ms) {}
  std::vector<double> travel_minutes(const std::vector<OdPair>& pairs) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms_));
    return std::vector<double>(pairs.size(), 5.0);
  }

 private:
  int sleep_ms_;
};

// Holds every call until open(); lets a test keep a run inside its lease.
class GatedProvider : public TravelTimeProvider {
 public:
  explicit GatedProvider(std::shared_ptr<TravelTimeProvider> inner, bool open = false)
      : inner_(std::move(inner)), open_(open) {}

  std::vector<double> travel_minutes(const std::vector<OdPair>& pairs) override {
    {
      std::unique_lock<std::mutex> lk(mu_);
      entered_ = true;
      cv_.notify_all();
      cv_.wait(lk, [this] { return open_; });
    }
    return inner_->travel_minutes(pairs);
  }

  bool wait_entered(int ms) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, std::chrono::milliseconds(ms), [this] { return entered_; });
  }

  void open() {
    std::lock_guard<std::mutex> lk(mu_);
    open_ = true;
    cv_.notify_all();
  }

  void close() {
    std::lock_guard<std::mutex> lk(mu_);
    open_ = false;
    entered_ = false;
  }

 private:
  std::shared_ptr<TravelTimeProvider> inner_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool entered_ = false;
  bool open_;
};

class RecordingDispatcher : public NotificationDispatcher {
 public:
  explicit RecordingDispatcher(bool fail = false) : fail_(fail) {}

  void dispatch(const NotificationPayload& n) override {
    if (fail_) throw std::runtime_error("sms gateway down");
    std::lock_guard<std::mutex> lk(mu_);
    sent_.push_back(n);
  }

  std::vector<NotificationPayload> sent() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sent_;
  }

 private:
  bool fail_;
  mutable std::mutex mu_;
  std::vector<NotificationPayload> sent_;
};

class FixedWeather : public WeatherProvider {
 public:
  explicit FixedWeather(WeatherReport r) : report_(r) {}
  WeatherReport current(const GeoPoint&) override { return report_; }

 private:
  WeatherReport report_;
};

class SlowWeather : public WeatherProvider {
 public:
  SlowWeather(int sleep_ms, WeatherReport r) : sleep_ms_(sleep_ms), report_(r) {}
  WeatherReport current(const GeoPoint&) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms_));
    return report_;
  }

 private:
  int sleep_ms_;
  WeatherReport report_;
};

inline Job make_job(const std::string& id, int at, int duration, int window_start, int window_end,
                    std::vector<std::string> skills = {}, Priority priority = Priority::Medium) {
  Job j;
  j.id = id;
  j.location = node(at);
  j.duration_minutes = duration;
  j.window = TimeWindow{window_start, window_end};
  j.required_skills = std::move(skills);
  j.priority = priority;
  return j;
}

inline Technician make_tech(const std::string& id, int at, int hours_start, int hours_end,
                            std::vector<std::string> skills = {}, int max_jobs = 8) {
  Technician t;
  t.id = id;
  t.home = node(at);
  t.working_hours = TimeWindow{hours_start, hours_end};
  t.skills = std::move(skills);
  t.max_jobs_per_day = max_jobs;
  return t;
}

inline TravelSettings fast_settings(int timeout_ms = 2000) {
  TravelSettings s;
  s.timeout_ms = timeout_ms;
  return s;
}

}  // namespace test
}  // namespace fsched
