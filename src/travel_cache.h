// travel_cache.h
#pragma once
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

#include "types.h"

namespace fsched {

// LRU cache of provider answers (minutes) keyed by a rounded leg.
class TravelCache {
 public:
  explicit TravelCache(size_t capacity = 4096) : capacity_(capacity) {}

  // Coordinates rounded to 1e-5 degrees (about one metre).
  static std::string key(const GeoPoint& from, const GeoPoint& to);

  bool get(const std::string& k, double& out);
  void put(const std::string& k, double minutes);

  size_t size() const;
  size_t capacity() const { return capacity_; }

 private:
  size_t capacity_;
  mutable std::mutex mu_;
  std::list<std::string> order_;  // front = most recently used
  using ListIt = std::list<std::string>::iterator;
  std::unordered_map<std::string, std::pair<ListIt, double>> map_;
};

}  // namespace fsched
