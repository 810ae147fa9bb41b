#include "travel_cache.h"

#include <cmath>

namespace fsched {

std::string TravelCache::key(const GeoPoint& from, const GeoPoint& to) {
  auto r = [](double x) { return std::to_string(std::llround(x * 1e5)); };
  return r(from.lat) + "," + r(from.lng) + ">" + r(to.lat) + "," + r(to.lng);
}

bool TravelCache::get(const std::string& k, double& out) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = map_.find(k);
  if (it == map_.end()) return false;

  // Move the node to the front (MRU)
  order_.splice(order_.begin(), order_, it->second.first);
  out = it->second.second;
  return true;
}

void TravelCache::put(const std::string& k, double minutes) {
  std::lock_guard<std::mutex> lock(mu_);
  if (capacity_ == 0) return;
  auto it = map_.find(k);

  if (it != map_.end()) {
    it->second.second = minutes;
    order_.splice(order_.begin(), order_, it->second.first);
    return;
  }

  // Evict LRU if full
  if (map_.size() >= capacity_ && !order_.empty()) {
    map_.erase(order_.back());
    order_.pop_back();
  }

  order_.push_front(k);
  map_.emplace(k, std::make_pair(order_.begin(), minutes));
}

size_t TravelCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return map_.size();
}

}  // namespace fsched
