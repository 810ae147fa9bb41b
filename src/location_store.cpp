#include "location_store.h"

namespace fsched {

void LocationStore::update(const std::string& technician_id, const GeoPoint& point, int minute,
                           const std::string& status) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(technician_id);
  if (it != entries_.end() && it->second.fix.minute > minute) return;
  Entry& e = entries_[technician_id];
  e.fix.point = point;
  e.fix.minute = minute;
  e.status = status;
}

std::optional<LocationFix> LocationStore::latest(const std::string& technician_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(technician_id);
  if (it == entries_.end()) return std::nullopt;
  return it->second.fix;
}

std::string LocationStore::status(const std::string& technician_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(technician_id);
  return it == entries_.end() ? std::string() : it->second.status;
}

std::map<std::string, LocationFix> LocationStore::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::map<std::string, LocationFix> out;
  for (const auto& kv : entries_) out[kv.first] = kv.second.fix;
  return out;
}

}  // namespace fsched
