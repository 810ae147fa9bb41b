// location_store.h
#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "types.h"

namespace fsched {

// Latest position per technician. Own lock, so location updates never wait
// on a scheduling run.
class LocationStore {
 public:
  // Older fixes than the one already held are ignored.
  void update(const std::string& technician_id, const GeoPoint& point, int minute, const std::string& status);

  std::optional<LocationFix> latest(const std::string& technician_id) const;
  std::string status(const std::string& technician_id) const;
  std::map<std::string, LocationFix> snapshot() const;

 private:
  struct Entry {
    LocationFix fix;
    std::string status;
  };

  mutable std::mutex mu_;
  std::map<std::string, Entry> entries_;
};

}  // namespace fsched
