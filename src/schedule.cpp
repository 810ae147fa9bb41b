#include "schedule.h"

namespace fsched {

const Technician* Schedule::technician(const std::string& id) const {
  for (const auto& t : technicians)
    if (t.id == id) return &t;
  return nullptr;
}

Technician* Schedule::technician(const std::string& id) {
  for (auto& t : technicians)
    if (t.id == id) return &t;
  return nullptr;
}

const Assignment* Schedule::assignment(const std::string& job_id) const {
  auto it = assignments.find(job_id);
  return it == assignments.end() ? nullptr : &it->second;
}

}  // namespace fsched
