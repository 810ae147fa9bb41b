// run_store.h
#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace fsched {

constexpr long long MILLIS_PER_DAY = 24LL * 60 * 60 * 1000;

// Optimization runs and job outcomes, per tenant. Thread-safe.
// Planning days are day numbers since 1970-01-01.
class RunStore {
 public:
  explicit RunStore(int retention_days = 90) : retention_days_(retention_days) {}

  void put(const OptimizationRun& run);  // insert or replace by id
  std::optional<OptimizationRun> get(const std::string& run_id) const;

  // Returns false when the run is unknown.
  bool set_status(const std::string& run_id, RunStatus status, const std::string& reason = "");

  // Runs of a tenant with planning_day in [from_day, to_day], oldest first.
  std::vector<OptimizationRun> list(const std::string& tenant, int from_day, int to_day) const;

  void add_outcome(const std::string& tenant, const JobOutcome& outcome);
  std::vector<JobOutcome> outcomes(const std::string& tenant, int from_day, int to_day) const;

  // Drops runs created, and outcomes planned, before the retention window. Returns runs dropped.
  int prune(long long now_ms);

  void save(const std::string& path) const;
  void load(const std::string& path);  // replaces the contents

  size_t size() const;
  int retention_days() const { return retention_days_; }

 private:
  int retention_days_;
  mutable std::mutex mu_;
  std::map<std::string, OptimizationRun> runs_;
  std::map<std::string, std::vector<JobOutcome>> outcomes_;
};

}  // namespace fsched
