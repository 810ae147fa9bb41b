#include "run_store.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "json_io.h"
#include "log.h"

namespace fsched {

void RunStore::put(const OptimizationRun& run) {
  std::lock_guard<std::mutex> lk(mu_);
  runs_[run.id] = run;
}

std::optional<OptimizationRun> RunStore::get(const std::string& run_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = runs_.find(run_id);
  if (it == runs_.end()) return std::nullopt;
  return it->second;
}

bool RunStore::set_status(const std::string& run_id, RunStatus status, const std::string& reason) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = runs_.find(run_id);
  if (it == runs_.end()) return false;
  it->second.status = status;
  if (!reason.empty()) it->second.failure_reason = reason;
  return true;
}

std::vector<OptimizationRun> RunStore::list(const std::string& tenant, int from_day, int to_day) const {
  std::vector<OptimizationRun> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : runs_) {
      const auto& r = kv.second;
      if (r.tenant_id == tenant && r.planning_day >= from_day && r.planning_day <= to_day) out.push_back(r);
    }
  }
  std::sort(out.begin(), out.end(), [](const OptimizationRun& a, const OptimizationRun& b) {
    if (a.created_ms != b.created_ms) return a.created_ms < b.created_ms;
    return a.id < b.id;
  });
  return out;
}

void RunStore::add_outcome(const std::string& tenant, const JobOutcome& outcome) {
  std::lock_guard<std::mutex> lk(mu_);
  outcomes_[tenant].push_back(outcome);
}

std::vector<JobOutcome> RunStore::outcomes(const std::string& tenant, int from_day, int to_day) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<JobOutcome> out;
  auto it = outcomes_.find(tenant);
  if (it == outcomes_.end()) return out;
  for (const auto& o : it->second)
    if (o.planning_day >= from_day && o.planning_day <= to_day) out.push_back(o);
  return out;
}

int RunStore::prune(long long now_ms) {
  const long long cutoff_ms = now_ms - retention_days_ * MILLIS_PER_DAY;
  const int cutoff_day = static_cast<int>(cutoff_ms / MILLIS_PER_DAY);
  std::lock_guard<std::mutex> lk(mu_);
  int dropped = 0;
  for (auto it = runs_.begin(); it != runs_.end();) {
    if (it->second.created_ms < cutoff_ms && it->second.status != RunStatus::Running) {
      it = runs_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  for (auto& kv : outcomes_) {
    auto& v = kv.second;
    v.erase(std::remove_if(v.begin(), v.end(), [&](const JobOutcome& o) { return o.planning_day < cutoff_day; }),
            v.end());
  }
  if (dropped > 0) FSLOG("[runs] pruned %d runs older than %d days\n", dropped, retention_days_);
  return dropped;
}

void RunStore::save(const std::string& path) const {
  json j;
  {
    std::lock_guard<std::mutex> lk(mu_);
    j["retention_days"] = retention_days_;
    j["runs"] = json::array();
    for (const auto& kv : runs_) j["runs"].push_back(kv.second);
    j["outcomes"] = json::object();
    for (const auto& kv : outcomes_) j["outcomes"][kv.first] = kv.second;
  }
  save_json(path, j);
}

void RunStore::load(const std::string& path) {
  const json j = load_json(path);
  std::map<std::string, OptimizationRun> runs;
  std::map<std::string, std::vector<JobOutcome>> outcomes;
  for (const auto& r : j.value("runs", json::array())) {
    OptimizationRun run = r.get<OptimizationRun>();
    runs[run.id] = std::move(run);
  }
  if (j.contains("outcomes"))
    for (auto it = j["outcomes"].begin(); it != j["outcomes"].end(); ++it)
      outcomes[it.key()] = it.value().get<std::vector<JobOutcome>>();

  std::lock_guard<std::mutex> lk(mu_);
  runs_ = std::move(runs);
  outcomes_ = std::move(outcomes);
  FSLOG("[runs] loaded %zu runs from %s\n", runs_.size(), path.c_str());
}

size_t RunStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return runs_.size();
}

}  // namespace fsched
