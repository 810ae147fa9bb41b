// main.cpp
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "config.h"
#include "errors.h"
#include "json_io.h"
#include "log.h"
#include "notification.h"
#include "run_store.h"
#include "scheduler.h"
#include "travel_time.h"
#include "utils.h"

using namespace fsched;
namespace fs = std::filesystem;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string mode;               // {optimize|adapt|analytics}
  std::string request_path;       // required
  std::string config_path;        // optional, defaults apply
  std::string schedule_path;      // committed schedule in/out
  std::string store_path;         // run history in/out
  std::string out_path;           // response; stdout when empty
  std::string tenant = "default";
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  fieldsched --mode {optimize|adapt|analytics} --request PATH [--config PATH]
             [--schedule PATH] [--store PATH] [--out PATH] [--tenant ID] [--quiet]

Required:
  --mode {optimize|adapt|analytics}
  --request PATH      Optimize request, disruption, or analytics period (JSON)

Optional:
  --config PATH       Engine config (UPPER_CASE keys)
  --schedule PATH     Committed schedule; written by optimize, read and updated by adapt
  --store PATH        Run history; loaded when present, saved after optimize
  --out PATH          Response file (default: stdout)
  --tenant ID         Tenant id (default: "default")
  --quiet             Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--mode")     f.mode = need("--mode");
    else if (a == "--request")  f.request_path = need("--request");
    else if (a == "--config")   f.config_path = need("--config");
    else if (a == "--schedule") f.schedule_path = need("--schedule");
    else if (a == "--store")    f.store_path = need("--store");
    else if (a == "--out")      f.out_path = need("--out");
    else if (a == "--tenant")   f.tenant = need("--tenant");
    else if (a == "--quiet")    f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.mode != "optimize" && f.mode != "adapt" && f.mode != "analytics") {
    std::cerr << "Missing or unknown --mode.\n"; print_usage(); std::exit(2);
  }
  if (f.request_path.empty()) {
    std::cerr << "Missing required --request.\n"; print_usage(); std::exit(2);
  }
  if (f.mode == "adapt" && f.schedule_path.empty()) {
    std::cerr << "--mode adapt needs --schedule.\n"; std::exit(2);
  }
  return f;
}

// Notifications go to the log; delivery channels live outside this binary.
class LogDispatcher : public NotificationDispatcher {
 public:
  void dispatch(const NotificationPayload& n) override {
    FSLOG("[notify] %s %s job=%s: %s\n", n.recipient == Recipient::Technician ? "technician" : "customer",
          n.recipient_id.c_str(), n.job_id.c_str(), n.message.c_str());
  }
};

static void emit(const Flags& flags, const json& out) {
  if (flags.out_path.empty()) std::cout << out.dump(2) << "\n";
  else save_json(flags.out_path, out);
}

static int run_optimize(const Flags& flags, SchedulingService& svc) {
  const OptimizeRequest req = load_json(flags.request_path).get<OptimizeRequest>();
  const OptimizeResponse resp = svc.optimize(flags.tenant, req);
  emit(flags, resp);
  if (!flags.schedule_path.empty() && resp.committed) {
    save_json(flags.schedule_path, *svc.committed_schedule(flags.tenant));
    if (flags.verbose) std::cerr << "Schedule written to " << flags.schedule_path << "\n";
  }
  return resp.status == RunStatus::Completed ? 0 : 3;
}

static int run_adapt(const Flags& flags, SchedulingService& svc) {
  svc.restore_schedule(flags.tenant, load_json(flags.schedule_path).get<Schedule>());
  const AdaptRequest req = load_json(flags.request_path).get<AdaptRequest>();
  const AdaptationResult res = svc.adapt(flags.tenant, req);
  emit(flags, res);
  if (res.schedule) {
    save_json(flags.schedule_path, *res.schedule);
    if (flags.verbose) std::cerr << "Schedule v" << res.schedule->version << " written to " << flags.schedule_path << "\n";
  }
  return res.state == AdaptationState::Rejected ? 3 : 0;
}

static int run_analytics(const Flags& flags, SchedulingService& svc) {
  const json j = load_json(flags.request_path);
  const AnalyticsPeriod period = j.at("period").get<AnalyticsPeriod>();
  const AnalyticsFilters filters = j.contains("filters") ? j["filters"].get<AnalyticsFilters>() : AnalyticsFilters{};
  emit(flags, svc.get_analytics(flags.tenant, period, filters));
  return 0;
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  EngineConfig cfg;
  try {
    if (!flags.config_path.empty()) cfg = load_engine_config(flags.config_path);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load config: " << e.what() << "\n"; return 1;
  }
  set_log_verbose(flags.verbose && cfg.verbose);
  if (flags.verbose) std::cerr << "fieldsched " << ALGORITHM_VERSION << " mode=" << flags.mode
                               << " tenant=" << flags.tenant << "\n";

  auto store = std::make_shared<RunStore>(cfg.run_retention_days);
  try {
    if (!flags.store_path.empty() && fs::exists(flags.store_path)) store->load(flags.store_path);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load run store: " << e.what() << "\n"; return 1;
  }

  SchedulingService svc(cfg, std::make_shared<GreatCircleProvider>(cfg.average_speed_kmh), nullptr,
                        std::make_shared<LogDispatcher>(), store);

  int rc = 0;
  try {
    if (flags.mode == "optimize") rc = run_optimize(flags, svc);
    else if (flags.mode == "adapt") rc = run_adapt(flags, svc);
    else rc = run_analytics(flags, svc);
  } catch (const ValidationError& e) {
    std::cerr << "Invalid request:\n";
    for (const auto& v : e.violations()) std::cerr << "  - " << v << "\n";
    return 2;
  } catch (const BusyError& e) {
    std::cerr << e.what() << " (retry later)\n"; return 4;
  } catch (const std::exception& e) {
    std::cerr << "Failed: " << e.what() << "\n"; return 1;
  }

  if (!flags.store_path.empty() && flags.mode == "optimize") {
    try { store->save(flags.store_path); }
    catch (const std::exception& e) { std::cerr << "Failed to write run store: " << e.what() << "\n"; return 1; }
  }
  return rc;
}
