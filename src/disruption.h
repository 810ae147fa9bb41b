// disruption.h
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "notification.h"
#include "schedule.h"
#include "travel_time.h"
#include "types.h"
#include "weather.h"

namespace fsched {

enum class AdaptationState { Received, Scoped, Reoptimized, Applied, Notified, Rejected };

struct AdaptationResult {
  AdaptationState state = AdaptationState::Received;
  std::vector<AdaptationState> trace;  // states passed through, in order
  std::vector<AdaptedJob> adapted;
  ImpactSummary impact;
  std::vector<std::string> recommendations;
  int reassignment_count = 0;
  std::vector<std::string> affected_job_ids;  // computed scope, sorted
  std::string rejection_reason;
  std::optional<Schedule> schedule;  // the committed result when applied
};

struct AdaptContext {
  int now_minute = 0;
  int adapt_iterations = 50;
  int time_budget_ms = 2000;
  int weather_timeout_ms = 2000;
  int alternatives = 3;
  std::map<std::string, double> on_time_rates;
};

// Installs the adapted schedule; called at most once, only for feasible adaptations.
using CommitFn = std::function<void(const Schedule&)>;

// Default extra minutes for a delay of the given severity.
int severity_delay_minutes(Severity s);

// High severity or emergency insertions may preempt a running optimization.
bool is_high_priority(const DisruptionEvent& ev);

// Every problem with the event against the committed schedule. Empty when valid.
std::vector<std::string> event_violations(const Schedule& s, const DisruptionEvent& ev);

class DisruptionHandler {
 public:
  DisruptionHandler(TravelTimeService& travel, std::shared_ptr<WeatherProvider> weather,
                    NotificationDispatcher* notifier)
      : travel_(travel), weather_(std::move(weather)), notifier_(notifier) {}

  // Received -> Scoped -> Reoptimized -> Applied -> Notified, or Rejected.
  // Throws ValidationError before touching anything; never mutates `committed`.
  AdaptationResult adapt(const Schedule& committed, const DisruptionEvent& ev, const AdaptationPreferences& prefs,
                         const AdaptContext& ctx, const CommitFn& commit);

 private:
  int event_delay(const Schedule& s, const DisruptionEvent& ev, int weather_timeout_ms,
                  std::vector<std::string>& actions);
  int notify(const AdaptationResult& res, const AdaptationPreferences& prefs);

  TravelTimeService& travel_;
  std::shared_ptr<WeatherProvider> weather_;
  NotificationDispatcher* notifier_;
};

const char* to_string(AdaptationState s);

}  // namespace fsched
