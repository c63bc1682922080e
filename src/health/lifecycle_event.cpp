#include "health/lifecycle_event.hpp"

#include "core/time_utils.hpp"

namespace linkwatch::health {

LifecycleEvent MakeOutageStarted(const Clock::time_point ts, const std::uint32_t probe_count) {
  LifecycleEvent event;
  event.type = LifecycleEventType::kOutageStarted;
  event.ts = ts;
  event.started_at = ts;
  event.probe_count = probe_count;
  return event;
}

LifecycleEvent MakeOutageEnded(const Clock::time_point ts, const Clock::time_point started_at,
                               const std::chrono::milliseconds duration,
                               const std::uint32_t probe_count) {
  LifecycleEvent event;
  event.type = LifecycleEventType::kOutageEnded;
  event.ts = ts;
  event.started_at = started_at;
  event.duration = duration;
  event.probe_count = probe_count;
  return event;
}

LifecycleEvent MakeAnomalyPeriodStarted(const Clock::time_point ts,
                                        const std::uint32_t probe_count) {
  LifecycleEvent event;
  event.type = LifecycleEventType::kAnomalyPeriodStarted;
  event.ts = ts;
  event.started_at = ts;
  event.probe_count = probe_count;
  return event;
}

LifecycleEvent MakeAnomalyPeriodEnded(const Clock::time_point ts,
                                      const Clock::time_point started_at,
                                      const std::chrono::milliseconds duration,
                                      const std::uint32_t probe_count) {
  LifecycleEvent event;
  event.type = LifecycleEventType::kAnomalyPeriodEnded;
  event.ts = ts;
  event.started_at = started_at;
  event.duration = duration;
  event.probe_count = probe_count;
  return event;
}

const char* ToString(const LifecycleEventType type) {
  switch (type) {
  case LifecycleEventType::kOutageStarted:
    return "OUTAGE_STARTED";
  case LifecycleEventType::kOutageEnded:
    return "OUTAGE_ENDED";
  case LifecycleEventType::kAnomalyPeriodStarted:
    return "LATENCY_ANOMALY_STARTED";
  case LifecycleEventType::kAnomalyPeriodEnded:
    return "LATENCY_ANOMALY_ENDED";
  }
  return "UNKNOWN";
}

std::string Describe(const LifecycleEvent& event) {
  const std::string minutes =
      event.duration.has_value() ? core::FormatMinutes(event.duration.value()) : "0.00";
  switch (event.type) {
  case LifecycleEventType::kOutageStarted:
    return "Lost contact after " + std::to_string(event.probe_count) + " missed probes";
  case LifecycleEventType::kOutageEnded:
    return "Connection restored. Total outage duration " + minutes + " minutes";
  case LifecycleEventType::kAnomalyPeriodStarted:
    return "Period of high latency started after " + std::to_string(event.probe_count) +
           " slow replies";
  case LifecycleEventType::kAnomalyPeriodEnded:
    return "Period of high latency finished. Duration " + minutes + " minutes";
  }
  return "unknown lifecycle event";
}

} // namespace linkwatch::health
