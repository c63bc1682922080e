#pragma once

#include "health/probe_outcome.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace linkwatch::health {

enum class LifecycleEventType {
  kOutageStarted,
  kOutageEnded,
  kAnomalyPeriodStarted,
  kAnomalyPeriodEnded,
};

// One health-condition transition produced by the monitor.
//
// - Started events: `ts` is the first probe of the run that crossed the
//   threshold; `duration` is empty.
// - Ended events: `ts` is the probe that closed the condition, `started_at`
//   is the start recorded when it opened, and `duration` is
//   `probe_count * probe_interval`.
struct LifecycleEvent {
  LifecycleEventType type = LifecycleEventType::kOutageStarted;
  Clock::time_point ts{};
  std::optional<Clock::time_point> started_at;
  std::optional<std::chrono::milliseconds> duration;
  std::uint32_t probe_count = 0;

  bool IsCompletion() const {
    return type == LifecycleEventType::kOutageEnded ||
           type == LifecycleEventType::kAnomalyPeriodEnded;
  }
  bool IsOutage() const {
    return type == LifecycleEventType::kOutageStarted || type == LifecycleEventType::kOutageEnded;
  }
};

LifecycleEvent MakeOutageStarted(Clock::time_point ts, std::uint32_t probe_count);
LifecycleEvent MakeOutageEnded(Clock::time_point ts, Clock::time_point started_at,
                               std::chrono::milliseconds duration, std::uint32_t probe_count);
LifecycleEvent MakeAnomalyPeriodStarted(Clock::time_point ts, std::uint32_t probe_count);
LifecycleEvent MakeAnomalyPeriodEnded(Clock::time_point ts, Clock::time_point started_at,
                                      std::chrono::milliseconds duration,
                                      std::uint32_t probe_count);

// Stable names used by the event stream and log lines.
const char* ToString(LifecycleEventType type);

// One-line human description, e.g. "Connection restored. Total outage
// duration 3.00 minutes".
std::string Describe(const LifecycleEvent& event);

} // namespace linkwatch::health
