#pragma once

#include "health/health_config.hpp"
#include "health/lifecycle_event.hpp"
#include "health/probe_outcome.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace linkwatch::health {

struct OutageState {
  bool active = false;
  std::uint32_t consecutive_misses = 0;
  // First missed probe of the current run; kept even before the run becomes
  // an outage so the outage can be back-dated to it.
  std::optional<Clock::time_point> run_start;
  std::optional<Clock::time_point> start_time;
  std::chrono::milliseconds duration{0};
};

// Turns consecutive missed probes into outage start/end events.
//
// Contract:
// - every failure kind (timeout, unresolvable, other) counts as one miss.
// - `outage_miss_threshold` consecutive misses open an outage dated at the
//   first miss of the run; fewer are tolerated and never surfaced.
// - while open, duration = misses * probe_interval.
// - the next success closes it with that final duration and resets counters.
// - with `arm_after_first_success`, no outage opens until a probe has
//   succeeded at least once.
class OutageTracker {
public:
  explicit OutageTracker(const HealthConfig& config);

  std::optional<LifecycleEvent> Evaluate(const ProbeOutcome& outcome);

  const OutageState& state() const {
    return state_;
  }
  const std::optional<Clock::time_point>& last_success() const {
    return last_success_;
  }
  bool armed() const {
    return !arm_after_first_success_ || last_success_.has_value();
  }

private:
  std::optional<LifecycleEvent> OnMiss(const ProbeOutcome& outcome);
  std::optional<LifecycleEvent> OnSuccess(const ProbeOutcome& outcome);

  std::chrono::milliseconds probe_interval_;
  std::uint32_t miss_threshold_;
  bool arm_after_first_success_;
  OutageState state_;
  std::optional<Clock::time_point> last_success_;
};

} // namespace linkwatch::health
