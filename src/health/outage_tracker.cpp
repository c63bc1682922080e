#include "health/outage_tracker.hpp"

namespace linkwatch::health {

OutageTracker::OutageTracker(const HealthConfig& config)
    : probe_interval_(config.probe_interval),
      miss_threshold_(config.outage_miss_threshold),
      arm_after_first_success_(config.arm_after_first_success) {}

std::optional<LifecycleEvent> OutageTracker::Evaluate(const ProbeOutcome& outcome) {
  if (outcome.success()) {
    return OnSuccess(outcome);
  }
  return OnMiss(outcome);
}

std::optional<LifecycleEvent> OutageTracker::OnMiss(const ProbeOutcome& outcome) {
  ++state_.consecutive_misses;
  if (state_.consecutive_misses == 1U) {
    state_.run_start = outcome.ts();
  }

  if (state_.active) {
    state_.duration = probe_interval_ * state_.consecutive_misses;
    return std::nullopt;
  }

  if (state_.consecutive_misses < miss_threshold_ || !armed()) {
    return std::nullopt;
  }

  state_.active = true;
  state_.start_time = state_.run_start.value_or(outcome.ts());
  state_.duration = probe_interval_ * state_.consecutive_misses;
  return MakeOutageStarted(state_.start_time.value(), state_.consecutive_misses);
}

std::optional<LifecycleEvent> OutageTracker::OnSuccess(const ProbeOutcome& outcome) {
  last_success_ = outcome.ts();

  std::optional<LifecycleEvent> ended;
  if (state_.active) {
    const std::chrono::milliseconds duration = probe_interval_ * state_.consecutive_misses;
    ended = MakeOutageEnded(outcome.ts(), state_.start_time.value_or(outcome.ts()), duration,
                            state_.consecutive_misses);
  }

  state_ = OutageState{};
  return ended;
}

} // namespace linkwatch::health
