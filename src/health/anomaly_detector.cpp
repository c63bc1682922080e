#include "health/anomaly_detector.hpp"

namespace linkwatch::health {

AnomalyDetector::AnomalyDetector(const HealthConfig& config)
    : probe_interval_(config.probe_interval),
      anomaly_threshold_(config.anomaly_threshold),
      cutoff_multiplier_(config.cutoff_multiplier),
      baseline_(config.baseline_window) {}

std::optional<LifecycleEvent> AnomalyDetector::Evaluate(const Clock::time_point ts,
                                                        const std::chrono::microseconds latency) {
  last_cutoff_us_ = baseline_.CutoffUs(cutoff_multiplier_);
  const bool anomalous = last_cutoff_us_.has_value() && last_cutoff_us_.value() > 0.0 &&
                         static_cast<double>(latency.count()) > last_cutoff_us_.value();
  if (anomalous) {
    return OnAnomalous(ts);
  }
  return OnNormal(ts, latency);
}

std::optional<LifecycleEvent> AnomalyDetector::OnAnomalous(const Clock::time_point ts) {
  ++state_.consecutive_anomalous;
  if (!state_.run_start.has_value()) {
    state_.run_start = ts;
  }
  state_.last_anomalous_time = ts;
  state_.recovery_start.reset();
  state_.previous_was_anomalous = true;

  if (state_.active || state_.consecutive_anomalous < anomaly_threshold_) {
    return std::nullopt;
  }

  state_.active = true;
  return MakeAnomalyPeriodStarted(state_.run_start.value(), state_.consecutive_anomalous);
}

std::optional<LifecycleEvent> AnomalyDetector::OnNormal(const Clock::time_point ts,
                                                        const std::chrono::microseconds latency) {
  baseline_.Admit(latency);

  const bool previous_was_anomalous = state_.previous_was_anomalous;
  state_.previous_was_anomalous = false;

  if (!state_.active) {
    // Sub-threshold run: jitter, not an incident.
    state_ = AnomalyPeriodState{};
    return std::nullopt;
  }

  if (previous_was_anomalous) {
    state_.recovery_start = ts;
    return std::nullopt;
  }

  const std::chrono::milliseconds duration = probe_interval_ * state_.consecutive_anomalous;
  LifecycleEvent ended =
      MakeAnomalyPeriodEnded(state_.recovery_start.value_or(ts), state_.run_start.value_or(ts),
                             duration, state_.consecutive_anomalous);
  state_ = AnomalyPeriodState{};
  return ended;
}

} // namespace linkwatch::health
