#pragma once

#include "health/health_config.hpp"
#include "health/latency_baseline.hpp"
#include "health/lifecycle_event.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace linkwatch::health {

struct AnomalyPeriodState {
  bool active = false;
  std::uint32_t consecutive_anomalous = 0;
  std::optional<Clock::time_point> run_start;
  std::optional<Clock::time_point> last_anomalous_time;
  // First normal reply after the run; the period is reported as ending here
  // once a second normal reply confirms recovery.
  std::optional<Clock::time_point> recovery_start;
  bool previous_was_anomalous = false;
};

// Classifies successful-probe latencies against the rolling baseline.
//
// A reply is anomalous when the baseline has a mean and
// `latency > mean * cutoff_multiplier`. Anomalous replies never enter the
// baseline, so a long spike cannot drag the reference up to meet it.
//
// Period lifecycle:
// - `anomaly_threshold` consecutive anomalous replies open a period dated
//   at the first of them.
// - one normal reply inside an open period is tolerated.
// - two consecutive normal replies close it; duration is
//   anomalous-reply count * probe_interval.
// - shorter runs are dropped on the first normal reply and never reported.
class AnomalyDetector {
public:
  explicit AnomalyDetector(const HealthConfig& config);

  std::optional<LifecycleEvent> Evaluate(Clock::time_point ts, std::chrono::microseconds latency);

  const AnomalyPeriodState& state() const {
    return state_;
  }
  const LatencyBaseline& baseline() const {
    return baseline_;
  }
  // Cutoff used by the most recent Evaluate call; empty while the baseline
  // was still empty.
  const std::optional<double>& last_cutoff_us() const {
    return last_cutoff_us_;
  }
  bool last_was_anomalous() const {
    return state_.previous_was_anomalous;
  }

private:
  std::optional<LifecycleEvent> OnAnomalous(Clock::time_point ts);
  std::optional<LifecycleEvent> OnNormal(Clock::time_point ts, std::chrono::microseconds latency);

  std::chrono::milliseconds probe_interval_;
  std::uint32_t anomaly_threshold_;
  double cutoff_multiplier_;
  LatencyBaseline baseline_;
  AnomalyPeriodState state_;
  std::optional<double> last_cutoff_us_;
};

} // namespace linkwatch::health
