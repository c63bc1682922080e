#pragma once

#include "core/logging/logger.hpp"
#include "health/anomaly_detector.hpp"
#include "health/digest_aggregator.hpp"
#include "health/health_config.hpp"
#include "health/lifecycle_event.hpp"
#include "health/outage_tracker.hpp"
#include "health/probe_outcome.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace linkwatch::health {

// Copy of the classifier state taken under the monitor lock.
struct HealthSnapshot {
  OutageState outage;
  AnomalyPeriodState anomaly;
  std::vector<std::chrono::microseconds> baseline;
  std::optional<double> baseline_mean_us;
  std::optional<Clock::time_point> last_success;
  std::size_t pending_digest_events = 0;
};

// Health-signal state machine for one monitored target.
//
// Owns the outage tracker, the latency baseline/detector and the digest
// accumulator. Every call takes one lock, so a probe outcome is applied as a
// single transition and FireDigest never observes a half-applied probe.
//
// Per outcome, in order:
// 1) outage tracker (all outcomes)
// 2) anomaly detector (successful outcomes only)
// 3) completed events are appended to the digest record
//
// The returned events are in emission order; the monitor does no I/O apart
// from optional DEBUG trace lines through `logger`.
class HealthMonitor {
public:
  HealthMonitor(const HealthConfig& config,
                core::logging::Logger* logger,
                Clock::time_point digest_period_start);

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  std::vector<LifecycleEvent> ProcessProbe(const ProbeOutcome& outcome);
  DigestSummary FireDigest(Clock::time_point now);

  HealthSnapshot Snapshot() const;
  const HealthConfig& config() const {
    return config_;
  }

private:
  void TraceOutcome(const ProbeOutcome& outcome) const;

  const HealthConfig config_;
  core::logging::Logger* logger_ = nullptr;

  mutable std::mutex mu_;
  OutageTracker outage_tracker_;
  AnomalyDetector anomaly_detector_;
  DigestAggregator digest_;
};

// Returns nullptr and fills `error` when `config` fails validation.
// `logger` may be null; it must outlive the monitor otherwise.
std::unique_ptr<HealthMonitor> CreateHealthMonitor(const HealthConfig& config,
                                                   core::logging::Logger* logger,
                                                   std::string& error,
                                                   Clock::time_point digest_period_start =
                                                       Clock::now());

} // namespace linkwatch::health
