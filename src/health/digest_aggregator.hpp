#pragma once

#include "health/lifecycle_event.hpp"
#include "health/probe_outcome.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace linkwatch::health {

// One day's worth of completed conditions, produced when the digest fires.
struct DigestSummary {
  // Local calendar date (YYYYMMDD) of `period_start`: the day summarized.
  std::string date;
  Clock::time_point period_start{};
  Clock::time_point period_end{};
  std::uint64_t outage_count = 0;
  std::vector<LifecycleEvent> outage_details;
  std::uint64_t anomaly_count = 0;
  std::vector<LifecycleEvent> anomaly_details;
  std::uint64_t probes_total = 0;
  std::uint64_t probes_failed = 0;
};

// Collects completed outage and anomaly periods between digests.
// Not synchronized on its own; HealthMonitor serializes access.
class DigestAggregator {
public:
  explicit DigestAggregator(Clock::time_point period_start = Clock::now());

  void OnProbe(const ProbeOutcome& outcome);
  // Keeps OutageEnded / AnomalyPeriodEnded, ignores start events.
  void OnCompletedEvent(const LifecycleEvent& event);

  // Snapshot of the record so far, then a fresh period starting at `now`.
  DigestSummary Fire(Clock::time_point now);

  Clock::time_point period_start() const {
    return period_start_;
  }
  std::size_t pending_events() const {
    return outages_.size() + anomalies_.size();
  }

private:
  Clock::time_point period_start_;
  std::vector<LifecycleEvent> outages_;
  std::vector<LifecycleEvent> anomalies_;
  std::uint64_t probes_total_ = 0;
  std::uint64_t probes_failed_ = 0;
};

} // namespace linkwatch::health
