#include "health/digest_aggregator.hpp"

#include "core/time_utils.hpp"

#include <utility>

namespace linkwatch::health {

DigestAggregator::DigestAggregator(const Clock::time_point period_start)
    : period_start_(period_start) {}

void DigestAggregator::OnProbe(const ProbeOutcome& outcome) {
  ++probes_total_;
  if (!outcome.success()) {
    ++probes_failed_;
  }
}

void DigestAggregator::OnCompletedEvent(const LifecycleEvent& event) {
  switch (event.type) {
  case LifecycleEventType::kOutageEnded:
    outages_.push_back(event);
    break;
  case LifecycleEventType::kAnomalyPeriodEnded:
    anomalies_.push_back(event);
    break;
  case LifecycleEventType::kOutageStarted:
  case LifecycleEventType::kAnomalyPeriodStarted:
    break;
  }
}

DigestSummary DigestAggregator::Fire(const Clock::time_point now) {
  DigestSummary summary;
  summary.date = core::FormatLocalDate(period_start_);
  summary.period_start = period_start_;
  summary.period_end = now;
  summary.outage_count = outages_.size();
  summary.outage_details = std::move(outages_);
  summary.anomaly_count = anomalies_.size();
  summary.anomaly_details = std::move(anomalies_);
  summary.probes_total = probes_total_;
  summary.probes_failed = probes_failed_;

  outages_.clear();
  anomalies_.clear();
  probes_total_ = 0;
  probes_failed_ = 0;
  period_start_ = now;
  return summary;
}

} // namespace linkwatch::health
