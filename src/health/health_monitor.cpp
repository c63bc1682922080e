#include "health/health_monitor.hpp"

#include "core/time_utils.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace linkwatch::health {

namespace {

std::string FormatMs(const std::optional<double>& value_us) {
  if (!value_us.has_value()) {
    return "none";
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << (value_us.value() / 1000.0);
  return out.str();
}

} // namespace

HealthMonitor::HealthMonitor(const HealthConfig& config,
                             core::logging::Logger* logger,
                             const Clock::time_point digest_period_start)
    : config_(config),
      logger_(logger),
      outage_tracker_(config),
      anomaly_detector_(config),
      digest_(digest_period_start) {}

std::vector<LifecycleEvent> HealthMonitor::ProcessProbe(const ProbeOutcome& outcome) {
  std::lock_guard<std::mutex> lock(mu_);

  std::vector<LifecycleEvent> events;
  digest_.OnProbe(outcome);

  if (auto outage_event = outage_tracker_.Evaluate(outcome); outage_event.has_value()) {
    events.push_back(std::move(outage_event.value()));
  }

  if (outcome.success()) {
    if (auto anomaly_event = anomaly_detector_.Evaluate(outcome.ts(), outcome.latency().value());
        anomaly_event.has_value()) {
      events.push_back(std::move(anomaly_event.value()));
    }
  }

  for (const auto& event : events) {
    if (event.IsCompletion()) {
      digest_.OnCompletedEvent(event);
    }
  }

  TraceOutcome(outcome);
  return events;
}

DigestSummary HealthMonitor::FireDigest(const Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mu_);
  return digest_.Fire(now);
}

HealthSnapshot HealthMonitor::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  HealthSnapshot snapshot;
  snapshot.outage = outage_tracker_.state();
  snapshot.anomaly = anomaly_detector_.state();
  const auto& samples = anomaly_detector_.baseline().samples();
  snapshot.baseline.assign(samples.begin(), samples.end());
  snapshot.baseline_mean_us = anomaly_detector_.baseline().MeanUs();
  snapshot.last_success = outage_tracker_.last_success();
  snapshot.pending_digest_events = digest_.pending_events();
  return snapshot;
}

// Caller holds mu_.
void HealthMonitor::TraceOutcome(const ProbeOutcome& outcome) const {
  if (logger_ == nullptr || !logger_->ShouldLog(core::logging::LogLevel::kDebug)) {
    return;
  }

  const auto& outage = outage_tracker_.state();
  const auto& anomaly = anomaly_detector_.state();
  const std::string misses = std::to_string(outage.consecutive_misses);
  const std::string outage_active = outage.active ? "true" : "false";
  const std::string anomalous = std::to_string(anomaly.consecutive_anomalous);
  const std::string anomaly_active = anomaly.active ? "true" : "false";
  const std::string mean_ms = FormatMs(anomaly_detector_.baseline().MeanUs());
  const std::string window = std::to_string(anomaly_detector_.baseline().size());
  const std::string fired_at = core::FormatUtcTimestamp(outcome.ts());

  if (outcome.success()) {
    const std::string latency_ms =
        FormatMs(static_cast<double>(outcome.latency().value().count()));
    const std::string cutoff_ms = FormatMs(anomaly_detector_.last_cutoff_us());
    const std::string verdict = anomaly_detector_.last_was_anomalous() ? "anomalous" : "normal";
    logger_->Debug(core::logging::kCategoryTrace, "latency classified",
                   {{"fired_at", fired_at},
                    {"latency_ms", latency_ms},
                    {"cutoff_ms", cutoff_ms},
                    {"verdict", verdict},
                    {"baseline_mean_ms", mean_ms},
                    {"baseline_size", window},
                    {"anomalous_run", anomalous},
                    {"anomaly_active", anomaly_active}});
    return;
  }

  logger_->Debug(core::logging::kCategoryTrace, "probe missed",
                 {{"fired_at", fired_at},
                  {"failure", ToString(outcome.failure().value_or(FailureKind::kOther))},
                  {"consecutive_misses", misses},
                  {"outage_active", outage_active},
                  {"armed", outage_tracker_.armed() ? "true" : "false"}});
}

std::unique_ptr<HealthMonitor> CreateHealthMonitor(const HealthConfig& config,
                                                   core::logging::Logger* logger,
                                                   std::string& error,
                                                   const Clock::time_point digest_period_start) {
  if (!ValidateHealthConfig(config, error)) {
    return nullptr;
  }
  return std::make_unique<HealthMonitor>(config, logger, digest_period_start);
}

} // namespace linkwatch::health
