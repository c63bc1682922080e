#include "events/emitter.hpp"

#include "core/time_utils.hpp"
#include "events/jsonl_writer.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace linkwatch::events {

namespace {

EventType ToEventType(const health::LifecycleEventType type) {
  switch (type) {
  case health::LifecycleEventType::kOutageStarted:
    return EventType::kOutageStarted;
  case health::LifecycleEventType::kOutageEnded:
    return EventType::kOutageEnded;
  case health::LifecycleEventType::kAnomalyPeriodStarted:
    return EventType::kLatencyAnomalyStarted;
  case health::LifecycleEventType::kAnomalyPeriodEnded:
    return EventType::kLatencyAnomalyEnded;
  }
  return EventType::kOutageStarted;
}

std::string FormatLatencyMs(const std::chrono::microseconds latency) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << static_cast<double>(latency.count()) / 1000.0;
  return out.str();
}

std::string FormatDouble(const double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

} // namespace

Emitter::Emitter(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)), events_path_(output_dir_ / kEventsFileName) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);

  std::lock_guard<std::mutex> lock(mu_);
  return AppendEventJsonl(event, output_dir_, events_path_, error);
}

bool Emitter::EmitMonitorStarted(const MonitorStartedEvent& event, std::string& error) {
  return EmitRaw(EventType::kMonitorStarted, event.ts,
                 {
                     {"target", event.target},
                     {"prober", event.prober},
                     {"interval_ms", std::to_string(event.interval_ms)},
                     {"timeout_ms", std::to_string(event.timeout_ms)},
                     {"outage_miss_threshold", std::to_string(event.outage_miss_threshold)},
                     {"anomaly_threshold", std::to_string(event.anomaly_threshold)},
                     {"baseline_window", std::to_string(event.baseline_window)},
                     {"cutoff_multiplier", FormatDouble(event.cutoff_multiplier)},
                 },
                 error);
}

bool Emitter::EmitProbeOutcome(const std::string& target, const std::uint64_t sequence,
                               const health::ProbeOutcome& outcome, std::string& error) {
  std::map<std::string, std::string> payload = {
      {"target", target},
      {"sequence", std::to_string(sequence)},
  };
  if (outcome.success()) {
    payload["latency_ms"] = FormatLatencyMs(outcome.latency().value());
    return EmitRaw(EventType::kProbeSucceeded, outcome.ts(), std::move(payload), error);
  }

  payload["failure"] = health::ToString(outcome.failure().value_or(health::FailureKind::kOther));
  if (!outcome.detail().empty()) {
    payload["detail"] = outcome.detail();
  }
  return EmitRaw(EventType::kProbeFailed, outcome.ts(), std::move(payload), error);
}

bool Emitter::EmitLifecycle(const std::string& target, const health::LifecycleEvent& event,
                            std::string& error) {
  std::map<std::string, std::string> payload = {
      {"target", target},
      {"probe_count", std::to_string(event.probe_count)},
      {"description", health::Describe(event)},
  };
  if (event.started_at.has_value()) {
    payload["started_at_utc"] = core::FormatUtcTimestamp(event.started_at.value());
  }
  if (event.duration.has_value()) {
    payload["duration_ms"] = std::to_string(event.duration->count());
    payload["duration_minutes"] = core::FormatMinutes(event.duration.value());
  }
  return EmitRaw(ToEventType(event.type), event.ts, std::move(payload), error);
}

bool Emitter::EmitDigestWritten(const health::DigestSummary& summary,
                                const std::filesystem::path& digest_path, std::string& error) {
  return EmitRaw(EventType::kDigestWritten, summary.period_end,
                 {
                     {"date", summary.date},
                     {"path", digest_path.string()},
                     {"period_start_utc", core::FormatUtcTimestamp(summary.period_start)},
                     {"outage_count", std::to_string(summary.outage_count)},
                     {"anomaly_count", std::to_string(summary.anomaly_count)},
                     {"probes_total", std::to_string(summary.probes_total)},
                     {"probes_failed", std::to_string(summary.probes_failed)},
                 },
                 error);
}

bool Emitter::EmitMonitorStopped(const MonitorStoppedEvent& event, std::string& error) {
  return EmitRaw(EventType::kMonitorStopped, event.ts,
                 {
                     {"target", event.target},
                     {"ticks", std::to_string(event.ticks)},
                     {"reason", event.reason},
                 },
                 error);
}

} // namespace linkwatch::events
