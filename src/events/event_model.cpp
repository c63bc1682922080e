#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace linkwatch::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kMonitorStarted:
    return "MONITOR_STARTED";
  case EventType::kProbeSucceeded:
    return "PROBE_SUCCEEDED";
  case EventType::kProbeFailed:
    return "PROBE_FAILED";
  case EventType::kOutageStarted:
    return "OUTAGE_STARTED";
  case EventType::kOutageEnded:
    return "OUTAGE_ENDED";
  case EventType::kLatencyAnomalyStarted:
    return "LATENCY_ANOMALY_STARTED";
  case EventType::kLatencyAnomalyEnded:
    return "LATENCY_ANOMALY_ENDED";
  case EventType::kDigestWritten:
    return "DIGEST_WRITTEN";
  case EventType::kMonitorStopped:
    return "MONITOR_STOPPED";
  }

  return "UNKNOWN";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{\"ts_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(event.ts))
      << ",\"type\":" << core::QuoteJson(ToJson(event.type)) << ",\"payload\":{";

  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(key) << ':' << core::QuoteJson(value);
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace linkwatch::events
