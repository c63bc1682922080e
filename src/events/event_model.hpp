#pragma once

#include <chrono>
#include <map>
#include <string>

namespace linkwatch::events {

// Record types of the `events.jsonl` stream. Log scrapers and the replay
// tooling key off the serialized names, so keep them stable.
enum class EventType {
  kMonitorStarted,
  kProbeSucceeded,
  kProbeFailed,
  kOutageStarted,
  kOutageEnded,
  kLatencyAnomalyStarted,
  kLatencyAnomalyEnded,
  kDigestWritten,
  kMonitorStopped,
};

// One line of the event stream.
//
// - `ts`: when the described thing happened (probe fire time for probe and
//   lifecycle records, wall clock for monitor records).
// - `payload`: flat string attributes; std::map keeps key order stable.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kMonitorStarted;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace linkwatch::events
