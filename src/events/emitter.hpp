#pragma once

#include "events/event_model.hpp"
#include "health/digest_aggregator.hpp"
#include "health/lifecycle_event.hpp"
#include "health/probe_outcome.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace linkwatch::events {

// Typed facade over the JSONL stream so every record type keeps one payload
// contract. The consumer, the digest thread and the service lifecycle all
// write through one Emitter; appends are serialized by its lock.
class Emitter {
public:
  struct MonitorStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string target;
    std::string prober;
    std::uint64_t interval_ms = 0;
    std::uint64_t timeout_ms = 0;
    std::uint32_t outage_miss_threshold = 0;
    std::uint32_t anomaly_threshold = 0;
    std::uint64_t baseline_window = 0;
    double cutoff_multiplier = 0.0;
  };

  struct MonitorStoppedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string target;
    std::uint64_t ticks = 0;
    std::string reason;
  };

  explicit Emitter(std::filesystem::path output_dir);

  Emitter(const Emitter&) = delete;
  Emitter& operator=(const Emitter&) = delete;

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitMonitorStarted(const MonitorStartedEvent& event, std::string& error);
  bool EmitProbeOutcome(const std::string& target, std::uint64_t sequence,
                        const health::ProbeOutcome& outcome, std::string& error);
  bool EmitLifecycle(const std::string& target, const health::LifecycleEvent& event,
                     std::string& error);
  bool EmitDigestWritten(const health::DigestSummary& summary,
                         const std::filesystem::path& digest_path, std::string& error);
  bool EmitMonitorStopped(const MonitorStoppedEvent& event, std::string& error);

  const std::filesystem::path& events_path() const {
    return events_path_;
  }

private:
  std::filesystem::path output_dir_;
  std::filesystem::path events_path_;
  std::mutex mu_;
};

} // namespace linkwatch::events
