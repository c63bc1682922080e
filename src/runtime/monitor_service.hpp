#pragma once

#include "core/logging/logger.hpp"
#include "events/emitter.hpp"
#include "health/health_monitor.hpp"
#include "probes/prober.hpp"
#include "runtime/outcome_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace linkwatch::runtime {

struct MonitorServiceOptions {
  std::string target;
  std::chrono::milliseconds interval{60'000};
  // Only reported in MONITOR_STARTED; the prober enforces it.
  std::chrono::milliseconds probe_timeout{30'000};
  std::optional<std::uint64_t> max_ticks;
  bool digest_flush_on_shutdown = false;
  std::filesystem::path output_dir;
};

struct MonitorRunResult {
  std::uint64_t ticks = 0;
  std::string stop_reason;
};

// Drives one HealthMonitor from a prober.
//
// Threads:
// - caller: fixed-interval scheduler; each tick launches one async probe task.
// - consumer: pops outcomes in tick order, calls ProcessProbe, logs and
//   appends every outcome and lifecycle event to the event stream.
// - digest: sleeps until the next local midnight, fires the digest and
//   writes `digest-YYYYMMDD.md`.
//
// Sink failures are logged under ERROR and never stop monitoring.
class MonitorService {
public:
  MonitorService(MonitorServiceOptions options,
                 probes::IProber& prober,
                 health::HealthMonitor& monitor,
                 events::Emitter& emitter,
                 core::logging::Logger& logger);

  MonitorService(const MonitorService&) = delete;
  MonitorService& operator=(const MonitorService&) = delete;

  // Blocks until `stop_requested` is set (polled, so a signal handler may set
  // it), RequestStop() is called or `max_ticks` probes were scheduled. Waits
  // for in-flight probes and drains their outcomes before returning.
  MonitorRunResult Run(const std::atomic<bool>* stop_requested);

  void RequestStop();

  // Fires the digest now and writes it. Used by the digest thread and by the
  // optional shutdown flush.
  bool FlushDigest(std::chrono::system_clock::time_point now, std::string_view reason);

private:
  void DispatchProbe(std::uint64_t sequence);
  void PruneFinishedProbes();
  void WaitForProbes();
  void ConsumeOutcomes();
  void HandleOutcome(const SequencedOutcome& item);
  void RunDigestLoop();
  void EmitStarted();
  void EmitStopped(const MonitorRunResult& result);
  bool ShouldStop(const std::atomic<bool>* stop_requested) const;

  MonitorServiceOptions options_;
  probes::IProber& prober_;
  health::HealthMonitor& monitor_;
  events::Emitter& emitter_;
  core::logging::Logger& logger_;

  OutcomeQueue queue_;
  std::vector<std::future<void>> in_flight_;
  std::atomic<bool> stop_{false};

  std::mutex digest_mu_;
  std::condition_variable digest_cv_;
  bool digest_stop_ = false;
};

} // namespace linkwatch::runtime
