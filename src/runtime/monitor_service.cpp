#include "runtime/monitor_service.hpp"

#include "artifacts/digest_writer.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>

namespace linkwatch::runtime {

namespace {

using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
namespace logging = core::logging;

// Longest the scheduler sleeps before re-checking the stop flag.
constexpr std::chrono::milliseconds kStopPollSlice{100};

std::string FormatLatencyMs(const std::chrono::microseconds latency) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << static_cast<double>(latency.count()) / 1000.0;
  return out.str();
}

} // namespace

MonitorService::MonitorService(MonitorServiceOptions options,
                               probes::IProber& prober,
                               health::HealthMonitor& monitor,
                               events::Emitter& emitter,
                               logging::Logger& logger)
    : options_(std::move(options)),
      prober_(prober),
      monitor_(monitor),
      emitter_(emitter),
      logger_(logger) {}

MonitorRunResult MonitorService::Run(const std::atomic<bool>* stop_requested) {
  EmitStarted();

  std::thread consumer([this]() { ConsumeOutcomes(); });
  std::thread digest([this]() { RunDigestLoop(); });

  MonitorRunResult result;
  auto next_tick = SteadyClock::now();
  while (true) {
    if (ShouldStop(stop_requested)) {
      result.stop_reason = "signal";
      break;
    }
    if (options_.max_ticks.has_value() && result.ticks >= options_.max_ticks.value()) {
      result.stop_reason = "max_ticks";
      break;
    }

    const auto now = SteadyClock::now();
    if (now < next_tick) {
      std::this_thread::sleep_for(std::min<SteadyClock::duration>(next_tick - now, kStopPollSlice));
      continue;
    }

    DispatchProbe(result.ticks);
    ++result.ticks;

    next_tick += options_.interval;
    if (SteadyClock::now() - next_tick > options_.interval) {
      // Fell more than a full interval behind (suspend, overloaded host):
      // skip the missed ticks rather than firing a burst.
      logger_.Warn(logging::kCategoryMonitor, "scheduler fell behind; skipping missed ticks");
      next_tick = SteadyClock::now();
    }
    PruneFinishedProbes();
  }

  logger_.Info(logging::kCategoryMonitor, "stopping monitor",
               {{"reason", result.stop_reason}, {"ticks", std::to_string(result.ticks)}});

  WaitForProbes();
  queue_.Close();
  consumer.join();

  {
    std::lock_guard<std::mutex> lock(digest_mu_);
    digest_stop_ = true;
  }
  digest_cv_.notify_all();
  digest.join();

  if (options_.digest_flush_on_shutdown) {
    FlushDigest(SystemClock::now(), "shutdown");
  }

  EmitStopped(result);
  return result;
}

void MonitorService::RequestStop() {
  stop_.store(true);
}

bool MonitorService::ShouldStop(const std::atomic<bool>* stop_requested) const {
  return stop_.load() || (stop_requested != nullptr && stop_requested->load());
}

void MonitorService::DispatchProbe(const std::uint64_t sequence) {
  const probes::ProbeRequest request{.sequence = sequence, .fired_at = SystemClock::now()};
  in_flight_.push_back(std::async(std::launch::async, [this, request]() {
    std::optional<health::ProbeOutcome> outcome;
    try {
      outcome = prober_.Probe(request);
    } catch (const std::exception& ex) {
      // The consumer waits on every sequence, so a throwing prober must still
      // produce an outcome for its tick.
      outcome = health::ProbeOutcome::Failure(request.fired_at, health::FailureKind::kOther,
                                              std::string("prober threw: ") + ex.what());
    }
    queue_.Push(request.sequence, std::move(outcome.value()));
  }));
}

void MonitorService::PruneFinishedProbes() {
  in_flight_.erase(std::remove_if(in_flight_.begin(), in_flight_.end(),
                                  [](const std::future<void>& task) {
                                    return task.wait_for(std::chrono::seconds(0)) ==
                                           std::future_status::ready;
                                  }),
                   in_flight_.end());
}

void MonitorService::WaitForProbes() {
  for (auto& task : in_flight_) {
    task.wait();
  }
  in_flight_.clear();
}

void MonitorService::ConsumeOutcomes() {
  while (auto item = queue_.PopNext()) {
    HandleOutcome(item.value());
  }
}

void MonitorService::HandleOutcome(const SequencedOutcome& item) {
  const health::ProbeOutcome& outcome = item.outcome;
  const std::string sequence = std::to_string(item.sequence);
  const std::string fired_at = core::FormatUtcTimestamp(outcome.ts());

  if (outcome.success()) {
    logger_.Info(logging::kCategoryPing, "echo reply",
                 {{"seq", sequence},
                  {"fired_at", fired_at},
                  {"latency_ms", FormatLatencyMs(outcome.latency().value())}});
  } else {
    logger_.Warn(logging::kCategoryPing, "probe missed",
                 {{"seq", sequence},
                  {"fired_at", fired_at},
                  {"failure", health::ToString(outcome.failure().value_or(
                                  health::FailureKind::kOther))},
                  {"detail", outcome.detail()}});
  }

  std::string error;
  if (!emitter_.EmitProbeOutcome(options_.target, item.sequence, outcome, error)) {
    logger_.Error(logging::kCategoryError, "event stream append failed", {{"error", error}});
  }

  for (const auto& event : monitor_.ProcessProbe(outcome)) {
    const std::string_view category =
        event.IsOutage() ? logging::kCategoryOutage : logging::kCategoryLatency;
    const std::string description = health::Describe(event);
    const std::string at = core::FormatUtcTimestamp(event.ts);
    const std::string count = std::to_string(event.probe_count);
    if (event.IsCompletion()) {
      logger_.Info(category, description,
                   {{"event", health::ToString(event.type)},
                    {"at", at},
                    {"duration_ms", std::to_string(event.duration.value_or(
                                        std::chrono::milliseconds{0}).count())},
                    {"probe_count", count}});
    } else {
      logger_.Warn(category, description,
                   {{"event", health::ToString(event.type)}, {"at", at}, {"probe_count", count}});
    }

    if (!emitter_.EmitLifecycle(options_.target, event, error)) {
      logger_.Error(logging::kCategoryError, "event stream append failed", {{"error", error}});
    }
  }
}

void MonitorService::RunDigestLoop() {
  std::unique_lock<std::mutex> lock(digest_mu_);
  while (!digest_stop_) {
    const auto midnight = core::NextLocalMidnight(SystemClock::now());
    if (digest_cv_.wait_until(lock, midnight, [this]() { return digest_stop_; })) {
      break;
    }
    lock.unlock();
    FlushDigest(SystemClock::now(), "midnight");
    lock.lock();
  }
}

bool MonitorService::FlushDigest(const SystemClock::time_point now, const std::string_view reason) {
  const health::DigestSummary summary = monitor_.FireDigest(now);

  std::filesystem::path written_path;
  std::string error;
  if (!artifacts::WriteDigestMarkdown(summary, options_.target, options_.output_dir,
                                      written_path, error)) {
    logger_.Error(logging::kCategoryError, "digest write failed",
                  {{"date", summary.date}, {"error", error}});
    return false;
  }

  logger_.Info(logging::kCategoryDigest, "digest written",
               {{"reason", reason},
                {"date", summary.date},
                {"path", written_path.string()},
                {"outages", std::to_string(summary.outage_count)},
                {"anomaly_periods", std::to_string(summary.anomaly_count)}});

  if (!emitter_.EmitDigestWritten(summary, written_path, error)) {
    logger_.Error(logging::kCategoryError, "event stream append failed", {{"error", error}});
  }
  return true;
}

void MonitorService::EmitStarted() {
  const health::HealthConfig& config = monitor_.config();
  logger_.Info(logging::kCategoryMonitor, "monitor started",
               {{"prober", prober_.Name()},
                {"interval_ms", std::to_string(options_.interval.count())},
                {"timeout_ms", std::to_string(options_.probe_timeout.count())},
                {"output_dir", options_.output_dir.string()}});

  std::string error;
  const events::Emitter::MonitorStartedEvent started{
      .ts = SystemClock::now(),
      .target = options_.target,
      .prober = prober_.Name(),
      .interval_ms = static_cast<std::uint64_t>(options_.interval.count()),
      .timeout_ms = static_cast<std::uint64_t>(options_.probe_timeout.count()),
      .outage_miss_threshold = config.outage_miss_threshold,
      .anomaly_threshold = config.anomaly_threshold,
      .baseline_window = config.baseline_window,
      .cutoff_multiplier = config.cutoff_multiplier,
  };
  if (!emitter_.EmitMonitorStarted(started, error)) {
    logger_.Error(logging::kCategoryError, "event stream append failed", {{"error", error}});
  }
}

void MonitorService::EmitStopped(const MonitorRunResult& result) {
  std::string error;
  if (!emitter_.EmitMonitorStopped({.ts = SystemClock::now(),
                                    .target = options_.target,
                                    .ticks = result.ticks,
                                    .reason = result.stop_reason},
                                   error)) {
    logger_.Error(logging::kCategoryError, "event stream append failed", {{"error", error}});
  }
  logger_.Info(logging::kCategoryMonitor, "monitor stopped",
               {{"reason", result.stop_reason}, {"ticks", std::to_string(result.ticks)}});
}

} // namespace linkwatch::runtime
