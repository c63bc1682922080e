#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "events/emitter.hpp"
#include "health/digest_aggregator.hpp"
#include "health/lifecycle_event.hpp"
#include "health/probe_outcome.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace linkwatch::tests::common;

namespace {

std::chrono::system_clock::time_point AtMs(long long ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

int main() {
  const fs::path temp_root = CreateUniqueTempDir("linkwatch-emitter-smoke");
  // Emitter creates the output directory itself.
  const fs::path out_dir = temp_root / "out";

  std::string error;
  linkwatch::events::Emitter emitter(out_dir);

  if (!emitter.EmitMonitorStarted(
          {
              .ts = AtMs(1'000),
              .target = "192.0.2.1",
              .prober = "icmp",
              .interval_ms = 60'000,
              .timeout_ms = 30'000,
              .outage_miss_threshold = 3,
              .anomaly_threshold = 3,
              .baseline_window = 10,
              .cutoff_multiplier = 3.0,
          },
          error)) {
    Fail("EmitMonitorStarted failed: " + error);
  }

  const auto reply =
      linkwatch::health::ProbeOutcome::Success(AtMs(60'000), std::chrono::microseconds(30'250));
  if (!emitter.EmitProbeOutcome("192.0.2.1", 0, reply, error)) {
    Fail("EmitProbeOutcome(reply) failed: " + error);
  }

  const auto miss = linkwatch::health::ProbeOutcome::Failure(
      AtMs(120'000), linkwatch::health::FailureKind::kUnresolvable, "getaddrinfo: no such host");
  if (!emitter.EmitProbeOutcome("192.0.2.1", 1, miss, error)) {
    Fail("EmitProbeOutcome(miss) failed: " + error);
  }

  const auto ended = linkwatch::health::MakeOutageEnded(AtMs(300'000), AtMs(120'000),
                                                        std::chrono::milliseconds(180'000), 3);
  if (!emitter.EmitLifecycle("192.0.2.1", ended, error)) {
    Fail("EmitLifecycle failed: " + error);
  }

  linkwatch::health::DigestSummary summary;
  summary.date = "19700101";
  summary.period_start = AtMs(0);
  summary.period_end = AtMs(400'000);
  summary.outage_count = 1;
  summary.probes_total = 6;
  summary.probes_failed = 3;
  if (!emitter.EmitDigestWritten(summary, out_dir / "digest-19700101.md", error)) {
    Fail("EmitDigestWritten failed: " + error);
  }

  if (!emitter.EmitMonitorStopped(
          {.ts = AtMs(500'000), .target = "192.0.2.1", .ticks = 6, .reason = "signal"}, error)) {
    Fail("EmitMonitorStopped failed: " + error);
  }

  AssertTrue(emitter.events_path() == out_dir / "events.jsonl", "unexpected events path");
  const std::vector<std::string> lines = ReadNonEmptyLines(emitter.events_path());
  if (lines.size() != 6U) {
    Fail("expected exactly six event lines");
  }

  AssertContains(lines[0], "\"type\":\"MONITOR_STARTED\"");
  AssertContains(lines[0], "\"interval_ms\":\"60000\"");
  AssertContains(lines[0], "\"prober\":\"icmp\"");
  AssertContains(lines[0], "\"cutoff_multiplier\":\"3\"");

  AssertContains(lines[1], "\"ts_utc\":\"1970-01-01T00:01:00.000Z\"");
  AssertContains(lines[1], "\"type\":\"PROBE_SUCCEEDED\"");
  AssertContains(lines[1], "\"latency_ms\":\"30.250\"");
  AssertContains(lines[1], "\"sequence\":\"0\"");

  AssertContains(lines[2], "\"type\":\"PROBE_FAILED\"");
  AssertContains(lines[2], "\"failure\":\"unresolvable\"");
  AssertContains(lines[2], "\"detail\":\"getaddrinfo: no such host\"");
  AssertNotContains(lines[2], "latency_ms");

  AssertContains(lines[3], "\"type\":\"OUTAGE_ENDED\"");
  AssertContains(lines[3], "\"duration_ms\":\"180000\"");
  AssertContains(lines[3], "\"duration_minutes\":\"3.00\"");
  AssertContains(lines[3], "\"started_at_utc\":\"1970-01-01T00:02:00.000Z\"");
  AssertContains(lines[3], "Connection restored. Total outage duration 3.00 minutes");

  AssertContains(lines[4], "\"type\":\"DIGEST_WRITTEN\"");
  AssertContains(lines[4], "\"outage_count\":\"1\"");
  AssertContains(lines[4], "digest-19700101.md");

  AssertContains(lines[5], "\"type\":\"MONITOR_STOPPED\"");
  AssertContains(lines[5], "\"reason\":\"signal\"");
  AssertContains(lines[5], "\"ticks\":\"6\"");

  RemovePathBestEffort(temp_root);
  std::cout << "emitter_smoke: ok\n";
  return 0;
}
