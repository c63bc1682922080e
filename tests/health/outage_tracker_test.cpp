#include "health/outage_tracker.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <optional>

namespace {

using linkwatch::health::Clock;
using linkwatch::health::FailureKind;
using linkwatch::health::HealthConfig;
using linkwatch::health::LifecycleEventType;
using linkwatch::health::OutageTracker;
using linkwatch::health::ProbeOutcome;
using std::chrono::milliseconds;
using std::chrono::seconds;

// Tick n of a 60 s cadence starting at 1970-01-01T00:01:00Z.
Clock::time_point Tick(int n) {
  return Clock::time_point{} + seconds(60) * n;
}

ProbeOutcome Miss(int tick, FailureKind kind = FailureKind::kTimeout) {
  return ProbeOutcome::Failure(Tick(tick), kind);
}

ProbeOutcome Reply(int tick, int latency_ms = 30) {
  return ProbeOutcome::Success(Tick(tick), milliseconds(latency_ms));
}

} // namespace

TEST_CASE("One or two misses before a success are never surfaced", "[health][outage]") {
  OutageTracker tracker(HealthConfig{});

  REQUIRE_FALSE(tracker.Evaluate(Miss(1)).has_value());
  REQUIRE_FALSE(tracker.Evaluate(Reply(2)).has_value());

  REQUIRE_FALSE(tracker.Evaluate(Miss(3)).has_value());
  REQUIRE_FALSE(tracker.Evaluate(Miss(4)).has_value());
  REQUIRE(tracker.state().consecutive_misses == 2U);
  REQUIRE_FALSE(tracker.state().active);

  REQUIRE_FALSE(tracker.Evaluate(Reply(5)).has_value());
  REQUIRE(tracker.state().consecutive_misses == 0U);
}

TEST_CASE("Three misses open an outage dated at the first miss", "[health][outage]") {
  OutageTracker tracker(HealthConfig{});

  REQUIRE_FALSE(tracker.Evaluate(Miss(1)).has_value());
  REQUIRE_FALSE(tracker.Evaluate(Miss(2)).has_value());
  const auto started = tracker.Evaluate(Miss(3));

  REQUIRE(started.has_value());
  REQUIRE(started->type == LifecycleEventType::kOutageStarted);
  REQUIRE(started->ts == Tick(1));
  REQUIRE_FALSE(started->duration.has_value());
  REQUIRE(tracker.state().active);
  REQUIRE(tracker.state().start_time == Tick(1));
  REQUIRE(tracker.state().duration == milliseconds(180'000));

  const auto ended = tracker.Evaluate(Reply(4));
  REQUIRE(ended.has_value());
  REQUIRE(ended->type == LifecycleEventType::kOutageEnded);
  REQUIRE(ended->ts == Tick(4));
  REQUIRE(ended->started_at == Tick(1));
  REQUIRE(ended->duration == milliseconds(180'000));
  REQUIRE(ended->probe_count == 3U);

  REQUIRE_FALSE(tracker.state().active);
  REQUIRE(tracker.state().consecutive_misses == 0U);
  REQUIRE_FALSE(tracker.state().start_time.has_value());
}

TEST_CASE("Duration grows with every miss while the outage is active", "[health][outage]") {
  OutageTracker tracker(HealthConfig{});
  for (int tick = 1; tick <= 7; ++tick) {
    const auto event = tracker.Evaluate(Miss(tick));
    REQUIRE(event.has_value() == (tick == 3));
  }
  REQUIRE(tracker.state().duration == milliseconds(7 * 60'000));

  const auto ended = tracker.Evaluate(Reply(8));
  REQUIRE(ended.has_value());
  REQUIRE(ended->duration == milliseconds(7 * 60'000));
  REQUIRE(ended->probe_count == 7U);
}

TEST_CASE("Failure kinds share one miss counter", "[health][outage]") {
  OutageTracker tracker(HealthConfig{});

  REQUIRE_FALSE(tracker.Evaluate(Miss(1, FailureKind::kUnresolvable)).has_value());
  REQUIRE_FALSE(tracker.Evaluate(Miss(2, FailureKind::kTimeout)).has_value());
  const auto started = tracker.Evaluate(Miss(3, FailureKind::kOther));

  REQUIRE(started.has_value());
  REQUIRE(started->type == LifecycleEventType::kOutageStarted);
}

TEST_CASE("Custom threshold and interval drive start and duration", "[health][outage]") {
  HealthConfig config;
  config.outage_miss_threshold = 1;
  config.probe_interval = milliseconds(5'000);
  OutageTracker tracker(config);

  const auto started = tracker.Evaluate(Miss(1));
  REQUIRE(started.has_value());
  REQUIRE(started->probe_count == 1U);

  const auto ended = tracker.Evaluate(Reply(2));
  REQUIRE(ended.has_value());
  REQUIRE(ended->duration == milliseconds(5'000));
}

TEST_CASE("Armed guard suppresses outages until the first success", "[health][outage]") {
  HealthConfig config;
  config.arm_after_first_success = true;
  OutageTracker tracker(config);

  REQUIRE_FALSE(tracker.armed());
  for (int tick = 1; tick <= 5; ++tick) {
    REQUIRE_FALSE(tracker.Evaluate(Miss(tick)).has_value());
  }
  REQUIRE_FALSE(tracker.state().active);
  // No outage was open, so the recovery is silent too.
  REQUIRE_FALSE(tracker.Evaluate(Reply(6)).has_value());
  REQUIRE(tracker.armed());
  REQUIRE(tracker.last_success() == Tick(6));

  REQUIRE_FALSE(tracker.Evaluate(Miss(7)).has_value());
  REQUIRE_FALSE(tracker.Evaluate(Miss(8)).has_value());
  const auto started = tracker.Evaluate(Miss(9));
  REQUIRE(started.has_value());
  REQUIRE(started->ts == Tick(7));
}

TEST_CASE("Without the guard the very first probes can open an outage", "[health][outage]") {
  OutageTracker tracker(HealthConfig{});
  REQUIRE(tracker.armed());

  tracker.Evaluate(Miss(1));
  tracker.Evaluate(Miss(2));
  REQUIRE(tracker.Evaluate(Miss(3)).has_value());
  REQUIRE_FALSE(tracker.last_success().has_value());
}

TEST_CASE("Back-to-back outages are reported separately", "[health][outage]") {
  OutageTracker tracker(HealthConfig{});
  int ended_count = 0;
  int tick = 1;
  for (int round = 0; round < 2; ++round) {
    for (int i = 0; i < 4; ++i) {
      tracker.Evaluate(Miss(tick++));
    }
    const auto ended = tracker.Evaluate(Reply(tick++));
    REQUIRE(ended.has_value());
    REQUIRE(ended->duration == milliseconds(240'000));
    ++ended_count;
  }
  REQUIRE(ended_count == 2);
}
