#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace linkwatch::health {

constexpr std::chrono::milliseconds kDefaultProbeInterval{60'000};
constexpr std::uint32_t kDefaultOutageMissThreshold = 3U;
constexpr std::uint32_t kDefaultAnomalyThreshold = 3U;
constexpr std::size_t kDefaultBaselineWindow = 10U;
constexpr double kDefaultCutoffMultiplier = 3.0;
// Upper bound for the interval and the probe timeout: one digest cycle.
// Keeps interval x miss count and clock deadlines inside the int64 rep.
constexpr std::chrono::milliseconds kMaxProbeInterval = std::chrono::hours(24);

// Classification constants consumed by the health core. The core never
// measures the interval; it is the configured cadence and is used to turn
// probe counts into durations.
struct HealthConfig {
  std::chrono::milliseconds probe_interval = kDefaultProbeInterval;
  // Consecutive misses needed to open an outage.
  std::uint32_t outage_miss_threshold = kDefaultOutageMissThreshold;
  // Consecutive slow replies needed to open a latency anomaly period.
  std::uint32_t anomaly_threshold = kDefaultAnomalyThreshold;
  std::size_t baseline_window = kDefaultBaselineWindow;
  double cutoff_multiplier = kDefaultCutoffMultiplier;
  // When set, misses before the first successful probe never open an
  // outage (a target that was never reachable is a config problem, not an
  // outage).
  bool arm_after_first_success = false;
};

// Rejects non-positive thresholds, window and multiplier, and an interval
// outside (0, kMaxProbeInterval].
bool ValidateHealthConfig(const HealthConfig& config, std::string& error);

} // namespace linkwatch::health
