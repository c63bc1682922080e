#pragma once

#include "health/probe_outcome.hpp"

#include <cstdint>
#include <string>

namespace linkwatch::probes {

// One scheduled probe. `sequence` is the scheduler tick (starting at 0) and
// `fired_at` becomes the outcome timestamp.
struct ProbeRequest {
  std::uint64_t sequence = 0;
  health::Clock::time_point fired_at{};
};

// Reachability/latency probe contract used by the monitor runtime.
//
// Contract goals:
// - one call = one outcome; transport problems are reported through the
//   outcome's failure kind, never thrown
// - calls may overlap when a probe outlives the interval, so implementations
//   must be safe to call from several threads at once
// - the outcome timestamp is `request.fired_at`, not the completion time
class IProber {
public:
  virtual ~IProber() = default;

  virtual std::string Name() const = 0;

  virtual health::ProbeOutcome Probe(const ProbeRequest& request) = 0;
};

} // namespace linkwatch::probes
