#pragma once

#include "health/health_config.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>

namespace linkwatch::health {

// Rolling window of the most recent normal round-trip latencies.
//
// Contract:
// - holds at most `capacity` samples; admitting one more evicts the oldest.
// - the mean is recomputed from the current contents on every query.
// - an empty window has no mean and therefore no cutoff; callers must treat
//   that as "cannot classify yet" rather than as an anomaly.
// - capacity must be > 0 (enforced by ValidateHealthConfig).
class LatencyBaseline {
public:
  explicit LatencyBaseline(std::size_t capacity = kDefaultBaselineWindow);

  void Admit(std::chrono::microseconds sample);

  std::optional<double> MeanUs() const;
  std::optional<double> CutoffUs(double multiplier) const;

  std::size_t size() const {
    return samples_.size();
  }
  std::size_t capacity() const {
    return capacity_;
  }
  bool empty() const {
    return samples_.empty();
  }
  const std::deque<std::chrono::microseconds>& samples() const {
    return samples_;
  }

private:
  std::size_t capacity_;
  std::deque<std::chrono::microseconds> samples_;
};

} // namespace linkwatch::health
