#include "health/latency_baseline.hpp"

namespace linkwatch::health {

LatencyBaseline::LatencyBaseline(const std::size_t capacity) : capacity_(capacity) {}

void LatencyBaseline::Admit(const std::chrono::microseconds sample) {
  samples_.push_back(sample);
  while (samples_.size() > capacity_) {
    samples_.pop_front();
  }
}

std::optional<double> LatencyBaseline::MeanUs() const {
  if (samples_.empty()) {
    return std::nullopt;
  }
  double total_us = 0.0;
  for (const auto sample : samples_) {
    total_us += static_cast<double>(sample.count());
  }
  return total_us / static_cast<double>(samples_.size());
}

std::optional<double> LatencyBaseline::CutoffUs(const double multiplier) const {
  const auto mean_us = MeanUs();
  if (!mean_us.has_value()) {
    return std::nullopt;
  }
  return mean_us.value() * multiplier;
}

} // namespace linkwatch::health
