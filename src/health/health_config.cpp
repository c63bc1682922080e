#include "health/health_config.hpp"

namespace linkwatch::health {

bool ValidateHealthConfig(const HealthConfig& config, std::string& error) {
  error.clear();
  if (config.probe_interval.count() <= 0) {
    error = "probe interval must be > 0 ms";
    return false;
  }
  if (config.probe_interval > kMaxProbeInterval) {
    error = "probe interval must be <= " + std::to_string(kMaxProbeInterval.count()) + " ms";
    return false;
  }
  if (config.outage_miss_threshold == 0U) {
    error = "outage miss threshold must be >= 1";
    return false;
  }
  if (config.anomaly_threshold == 0U) {
    error = "anomaly threshold must be >= 1";
    return false;
  }
  if (config.baseline_window == 0U) {
    error = "baseline window must hold at least one sample";
    return false;
  }
  if (!(config.cutoff_multiplier > 0.0)) {
    error = "cutoff multiplier must be > 0";
    return false;
  }
  return true;
}

} // namespace linkwatch::health
