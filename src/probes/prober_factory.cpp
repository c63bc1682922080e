#include "probes/prober_factory.hpp"

#include "health/health_config.hpp"
#include "probes/icmp_prober.hpp"
#include "probes/sim_prober.hpp"

#include <string>
#include <utility>

namespace linkwatch::probes {

const char* ToString(const ProberKind kind) {
  switch (kind) {
  case ProberKind::kIcmp:
    return "icmp";
  case ProberKind::kSim:
    return "sim";
  }
  return "icmp";
}

bool ParseProberKind(std::string_view text, ProberKind& kind) {
  if (text == "icmp") {
    kind = ProberKind::kIcmp;
    return true;
  }
  if (text == "sim") {
    kind = ProberKind::kSim;
    return true;
  }
  return false;
}

std::unique_ptr<IProber> CreateProber(const ProberSettings& settings, std::string& error) {
  switch (settings.kind) {
  case ProberKind::kSim: {
    std::vector<SimStep> steps;
    if (!ParseSimScript(settings.sim_script, steps, error)) {
      return nullptr;
    }
    return std::make_unique<SimProber>(std::move(steps), settings.sim_repeat);
  }
  case ProberKind::kIcmp:
    if (settings.target.empty()) {
      error = "icmp prober needs a target host";
      return nullptr;
    }
    if (settings.timeout.count() <= 0 || settings.timeout > health::kMaxProbeInterval) {
      error = "icmp probe timeout must be in (0, " +
              std::to_string(health::kMaxProbeInterval.count()) + "] ms";
      return nullptr;
    }
    if (!IcmpProber::CheckSocketPermission(error)) {
      return nullptr;
    }
    return std::make_unique<IcmpProber>(IcmpProberOptions{
        .target = settings.target,
        .timeout = settings.timeout,
        .count = settings.count,
    });
  }
  error = "unknown prober kind";
  return nullptr;
}

} // namespace linkwatch::probes
