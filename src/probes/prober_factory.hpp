#pragma once

#include "probes/prober.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace linkwatch::probes {

enum class ProberKind {
  kIcmp,
  kSim,
};

const char* ToString(ProberKind kind);
bool ParseProberKind(std::string_view text, ProberKind& kind);

// Everything needed to build a prober; filled from the monitor config.
struct ProberSettings {
  ProberKind kind = ProberKind::kIcmp;
  std::string target;
  std::chrono::milliseconds timeout{30'000};
  std::uint32_t count = 1;
  std::vector<std::string> sim_script;
  bool sim_repeat = true;
};

// Creates the prober selected by `settings.kind`.
// Returns nullptr with `error` when the sim script does not parse or the
// process cannot open an ICMP socket.
std::unique_ptr<IProber> CreateProber(const ProberSettings& settings, std::string& error);

} // namespace linkwatch::probes
