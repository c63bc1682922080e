#pragma once

#include "probes/prober.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace linkwatch::probes {

struct IcmpProberOptions {
  std::string target;
  // Budget for the whole probe, all echo requests included.
  std::chrono::milliseconds timeout{30'000};
  std::uint32_t count = 1;
  std::size_t payload_bytes = 56;
};

// IPv4 ICMP echo prober (Linux).
//
// - the target name is resolved on every probe so DNS outages surface as
//   `kUnresolvable` instead of being masked by a cached address.
// - prefers an unprivileged datagram ICMP socket (net.ipv4.ping_group_range);
//   falls back to a raw socket when the process has CAP_NET_RAW.
// - sends up to `count` echo requests one after another within `timeout`;
//   the outcome latency is the fastest reply.
// - no reply inside the budget is `kTimeout`; socket errors are `kOther`.
class IcmpProber final : public IProber {
public:
  explicit IcmpProber(IcmpProberOptions options);

  std::string Name() const override {
    return "icmp";
  }

  health::ProbeOutcome Probe(const ProbeRequest& request) override;

  // Opens and closes one socket to tell the caller up front whether this
  // process may send ICMP at all.
  static bool CheckSocketPermission(std::string& error);

private:
  IcmpProberOptions options_;
  std::uint16_t identifier_ = 0;
  std::atomic<std::uint16_t> next_sequence_{1};
};

// RFC 1071 internet checksum over `length` bytes.
std::uint16_t InternetChecksum(const void* data, std::size_t length);

} // namespace linkwatch::probes
