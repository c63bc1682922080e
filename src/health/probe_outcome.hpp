#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace linkwatch::health {

using Clock = std::chrono::system_clock;

// Parsed latencies must stay below 2^63 us to fit the int64 microsecond rep.
inline constexpr double kMaxLatencyUs = 9223372036854775808.0;

// Why a probe did not produce a reply. All kinds count as one missed probe.
enum class FailureKind {
  kTimeout,
  kUnresolvable,
  kOther,
};

const char* ToString(FailureKind kind);
bool ParseFailureKind(std::string_view text, FailureKind& kind);

// Result of one probe attempt.
//
// - `ts` is when the probe was fired, not when it completed.
// - `latency` is present iff `success`.
// - `failure` is present iff `!success`.
// Use the factories; they are the only way to get a value that honours both
// presence rules.
class ProbeOutcome {
public:
  static ProbeOutcome Success(Clock::time_point ts, std::chrono::microseconds latency) {
    return ProbeOutcome(ts, latency, std::nullopt, {});
  }

  static ProbeOutcome Failure(Clock::time_point ts, FailureKind kind, std::string detail = {}) {
    return ProbeOutcome(ts, std::nullopt, kind, std::move(detail));
  }

  Clock::time_point ts() const {
    return ts_;
  }
  bool success() const {
    return latency_.has_value();
  }
  const std::optional<std::chrono::microseconds>& latency() const {
    return latency_;
  }
  const std::optional<FailureKind>& failure() const {
    return failure_;
  }
  const std::string& detail() const {
    return detail_;
  }

private:
  ProbeOutcome(Clock::time_point ts, std::optional<std::chrono::microseconds> latency,
               std::optional<FailureKind> failure, std::string detail)
      : ts_(ts), latency_(latency), failure_(failure), detail_(std::move(detail)) {}

  Clock::time_point ts_{};
  std::optional<std::chrono::microseconds> latency_;
  std::optional<FailureKind> failure_;
  std::string detail_;
};

} // namespace linkwatch::health
