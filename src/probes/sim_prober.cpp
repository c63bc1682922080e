#include "probes/sim_prober.hpp"

#include <charconv>
#include <cstdint>
#include <cmath>
#include <utility>

namespace linkwatch::probes {

bool ParseSimStep(std::string_view text, SimStep& step, std::string& error) {
  if (text == "fail" || text == "timeout" || text == "unresolvable") {
    health::FailureKind kind = health::FailureKind::kOther;
    if (!health::ParseFailureKind(text, kind)) {
      error = "unknown sim step '" + std::string(text) + "'";
      return false;
    }
    step = SimStep{.reply = false, .latency = std::chrono::microseconds{0}, .failure = kind};
    return true;
  }

  double latency_ms = 0.0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, latency_ms);
  if (text.empty() || ec != std::errc{} || ptr != end || !std::isfinite(latency_ms) ||
      latency_ms < 0.0 || latency_ms * 1000.0 >= health::kMaxLatencyUs) {
    error = "invalid sim step '" + std::string(text) +
            "' (expected latency in ms, fail, timeout or unresolvable)";
    return false;
  }

  step = SimStep{
      .reply = true,
      .latency = std::chrono::microseconds{static_cast<std::int64_t>(std::llround(latency_ms * 1000.0))},
      .failure = health::FailureKind::kOther,
  };
  return true;
}

bool ParseSimScript(const std::vector<std::string>& script, std::vector<SimStep>& steps,
                    std::string& error) {
  steps.clear();
  steps.reserve(script.size());
  for (std::size_t i = 0; i < script.size(); ++i) {
    SimStep step;
    std::string step_error;
    if (!ParseSimStep(script[i], step, step_error)) {
      error = "sim.script[" + std::to_string(i) + "]: " + step_error;
      return false;
    }
    steps.push_back(step);
  }
  return true;
}

SimProber::SimProber(std::vector<SimStep> script, const bool repeat)
    : script_(std::move(script)), repeat_(repeat) {}

health::ProbeOutcome SimProber::Probe(const ProbeRequest& request) {
  if (script_.empty() || (!repeat_ && request.sequence >= script_.size())) {
    return health::ProbeOutcome::Failure(request.fired_at, health::FailureKind::kTimeout,
                                         "sim script exhausted");
  }

  const SimStep& step = script_[request.sequence % script_.size()];
  if (step.reply) {
    return health::ProbeOutcome::Success(request.fired_at, step.latency);
  }
  return health::ProbeOutcome::Failure(request.fired_at, step.failure,
                                       std::string("sim ") + health::ToString(step.failure));
}

} // namespace linkwatch::probes
