#pragma once

#include "probes/prober.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace linkwatch::probes {

// One scripted outcome. Script text forms:
// - "<ms>"          reply after that many milliseconds (decimals allowed)
// - "fail"          transport error
// - "timeout"       no reply
// - "unresolvable"  name resolution failure
struct SimStep {
  bool reply = true;
  std::chrono::microseconds latency{0};
  health::FailureKind failure = health::FailureKind::kOther;
};

bool ParseSimStep(std::string_view text, SimStep& step, std::string& error);

// Deterministic prober for tests and dry runs. The step is picked by the
// request sequence, so overlapping probes still see the script in tick order.
// Past the end of a non-repeating script every probe times out.
class SimProber final : public IProber {
public:
  SimProber(std::vector<SimStep> script, bool repeat);

  std::string Name() const override {
    return "sim";
  }

  health::ProbeOutcome Probe(const ProbeRequest& request) override;

private:
  std::vector<SimStep> script_;
  bool repeat_ = true;
};

// Parses every entry of `script`; fails on the first bad step with its index.
bool ParseSimScript(const std::vector<std::string>& script, std::vector<SimStep>& steps,
                    std::string& error);

} // namespace linkwatch::probes
