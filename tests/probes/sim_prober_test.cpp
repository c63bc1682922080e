#include "probes/prober_factory.hpp"
#include "probes/sim_prober.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <limits>
#include <string>
#include <vector>

namespace {

using linkwatch::health::Clock;
using linkwatch::health::FailureKind;
using linkwatch::probes::ProbeRequest;
using linkwatch::probes::SimProber;
using linkwatch::probes::SimStep;
using std::chrono::microseconds;

ProbeRequest Request(std::uint64_t sequence) {
  return ProbeRequest{
      .sequence = sequence,
      .fired_at = Clock::time_point{} + std::chrono::seconds(sequence),
  };
}

std::vector<SimStep> Steps(const std::vector<std::string>& script) {
  std::vector<SimStep> steps;
  std::string error;
  REQUIRE(linkwatch::probes::ParseSimScript(script, steps, error));
  return steps;
}

} // namespace

TEST_CASE("Sim steps parse latencies and failure kinds", "[probes][sim]") {
  SimStep step;
  std::string error;

  REQUIRE(linkwatch::probes::ParseSimStep("30", step, error));
  REQUIRE(step.reply);
  REQUIRE(step.latency == microseconds(30'000));

  REQUIRE(linkwatch::probes::ParseSimStep("12.5", step, error));
  REQUIRE(step.latency == microseconds(12'500));

  REQUIRE(linkwatch::probes::ParseSimStep("timeout", step, error));
  REQUIRE_FALSE(step.reply);
  REQUIRE(step.failure == FailureKind::kTimeout);

  REQUIRE(linkwatch::probes::ParseSimStep("unresolvable", step, error));
  REQUIRE(step.failure == FailureKind::kUnresolvable);

  REQUIRE(linkwatch::probes::ParseSimStep("fail", step, error));
  REQUIRE(step.failure == FailureKind::kOther);

  REQUIRE_FALSE(linkwatch::probes::ParseSimStep("-5", step, error));
  REQUIRE_FALSE(linkwatch::probes::ParseSimStep("30ms", step, error));
  REQUIRE_FALSE(linkwatch::probes::ParseSimStep("", step, error));
  REQUIRE(error.find("expected latency in ms") != std::string::npos);
  REQUIRE_FALSE(linkwatch::probes::ParseSimStep("1e300", step, error));
  REQUIRE(error.find("invalid sim step '1e300'") != std::string::npos);
}

TEST_CASE("Script errors name the failing index", "[probes][sim]") {
  std::vector<SimStep> steps;
  std::string error;
  REQUIRE_FALSE(linkwatch::probes::ParseSimScript({"30", "31", "oops"}, steps, error));
  REQUIRE(error.rfind("sim.script[2]: ", 0) == 0U);
}

TEST_CASE("Sim prober follows the script by sequence", "[probes][sim]") {
  SimProber prober(Steps({"30", "timeout", "45.5"}), true);
  REQUIRE(prober.Name() == "sim");

  const auto first = prober.Probe(Request(0));
  REQUIRE(first.success());
  REQUIRE(first.latency() == microseconds(30'000));
  REQUIRE(first.ts() == Request(0).fired_at);

  const auto second = prober.Probe(Request(1));
  REQUIRE_FALSE(second.success());
  REQUIRE(second.failure() == FailureKind::kTimeout);

  // Out-of-order calls still map to their own step.
  REQUIRE(prober.Probe(Request(5)).latency() == microseconds(45'500));
  REQUIRE(prober.Probe(Request(3)).latency() == microseconds(30'000));
}

TEST_CASE("Non-repeating script times out once exhausted", "[probes][sim]") {
  SimProber prober(Steps({"30", "31"}), false);

  REQUIRE(prober.Probe(Request(1)).success());
  const auto past_end = prober.Probe(Request(2));
  REQUIRE_FALSE(past_end.success());
  REQUIRE(past_end.failure() == FailureKind::kTimeout);
  REQUIRE(past_end.detail() == "sim script exhausted");
}

TEST_CASE("Factory builds a sim prober and rejects bad scripts", "[probes][factory]") {
  std::string error;
  linkwatch::probes::ProberSettings settings;
  settings.kind = linkwatch::probes::ProberKind::kSim;
  settings.sim_script = {"30", "fail"};

  const auto prober = linkwatch::probes::CreateProber(settings, error);
  REQUIRE(prober != nullptr);
  REQUIRE(prober->Name() == "sim");

  settings.sim_script = {"30", "nope"};
  REQUIRE(linkwatch::probes::CreateProber(settings, error) == nullptr);
  REQUIRE(error.find("sim.script[1]") != std::string::npos);
}

TEST_CASE("Factory refuses an icmp prober without a target", "[probes][factory]") {
  std::string error;
  linkwatch::probes::ProberSettings settings;
  settings.kind = linkwatch::probes::ProberKind::kIcmp;

  REQUIRE(linkwatch::probes::CreateProber(settings, error) == nullptr);
  REQUIRE(error == "icmp prober needs a target host");
}

TEST_CASE("Factory refuses icmp timeouts past one day", "[probes][factory]") {
  std::string error;
  linkwatch::probes::ProberSettings settings;
  settings.kind = linkwatch::probes::ProberKind::kIcmp;
  settings.target = "192.0.2.1";
  settings.timeout = std::chrono::milliseconds(std::numeric_limits<int>::max()) * 2;

  REQUIRE(linkwatch::probes::CreateProber(settings, error) == nullptr);
  REQUIRE(error.find("icmp probe timeout must be in") != std::string::npos);

  settings.timeout = std::chrono::milliseconds(0);
  REQUIRE(linkwatch::probes::CreateProber(settings, error) == nullptr);
  REQUIRE(error.find("icmp probe timeout must be in") != std::string::npos);
}

TEST_CASE("Prober kinds round-trip through their names", "[probes][factory]") {
  linkwatch::probes::ProberKind kind = linkwatch::probes::ProberKind::kIcmp;
  REQUIRE(linkwatch::probes::ParseProberKind("sim", kind));
  REQUIRE(kind == linkwatch::probes::ProberKind::kSim);
  REQUIRE(std::string(linkwatch::probes::ToString(kind)) == "sim");
  REQUIRE_FALSE(linkwatch::probes::ParseProberKind("tcp", kind));
}
