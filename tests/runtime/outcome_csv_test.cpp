#include "runtime/outcome_csv.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

using linkwatch::health::FailureKind;
using linkwatch::health::ProbeOutcome;
using linkwatch::runtime::ParseOutcomeCsv;

TEST_CASE("Outcome rows parse with header and comments", "[runtime][csv]") {
  std::istringstream input(
      "# captured from a flaky uplink\n"
      "ts_ms,status,value\n"
      "60000,ok,30.5\n"
      "\n"
      "120000,FAIL,timeout\n"
      "180000,fail\n"
      "240000, ok , 31\n");

  std::vector<ProbeOutcome> outcomes;
  std::string error;
  REQUIRE(ParseOutcomeCsv(input, outcomes, error));
  REQUIRE(outcomes.size() == 4U);

  REQUIRE(outcomes[0].success());
  REQUIRE(outcomes[0].latency() == std::chrono::microseconds(30'500));
  REQUIRE(outcomes[0].ts().time_since_epoch() ==
          std::chrono::duration_cast<linkwatch::health::Clock::duration>(
              std::chrono::milliseconds(60'000)));

  REQUIRE(outcomes[1].failure() == FailureKind::kTimeout);
  REQUIRE(outcomes[2].failure() == FailureKind::kOther);
  REQUIRE(outcomes[3].latency() == std::chrono::microseconds(31'000));
}

TEST_CASE("Bad outcome rows report their line number", "[runtime][csv]") {
  std::vector<ProbeOutcome> outcomes;
  std::string error;

  std::istringstream bad_status("60000,ok,30\n120000,maybe\n");
  REQUIRE_FALSE(ParseOutcomeCsv(bad_status, outcomes, error));
  REQUIRE(error.rfind("line 2: ", 0) == 0U);

  std::istringstream bad_latency("60000,ok,fast\n");
  REQUIRE_FALSE(ParseOutcomeCsv(bad_latency, outcomes, error));
  REQUIRE(error.find("invalid latency") != std::string::npos);

  // Would overflow the microsecond rep and read back as a negative reply.
  std::istringstream huge_latency("0,ok,1e300\n");
  REQUIRE_FALSE(ParseOutcomeCsv(huge_latency, outcomes, error));
  REQUIRE(error.find("invalid latency '1e300'") != std::string::npos);

  std::istringstream edge_latency("0,ok,9223372036854775.808\n");
  REQUIRE_FALSE(ParseOutcomeCsv(edge_latency, outcomes, error));

  std::istringstream bad_kind("60000,fail,lost\n");
  REQUIRE_FALSE(ParseOutcomeCsv(bad_kind, outcomes, error));
  REQUIRE(error.find("invalid failure kind") != std::string::npos);
}

TEST_CASE("Outcome timestamps must not go backwards", "[runtime][csv]") {
  std::istringstream input("120000,ok,30\n60000,ok,30\n");
  std::vector<ProbeOutcome> outcomes;
  std::string error;

  REQUIRE_FALSE(ParseOutcomeCsv(input, outcomes, error));
  REQUIRE(error == "line 2: timestamps must not go backwards");
}
