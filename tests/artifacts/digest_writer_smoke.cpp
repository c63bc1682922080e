#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "artifacts/digest_writer.hpp"
#include "health/digest_aggregator.hpp"
#include "health/lifecycle_event.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace linkwatch::tests::common;

namespace {

using linkwatch::health::Clock;

// 2024-03-10 12:00:00 UTC.
const Clock::time_point kNoon = Clock::time_point{} + std::chrono::seconds(1'710'072'000);

linkwatch::health::DigestSummary BuildSummary() {
  linkwatch::health::DigestAggregator aggregator(kNoon);
  aggregator.OnCompletedEvent(linkwatch::health::MakeOutageEnded(
      kNoon + std::chrono::minutes(4), kNoon + std::chrono::minutes(1),
      std::chrono::milliseconds(180'000), 3));
  aggregator.OnCompletedEvent(linkwatch::health::MakeAnomalyPeriodEnded(
      kNoon + std::chrono::minutes(20), kNoon + std::chrono::minutes(15),
      std::chrono::milliseconds(300'000), 5));
  for (int i = 0; i < 8; ++i) {
    aggregator.OnProbe(linkwatch::health::ProbeOutcome::Success(kNoon, std::chrono::milliseconds(30)));
  }
  for (int i = 0; i < 2; ++i) {
    aggregator.OnProbe(
        linkwatch::health::ProbeOutcome::Failure(kNoon, linkwatch::health::FailureKind::kTimeout));
  }
  return aggregator.Fire(kNoon + std::chrono::hours(1));
}

} // namespace

int main() {
  const fs::path temp_root = CreateUniqueTempDir("linkwatch-digest-writer-smoke");
  const fs::path out_dir = temp_root / "digests";

  const auto summary = BuildSummary();
  const std::string markdown = linkwatch::artifacts::RenderDigestMarkdown(summary, "192.0.2.1");
  AssertContains(markdown, "# Daily digest " + summary.date);
  AssertContains(markdown, "- target: `192.0.2.1`");
  AssertContains(markdown, "- probes: 10 sent, 2 missed (20.00%)");
  AssertContains(markdown, "## Outages");
  AssertContains(markdown, "- Number of outages: 1");
  AssertContains(markdown, "## Latency anomaly periods");
  AssertContains(markdown, "- Number of high-latency periods: 1");
  AssertContains(markdown, "| 3.00 | 3 |");
  AssertContains(markdown, "| 5.00 | 5 |");

  fs::path written_path;
  std::string error;
  if (!linkwatch::artifacts::WriteDigestMarkdown(summary, "192.0.2.1", out_dir, written_path,
                                                 error)) {
    Fail("WriteDigestMarkdown failed: " + error);
  }
  AssertTrue(written_path == out_dir / ("digest-" + summary.date + ".md"),
             "digest file must be named after the summarized date");

  // A second section for the same date is appended, not overwritten.
  linkwatch::health::DigestAggregator quiet(kNoon);
  auto quiet_summary = quiet.Fire(kNoon + std::chrono::hours(2));
  if (!linkwatch::artifacts::WriteDigestMarkdown(quiet_summary, "192.0.2.1", out_dir,
                                                 written_path, error)) {
    Fail("second WriteDigestMarkdown failed: " + error);
  }

  const std::string contents = ReadFileToString(written_path);
  AssertTrue(CountOccurrences(contents, "# Daily digest ") == 2U,
             "expected two digest sections in one file");
  AssertContains(contents, "- Number of outages: 0");
  AssertContains(contents, "- probes: 0 sent, 0 missed (0.00%)");

  quiet_summary.date.clear();
  if (linkwatch::artifacts::WriteDigestMarkdown(quiet_summary, "192.0.2.1", out_dir, written_path,
                                                error)) {
    Fail("digest without a date must be rejected");
  }
  AssertContains(error, "no date");

  RemovePathBestEffort(temp_root);
  std::cout << "digest_writer_smoke: ok\n";
  return 0;
}
