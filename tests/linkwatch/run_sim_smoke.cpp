#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace linkwatch::tests::common;

namespace {

void RunScriptedMonitorWritesEventsAndLog(const fs::path& temp_root) {
  const fs::path out_dir = temp_root / "out";

  int exit_code = 0;
  std::string stdout_text;
  {
    ScopedStreamCapture capture(std::cout);
    exit_code = DispatchArgs({"linkwatch", "run", "--sim", "--max-ticks", "18", "--interval-ms",
                              "5", "--out", out_dir.string()});
    stdout_text = capture.str();
  }
  AssertTrue(exit_code == 0, "run --sim should exit 0");
  AssertContains(stdout_text, "monitoring sim every 5 ms");
  AssertContains(stdout_text, "monitor stopped: reason=max_ticks ticks=18");

  const std::vector<std::string> lines = ReadNonEmptyLines(out_dir / "events.jsonl");
  AssertTrue(!lines.empty(), "event stream must not be empty");
  AssertContains(lines.front(), "\"type\":\"MONITOR_STARTED\"");
  AssertContains(lines.back(), "\"type\":\"MONITOR_STOPPED\"");
  AssertContains(lines.back(), "\"reason\":\"max_ticks\"");

  std::size_t probe_lines = 0;
  std::string lifecycle_types;
  for (const auto& line : lines) {
    if (line.find("\"type\":\"PROBE_") != std::string::npos) {
      ++probe_lines;
    }
    for (const char* type : {"OUTAGE_STARTED", "OUTAGE_ENDED", "LATENCY_ANOMALY_STARTED",
                             "LATENCY_ANOMALY_ENDED"}) {
      if (line.find(std::string("\"type\":\"") + type + "\"") != std::string::npos) {
        lifecycle_types += std::string(type) + ";";
      }
    }
  }
  AssertTrue(probe_lines == 18U, "expected one probe record per tick");
  AssertTrue(lifecycle_types ==
                 "OUTAGE_STARTED;OUTAGE_ENDED;LATENCY_ANOMALY_STARTED;LATENCY_ANOMALY_ENDED;",
             "unexpected lifecycle sequence: " + lifecycle_types);

  const std::string log_text = ReadFileToString(out_dir / "linkwatch.log");
  AssertContains(log_text, "category=\"MONITOR\"");
  AssertContains(log_text, "msg=\"monitor started\"");
  AssertContains(log_text, "category=\"PING\"");
  AssertContains(log_text, "category=\"OUTAGE\"");
  AssertContains(log_text, "Lost contact after 3 missed probes");
  AssertContains(log_text, "Connection restored. Total outage duration");
  AssertContains(log_text, "category=\"LATENCY\"");
  AssertContains(log_text, "Period of high latency started after 3 slow replies");
  AssertContains(log_text, "target=\"sim\"");
  AssertNotContains(log_text, "category=\"TRACE\"");
}

void RunWithTraceAddsClassificationLines(const fs::path& temp_root) {
  const fs::path out_dir = temp_root / "trace-out";
  int exit_code = 0;
  {
    ScopedStreamCapture capture(std::cout);
    exit_code = DispatchArgs({"linkwatch", "run", "--sim", "--trace", "--max-ticks", "6",
                              "--interval-ms", "5", "--out", out_dir.string()});
  }
  AssertTrue(exit_code == 0, "run --sim --trace should exit 0");

  const std::string log_text = ReadFileToString(out_dir / "linkwatch.log");
  AssertContains(log_text, "category=\"TRACE\"");
  AssertContains(log_text, "msg=\"latency classified\"");
}

void ShutdownFlushWritesDigest(const fs::path& temp_root) {
  const fs::path out_dir = temp_root / "flush-out";
  const fs::path config_path = temp_root / "flush.json";
  WriteTextFile(config_path, R"({
    "prober": "sim",
    "target": "lab-router",
    "sim": {"script": ["20", "fail", "fail", "fail", "20", "21"]},
    "output": {"digest_flush_on_shutdown": true}
  })");

  int exit_code = 0;
  {
    ScopedStreamCapture capture(std::cout);
    exit_code = DispatchArgs({"linkwatch", "run", "--config", config_path.string(), "--max-ticks",
                              "6", "--interval-ms", "5", "--out", out_dir.string()});
  }
  AssertTrue(exit_code == 0, "run with shutdown flush should exit 0");

  bool found_digest = false;
  for (const auto& entry : fs::directory_iterator(out_dir)) {
    const std::string name = entry.path().filename().string();
    if (name.rfind("digest-", 0) == 0U) {
      found_digest = true;
      const std::string digest = ReadFileToString(entry.path());
      AssertContains(digest, "- target: `lab-router`");
      AssertContains(digest, "- Number of outages: 1");
      AssertContains(digest, "- Number of high-latency periods: 0");
    }
  }
  AssertTrue(found_digest, "shutdown flush must write a digest file");

  const std::string events = ReadFileToString(out_dir / "events.jsonl");
  AssertContains(events, "\"type\":\"DIGEST_WRITTEN\"");
}

void UnwritableOutputDirExitsWithSinkCode(const fs::path& temp_root) {
  const fs::path blocker = temp_root / "blocker";
  WriteTextFile(blocker, "not a directory");

  int exit_code = 0;
  std::string stderr_text;
  {
    ScopedStreamCapture capture(std::cerr);
    exit_code = DispatchArgs({"linkwatch", "run", "--sim", "--max-ticks", "1", "--out",
                              (blocker / "out").string()});
    stderr_text = capture.str();
  }
  AssertTrue(exit_code == 20, "unwritable output dir must exit 20");
  AssertContains(stderr_text, "error:");
}

void MissingTargetIsConfigError() {
  int exit_code = 0;
  std::string stderr_text;
  {
    ScopedStreamCapture capture(std::cerr);
    exit_code = DispatchArgs({"linkwatch", "run", "--max-ticks", "1"});
    stderr_text = capture.str();
  }
  AssertTrue(exit_code == 10, "run without a target must exit 10");
  AssertContains(stderr_text, "target");
}

void UnknownFlagIsUsageError() {
  int exit_code = 0;
  {
    ScopedStreamCapture capture(std::cerr);
    exit_code = DispatchArgs({"linkwatch", "run", "--frobnicate"});
  }
  AssertTrue(exit_code == 2, "unknown flag must exit 2");
}

} // namespace

int main() {
  const fs::path temp_root = CreateUniqueTempDir("linkwatch-run-sim-smoke");

  RunScriptedMonitorWritesEventsAndLog(temp_root);
  RunWithTraceAddsClassificationLines(temp_root);
  ShutdownFlushWritesDigest(temp_root);
  UnwritableOutputDirExitsWithSinkCode(temp_root);
  MissingTargetIsConfigError();
  UnknownFlagIsUsageError();

  RemovePathBestEffort(temp_root);
  std::cout << "run_sim_smoke: ok\n";
  return 0;
}
