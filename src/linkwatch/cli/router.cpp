#include "linkwatch/cli/router.hpp"

#include "artifacts/digest_writer.hpp"
#include "config/monitor_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "events/emitter.hpp"
#include "health/health_monitor.hpp"
#include "probes/prober_factory.hpp"
#include "runtime/monitor_service.hpp"
#include "runtime/outcome_csv.hpp"

#include <atomic>
#include <charconv>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace linkwatch::cli {

namespace {

using core::errors::ExitCode;
using core::errors::ToInt;

constexpr int kExitSuccess = ToInt(ExitCode::kSuccess);
constexpr int kExitFailure = ToInt(ExitCode::kFailure);
constexpr int kExitUsage = ToInt(ExitCode::kUsage);
constexpr int kExitConfigInvalid = ToInt(ExitCode::kConfigInvalid);
constexpr int kExitLogSinkUnavailable = ToInt(ExitCode::kLogSinkUnavailable);
constexpr int kExitProberUnavailable = ToInt(ExitCode::kProberUnavailable);

constexpr std::string_view kVersion = "0.1.0";
constexpr std::string_view kLogFileName = "linkwatch.log";

// Used by `run --sim` when the config carries no script: a few normal
// replies, one outage, then a latency spike long enough to be reported.
const std::vector<std::string> kDefaultSimScript = {
    "30", "31", "29", "30", "32", "fail", "timeout", "fail", "31",
    "30", "29", "140", "150", "145", "31", "30", "30", "29",
};

// Set from the signal handler, polled by the scheduler.
std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int /*signal_number*/) {
  g_stop_requested.store(true);
}

// Routes SIGINT/SIGTERM to g_stop_requested for the lifetime of one run and
// restores the previous dispositions afterwards.
class ScopedStopSignals {
public:
  ScopedStopSignals() {
    g_stop_requested.store(false);
    previous_int_ = std::signal(SIGINT, HandleStopSignal);
    previous_term_ = std::signal(SIGTERM, HandleStopSignal);
  }

  ~ScopedStopSignals() {
    if (previous_int_ != SIG_ERR) {
      std::signal(SIGINT, previous_int_);
    }
    if (previous_term_ != SIG_ERR) {
      std::signal(SIGTERM, previous_term_);
    }
  }

  ScopedStopSignals(const ScopedStopSignals&) = delete;
  ScopedStopSignals& operator=(const ScopedStopSignals&) = delete;

private:
  void (*previous_int_)(int) = SIG_DFL;
  void (*previous_term_)(int) = SIG_DFL;
};

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  linkwatch run -i <host> [--config <file.json>] [--out <dir>] [--interval-ms N]\n"
      << "                [--timeout-ms N] [--max-ticks N] [--sim] [--trace]\n"
      << "                [--log-level <" << core::logging::ExpectedLogLevelList() << ">]\n"
      << "  linkwatch replay <outcomes.csv> [--config <file.json>] [--interval-ms N] [--trace]\n"
      << "  linkwatch validate <config.json>\n"
      << "  linkwatch version\n";
}

bool ParseUnsignedValue(std::string_view flag, std::string_view raw, std::uint64_t& out,
                        std::string& error) {
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (raw.empty() || ec != std::errc{} || ptr != raw.data() + raw.size()) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected a non-negative integer)";
    return false;
  }
  out = parsed;
  return true;
}

// Fetches the value following `args[i]` and advances `i`.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[++i];
  return true;
}

// Parse `run` args. No positional arguments; unknown flags are usage errors.
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--sim") {
      options.sim = true;
      continue;
    }
    if (token == "--trace") {
      options.log_level = core::logging::LogLevel::kDebug;
      continue;
    }
    if (token == "-i" || token == "--target") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.target = std::string(value);
      continue;
    }
    if (token == "--config") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--interval-ms" || token == "--timeout-ms" || token == "--max-ticks") {
      std::uint64_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsignedValue(token, value, parsed, error)) {
        return false;
      }
      if (token == "--interval-ms") {
        options.interval_ms = parsed;
      } else if (token == "--timeout-ms") {
        options.timeout_ms = parsed;
      } else {
        options.max_ticks = parsed;
      }
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "run does not take positional arguments (use -i <host>): " + std::string(token);
    }
    return false;
  }
  return true;
}

void ApplyRunOverrides(const RunOptions& options, config::MonitorConfig& config) {
  if (options.target.has_value()) {
    config.target = options.target.value();
  }
  if (options.output_dir.has_value()) {
    config.output.dir = options.output_dir.value();
  }
  if (options.interval_ms.has_value()) {
    config.probe.interval = std::chrono::milliseconds(options.interval_ms.value());
  }
  if (options.timeout_ms.has_value()) {
    config.probe.timeout = std::chrono::milliseconds(options.timeout_ms.value());
  }
  if (options.max_ticks.has_value()) {
    config.max_ticks = options.max_ticks.value();
  }
  if (options.log_level.has_value()) {
    config.log_level = options.log_level.value();
  }
  if (options.sim) {
    config.prober = probes::ProberKind::kSim;
  }
  if (config.prober == probes::ProberKind::kSim) {
    if (config.sim.script.empty()) {
      config.sim.script = kDefaultSimScript;
    }
    if (config.target.empty()) {
      config.target = "sim";
    }
  }
}

void PrintIssues(const fs::path& path, const config::ValidationReport& report) {
  std::cerr << "invalid config: " << (path.empty() ? std::string("<command line>") : path.string())
            << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Loads the optional config file into `config`. Returns an exit code other
// than kExitSuccess on failure, after printing the reason.
int LoadConfigOrReport(const std::optional<fs::path>& config_path, config::MonitorConfig& config,
                       config::ValidationReport& report) {
  if (!config_path.has_value()) {
    return kExitSuccess;
  }
  std::string error;
  if (!config::LoadMonitorConfigFile(config_path.value(), config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!report.issues.empty()) {
    PrintIssues(config_path.value(), report);
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "linkwatch " << kVersion << '\n';
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  config::MonitorConfig config;
  config::ValidationReport report;
  std::string error;
  if (!config::LoadMonitorConfigFile(config_path, config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  config::ValidateMonitorConfig(config, report);
  if (!report.valid) {
    PrintIssues(config_path, report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::MonitorConfig config;
  config::ValidationReport report;
  if (const int load_code = LoadConfigOrReport(options.config_path, config, report);
      load_code != kExitSuccess) {
    return load_code;
  }
  ApplyRunOverrides(options, config);
  config::ValidateMonitorConfig(config, report);
  if (!report.valid) {
    PrintIssues(options.config_path.value_or(fs::path()), report);
    return kExitConfigInvalid;
  }

  // Nothing is probed until the log sink is known to be writable.
  const fs::path output_dir = config.output.dir;
  if (!core::EnsureDirectory(output_dir, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitLogSinkUnavailable;
  }
  const fs::path log_path = output_dir / kLogFileName;
  core::logging::Logger logger(config.log_level);
  if (!logger.OpenFile(log_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitLogSinkUnavailable;
  }
  logger.SetTarget(config.target);

  auto monitor = health::CreateHealthMonitor(config::ToHealthConfig(config), &logger, error);
  if (monitor == nullptr) {
    logger.Error(core::logging::kCategoryError, "invalid health config", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  auto prober = probes::CreateProber(config::ToProberSettings(config), error);
  if (prober == nullptr) {
    logger.Error(core::logging::kCategoryError, "prober unavailable", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitProberUnavailable;
  }

  events::Emitter emitter(output_dir);
  runtime::MonitorService service(
      runtime::MonitorServiceOptions{
          .target = config.target,
          .interval = config.probe.interval,
          .probe_timeout = config.probe.timeout,
          .max_ticks = config.max_ticks,
          .digest_flush_on_shutdown = config.output.digest_flush_on_shutdown,
          .output_dir = output_dir,
      },
      *prober, *monitor, emitter, logger);

  std::cout << "monitoring " << config.target << " every " << config.probe.interval.count()
            << " ms; log: " << log_path.string() << '\n';

  runtime::MonitorRunResult result;
  {
    const ScopedStopSignals signals;
    result = service.Run(&g_stop_requested);
  }

  std::cout << "monitor stopped: reason=" << result.stop_reason << " ticks=" << result.ticks
            << " events=" << emitter.events_path().string() << '\n';
  return kExitSuccess;
}

struct ReplayOptions {
  fs::path input_path;
  std::optional<fs::path> config_path;
  std::optional<std::uint64_t> interval_ms;
  bool trace = false;
};

bool ParseReplayOptions(const std::vector<std::string_view>& args, ReplayOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--trace") {
      options.trace = true;
      continue;
    }
    if (token == "--config") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }
    if (token == "--interval-ms") {
      std::uint64_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsignedValue(token, value, parsed, error)) {
        return false;
      }
      options.interval_ms = parsed;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.input_path.empty()) {
      error = "replay accepts exactly 1 outcomes file";
      return false;
    }
    options.input_path = fs::path(token);
  }

  if (options.input_path.empty()) {
    error = "replay requires <outcomes.csv>";
    return false;
  }
  return true;
}

void PrintLifecycleEvent(const health::LifecycleEvent& event) {
  std::cout << core::FormatUtcTimestamp(event.ts) << ' ' << health::ToString(event.type) << ' '
            << health::Describe(event) << '\n';
}

int CommandReplay(const std::vector<std::string_view>& args) {
  ReplayOptions options;
  std::string error;
  if (!ParseReplayOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::MonitorConfig config;
  config::ValidationReport report;
  if (const int load_code = LoadConfigOrReport(options.config_path, config, report);
      load_code != kExitSuccess) {
    return load_code;
  }
  if (options.interval_ms.has_value()) {
    config.probe.interval = std::chrono::milliseconds(options.interval_ms.value());
  }

  std::ifstream input(options.input_path, std::ios::binary);
  if (!input) {
    std::cerr << "error: unable to read outcomes file: " << options.input_path.string() << '\n';
    return kExitFailure;
  }
  std::vector<health::ProbeOutcome> outcomes;
  if (!runtime::ParseOutcomeCsv(input, outcomes, error)) {
    std::cerr << "error: " << options.input_path.string() << ": " << error << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(options.trace ? core::logging::LogLevel::kDebug : config.log_level,
                               std::cerr);
  logger.SetTarget(config.target.empty() ? "replay" : config.target);

  const health::Clock::time_point period_start =
      outcomes.empty() ? health::Clock::now() : outcomes.front().ts();
  auto monitor =
      health::CreateHealthMonitor(config::ToHealthConfig(config), &logger, error, period_start);
  if (monitor == nullptr) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  const std::string target = config.target.empty() ? "replay" : config.target;
  auto next_midnight = core::NextLocalMidnight(period_start);
  for (const auto& outcome : outcomes) {
    // Recorded days are summarized at their own midnights, as a live monitor
    // would have done.
    while (outcome.ts() >= next_midnight) {
      std::cout << '\n' << artifacts::RenderDigestMarkdown(monitor->FireDigest(next_midnight), target);
      next_midnight = core::NextLocalMidnight(next_midnight);
    }
    for (const auto& event : monitor->ProcessProbe(outcome)) {
      PrintLifecycleEvent(event);
    }
  }

  const health::Clock::time_point end = outcomes.empty() ? period_start : outcomes.back().ts();
  std::cout << '\n' << artifacts::RenderDigestMarkdown(monitor->FireDigest(end), target);
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "run") {
    return CommandRun(args);
  }
  if (command == "replay") {
    return CommandReplay(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace linkwatch::cli
