#pragma once

#include "core/logging/logger.hpp"
#include "health/health_config.hpp"
#include "probes/prober_factory.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace linkwatch::config {

constexpr std::chrono::milliseconds kDefaultProbeTimeout{30'000};
inline constexpr std::string_view kDefaultOutputDir = "linkwatch-out";

// Effective monitor settings after the config file and CLI overrides are
// merged. Defaults match a monitor started with only `-i <host>`.
struct MonitorConfig {
  std::string target;
  probes::ProberKind prober = probes::ProberKind::kIcmp;

  struct Probe {
    std::chrono::milliseconds interval = health::kDefaultProbeInterval;
    std::chrono::milliseconds timeout = kDefaultProbeTimeout;
    std::uint32_t count = 1;
  } probe;

  // `thresholds.probe_interval` is ignored; ToHealthConfig copies
  // `probe.interval` over it so the cadence is configured in one place.
  health::HealthConfig thresholds;

  struct Output {
    std::filesystem::path dir = std::filesystem::path(kDefaultOutputDir);
    bool digest_flush_on_shutdown = false;
  } output;

  struct Sim {
    std::vector<std::string> script;
    bool repeat = true;
  } sim;

  // Stop after this many scheduler ticks; unset = run until signalled.
  std::optional<std::uint64_t> max_ticks;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Parses config JSON text over the values already in `config` (so callers
// can start from defaults). Type mismatches and unknown keys become issues.
//
// Contract:
// - Returns true when parsing completed, even if issues were found.
// - On JSON syntax errors, emits one issue under path `$`.
// - `report.valid` is left to ValidateMonitorConfig.
bool ParseMonitorConfigText(std::string_view json_text, MonitorConfig& config,
                            ValidationReport& report, std::string& error);

// Loads a config file. Returns false only when the file cannot be read.
bool LoadMonitorConfigFile(const std::filesystem::path& path, MonitorConfig& config,
                           ValidationReport& report, std::string& error);

// Range and cross-field checks on the merged config; appends to `report`
// and sets `report.valid`.
void ValidateMonitorConfig(const MonitorConfig& config, ValidationReport& report);

// One "path: message" line per issue.
std::string FormatValidationReport(const ValidationReport& report);

health::HealthConfig ToHealthConfig(const MonitorConfig& config);
probes::ProberSettings ToProberSettings(const MonitorConfig& config);

} // namespace linkwatch::config
