#include "config/monitor_config.hpp"

#include "core/json_dom.hpp"
#include "probes/sim_prober.hpp"

#include <fstream>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <sstream>
#include <utility>

namespace linkwatch::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string JoinPath(std::string_view parent, std::string_view key) {
  if (parent.empty()) {
    return std::string(key);
  }
  return std::string(parent) + "." + std::string(key);
}

void RejectUnknownKeys(const JsonValue& object, std::string_view path,
                       std::initializer_list<std::string_view> known, ValidationReport& report) {
  for (const auto& [key, value] : object.object_value) {
    bool found = false;
    for (const std::string_view candidate : known) {
      if (key == candidate) {
        found = true;
        break;
      }
    }
    if (!found) {
      AddIssue(report, JoinPath(path, key), "unknown key");
    }
  }
}

// Returns the member when it is an object; reports a type issue otherwise.
const JsonValue* GetSection(const JsonValue& root, std::string_view key,
                            ValidationReport& report) {
  const JsonValue* section = root.Find(key);
  if (section == nullptr) {
    return nullptr;
  }
  if (!section->IsObject()) {
    AddIssue(report, std::string(key),
             std::string("must be an object, got ") + core::json::ToString(section->type));
    return nullptr;
  }
  return section;
}

void ReadString(const JsonValue& object, std::string_view key, std::string_view parent,
                std::string& out, ValidationReport& report) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr) {
    return;
  }
  if (!core::json::TryGetString(*value, out)) {
    AddIssue(report, JoinPath(parent, key), "must be a string");
  }
}

void ReadBool(const JsonValue& object, std::string_view key, std::string_view parent, bool& out,
              ValidationReport& report) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr) {
    return;
  }
  if (!core::json::TryGetBool(*value, out)) {
    AddIssue(report, JoinPath(parent, key), "must be true or false");
  }
}

template <typename UnsignedT>
void ReadUnsigned(const JsonValue& object, std::string_view key, std::string_view parent,
                  UnsignedT& out, ValidationReport& report) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr) {
    return;
  }
  std::uint64_t parsed = 0;
  if (!core::json::TryGetUnsigned(*value, parsed) ||
      parsed > static_cast<std::uint64_t>(std::numeric_limits<UnsignedT>::max())) {
    AddIssue(report, JoinPath(parent, key), "must be a non-negative integer");
    return;
  }
  out = static_cast<UnsignedT>(parsed);
}

void ReadMilliseconds(const JsonValue& object, std::string_view key, std::string_view parent,
                      std::chrono::milliseconds& out, ValidationReport& report) {
  std::uint64_t millis = static_cast<std::uint64_t>(out.count() < 0 ? 0 : out.count());
  const std::size_t issues_before = report.issues.size();
  ReadUnsigned(object, key, parent, millis, report);
  if (report.issues.size() != issues_before) {
    return;
  }
  if (millis > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    AddIssue(report, JoinPath(parent, key), "is out of range");
    return;
  }
  out = std::chrono::milliseconds(static_cast<std::int64_t>(millis));
}

void ParseProbe(const JsonValue& root, MonitorConfig& config, ValidationReport& report) {
  const JsonValue* probe = GetSection(root, "probe", report);
  if (probe == nullptr) {
    return;
  }
  RejectUnknownKeys(*probe, "probe", {"interval_ms", "timeout_ms", "count"}, report);
  ReadMilliseconds(*probe, "interval_ms", "probe", config.probe.interval, report);
  ReadMilliseconds(*probe, "timeout_ms", "probe", config.probe.timeout, report);
  ReadUnsigned(*probe, "count", "probe", config.probe.count, report);
}

void ParseThresholds(const JsonValue& root, MonitorConfig& config, ValidationReport& report) {
  const JsonValue* thresholds = GetSection(root, "thresholds", report);
  if (thresholds == nullptr) {
    return;
  }
  RejectUnknownKeys(*thresholds, "thresholds",
                    {"outage_miss_threshold", "anomaly_threshold", "baseline_window",
                     "cutoff_multiplier", "arm_after_first_success"},
                    report);

  health::HealthConfig& health = config.thresholds;
  ReadUnsigned(*thresholds, "outage_miss_threshold", "thresholds", health.outage_miss_threshold,
               report);
  ReadUnsigned(*thresholds, "anomaly_threshold", "thresholds", health.anomaly_threshold, report);
  ReadUnsigned(*thresholds, "baseline_window", "thresholds", health.baseline_window, report);
  ReadBool(*thresholds, "arm_after_first_success", "thresholds", health.arm_after_first_success,
           report);

  if (const JsonValue* multiplier = thresholds->Find("cutoff_multiplier"); multiplier != nullptr) {
    if (!core::json::TryGetNumber(*multiplier, health.cutoff_multiplier)) {
      AddIssue(report, "thresholds.cutoff_multiplier", "must be a number");
    }
  }
}

void ParseOutput(const JsonValue& root, MonitorConfig& config, ValidationReport& report) {
  const JsonValue* output = GetSection(root, "output", report);
  if (output == nullptr) {
    return;
  }
  RejectUnknownKeys(*output, "output", {"dir", "digest_flush_on_shutdown"}, report);

  if (output->Find("dir") != nullptr) {
    std::string dir = config.output.dir.string();
    ReadString(*output, "dir", "output", dir, report);
    config.output.dir = dir;
  }
  ReadBool(*output, "digest_flush_on_shutdown", "output", config.output.digest_flush_on_shutdown,
           report);
}

void ParseSim(const JsonValue& root, MonitorConfig& config, ValidationReport& report) {
  const JsonValue* sim = GetSection(root, "sim", report);
  if (sim == nullptr) {
    return;
  }
  RejectUnknownKeys(*sim, "sim", {"script", "repeat"}, report);
  ReadBool(*sim, "repeat", "sim", config.sim.repeat, report);

  const JsonValue* script = sim->Find("script");
  if (script == nullptr) {
    return;
  }
  if (script->type != JsonValue::Type::kArray) {
    AddIssue(report, "sim.script", "must be an array of strings");
    return;
  }
  config.sim.script.clear();
  for (std::size_t i = 0; i < script->array_value.size(); ++i) {
    std::string step;
    if (!core::json::TryGetString(script->array_value[i], step)) {
      AddIssue(report, "sim.script[" + std::to_string(i) + "]", "must be a string");
      continue;
    }
    config.sim.script.push_back(std::move(step));
  }
}

void ParseRoot(const JsonValue& root, MonitorConfig& config, ValidationReport& report) {
  RejectUnknownKeys(root, "",
                    {"target", "prober", "probe", "thresholds", "output", "sim", "max_ticks",
                     "log_level"},
                    report);

  ReadString(root, "target", "", config.target, report);

  if (root.Find("prober") != nullptr) {
    std::string prober;
    ReadString(root, "prober", "", prober, report);
    if (!prober.empty() && !probes::ParseProberKind(prober, config.prober)) {
      AddIssue(report, "prober", "must be one of: icmp, sim");
    }
  }

  if (root.Find("max_ticks") != nullptr) {
    std::uint64_t max_ticks = 0;
    const std::size_t issues_before = report.issues.size();
    ReadUnsigned(root, "max_ticks", "", max_ticks, report);
    if (report.issues.size() == issues_before) {
      config.max_ticks = max_ticks;
    }
  }

  if (root.Find("log_level") != nullptr) {
    std::string level_text;
    ReadString(root, "log_level", "", level_text, report);
    std::string level_error;
    if (!level_text.empty() &&
        !core::logging::ParseLogLevel(level_text, config.log_level, level_error)) {
      AddIssue(report, "log_level",
               "must be one of: " + core::logging::ExpectedLogLevelList());
    }
  }

  ParseProbe(root, config, report);
  ParseThresholds(root, config, report);
  ParseOutput(root, config, report);
  ParseSim(root, config, report);
}

} // namespace

bool ParseMonitorConfigText(std::string_view json_text, MonitorConfig& config,
                            ValidationReport& report, std::string& error) {
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$",
             parse_error + " (fix JSON syntax and rerun 'linkwatch validate <config.json>')");
    return true;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "config root must be a JSON object");
    return true;
  }

  ParseRoot(root, config, report);
  return true;
}

bool LoadMonitorConfigFile(const std::filesystem::path& path, MonitorConfig& config,
                           ValidationReport& report, std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read config file: " + path.string();
    return false;
  }

  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (contents.empty()) {
    AddIssue(report, "$", "config file is empty; provide a JSON object");
    return true;
  }
  return ParseMonitorConfigText(contents, config, report, error);
}

void ValidateMonitorConfig(const MonitorConfig& config, ValidationReport& report) {
  if (config.prober == probes::ProberKind::kIcmp && config.target.empty()) {
    AddIssue(report, "target", "is required for the icmp prober; set it or pass -i <host>");
  }

  const std::string max_ms_message =
      "must be at most " + std::to_string(health::kMaxProbeInterval.count()) + " (24h)";
  if (config.probe.interval.count() <= 0) {
    AddIssue(report, "probe.interval_ms", "must be greater than 0");
  } else if (config.probe.interval > health::kMaxProbeInterval) {
    AddIssue(report, "probe.interval_ms", max_ms_message);
  }
  if (config.probe.timeout.count() <= 0) {
    AddIssue(report, "probe.timeout_ms", "must be greater than 0");
  } else if (config.probe.timeout > health::kMaxProbeInterval) {
    AddIssue(report, "probe.timeout_ms", max_ms_message);
  }
  if (config.probe.count == 0U) {
    AddIssue(report, "probe.count", "must be at least 1");
  }

  const health::HealthConfig& health = config.thresholds;
  if (health.outage_miss_threshold == 0U) {
    AddIssue(report, "thresholds.outage_miss_threshold", "must be at least 1");
  }
  if (health.anomaly_threshold == 0U) {
    AddIssue(report, "thresholds.anomaly_threshold", "must be at least 1");
  }
  if (health.baseline_window == 0U) {
    AddIssue(report, "thresholds.baseline_window", "must be at least 1");
  }
  if (!(health.cutoff_multiplier > 0.0)) {
    AddIssue(report, "thresholds.cutoff_multiplier", "must be greater than 0");
  }

  if (config.output.dir.empty()) {
    AddIssue(report, "output.dir", "must not be empty");
  }

  if (config.max_ticks.has_value() && config.max_ticks.value() == 0U) {
    AddIssue(report, "max_ticks", "must be greater than 0 when set");
  }

  if (config.prober == probes::ProberKind::kSim) {
    if (config.sim.script.empty()) {
      AddIssue(report, "sim.script", "must list at least one step for the sim prober");
    }
    for (std::size_t i = 0; i < config.sim.script.size(); ++i) {
      probes::SimStep step;
      std::string step_error;
      if (!probes::ParseSimStep(config.sim.script[i], step, step_error)) {
        AddIssue(report, "sim.script[" + std::to_string(i) + "]", step_error);
      }
    }
  }

  report.valid = report.issues.empty();
}

std::string FormatValidationReport(const ValidationReport& report) {
  std::ostringstream out;
  for (const auto& issue : report.issues) {
    out << issue.path << ": " << issue.message << '\n';
  }
  return out.str();
}

health::HealthConfig ToHealthConfig(const MonitorConfig& config) {
  health::HealthConfig health = config.thresholds;
  health.probe_interval = config.probe.interval;
  return health;
}

probes::ProberSettings ToProberSettings(const MonitorConfig& config) {
  return probes::ProberSettings{
      .kind = config.prober,
      .target = config.target,
      .timeout = config.probe.timeout,
      .count = config.probe.count,
      .sim_script = config.sim.script,
      .sim_repeat = config.sim.repeat,
  };
}

} // namespace linkwatch::config
