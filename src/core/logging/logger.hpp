#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace linkwatch::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

// Line categories. They mirror the prefixes operators grep for in the
// monitor log, so keep the spelling stable.
inline constexpr std::string_view kCategoryPing = "PING";
inline constexpr std::string_view kCategoryOutage = "OUTAGE";
inline constexpr std::string_view kCategoryLatency = "LATENCY";
inline constexpr std::string_view kCategoryDigest = "DIGEST";
inline constexpr std::string_view kCategoryMonitor = "MONITOR";
inline constexpr std::string_view kCategoryError = "ERROR";
inline constexpr std::string_view kCategoryTrace = "TRACE";

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }
  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

// Accepts the level names case-insensitively; "trace" and "warning" are
// aliases for debug and warn.
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string name(raw);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  struct Alias {
    std::string_view name;
    LogLevel level;
  };
  constexpr Alias kAliases[] = {
      {"debug", LogLevel::kDebug}, {"trace", LogLevel::kDebug}, {"info", LogLevel::kInfo},
      {"warn", LogLevel::kWarn},   {"warning", LogLevel::kWarn}, {"error", LogLevel::kError},
  };
  for (const Alias& alias : kAliases) {
    if (name == alias.name) {
      level = alias.level;
      return true;
    }
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

// Appends `raw` as a double-quoted logfmt value.
inline void AppendLogfmtQuoted(std::string& line, std::string_view raw) {
  line.push_back('"');
  for (const char c : raw) {
    switch (c) {
    case '\\':
      line += "\\\\";
      break;
    case '"':
      line += "\\\"";
      break;
    case '\n':
      line += "\\n";
      break;
    case '\r':
      line += "\\r";
      break;
    case '\t':
      line += "\\t";
      break;
    default:
      line.push_back(c);
      break;
    }
  }
  line.push_back('"');
}

// logfmt line logger shared by the probe tasks, the outcome consumer and the
// digest thread:
//
//   ts_utc=... level=WARN category="OUTAGE" target="host" msg="..." k="v"
//
// Lines go to the stream given at construction until OpenFile() succeeds,
// then to that file in append mode. Each line is formatted up front and
// written under one lock, so concurrent writers never interleave.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Switches the sink to `path` (append). On failure the previous sink stays
  // active and `error` says why.
  bool OpenFile(const std::filesystem::path& path, std::string& error) {
    std::ofstream file(path, std::ios::binary | std::ios::app);
    if (!file) {
      error = "cannot open log file '" + path.string() + "' for append";
      return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    file_ = std::move(file);
    out_ = &file_;
    return true;
  }

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    min_level_ = level;
  }

  void SetTarget(std::string target) {
    std::lock_guard<std::mutex> lock(mu_);
    target_ = std::move(target);
  }

  bool ShouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mu_);
    return level >= min_level_;
  }

  void Log(LogLevel level,
           std::string_view category,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    std::lock_guard<std::mutex> lock(mu_);
    if (level < min_level_) {
      return;
    }

    std::string line = "ts_utc=" + FormatUtcTimestamp(std::chrono::system_clock::now()) +
                       " level=" + ToString(level) + " category=";
    AppendLogfmtQuoted(line, category);
    line += " target=";
    AppendLogfmtQuoted(line, target_);
    line += " msg=";
    AppendLogfmtQuoted(line, message);
    for (const LogFieldView& field : fields) {
      line.push_back(' ');
      line.append(field.key);
      line.push_back('=');
      AppendLogfmtQuoted(line, field.value);
    }
    line.push_back('\n');

    out_->write(line.data(), static_cast<std::streamsize>(line.size()));
    out_->flush();
  }

  void Debug(std::string_view category, std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, category, message, fields);
  }

  void Info(std::string_view category, std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, category, message, fields);
  }

  void Warn(std::string_view category, std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, category, message, fields);
  }

  void Error(std::string_view category, std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, category, message, fields);
  }

private:
  mutable std::mutex mu_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::ofstream file_;
  std::string target_ = "-";
};

} // namespace linkwatch::core::logging
