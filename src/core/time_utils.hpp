#ifndef LINKWATCH_CORE_TIME_UTILS_HPP_
#define LINKWATCH_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace linkwatch::core {

// Canonical UTC timestamp formatter used by log lines and the event stream.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

inline std::optional<std::tm> ToLocalTm(std::chrono::system_clock::time_point timestamp) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm local_time{};
  if (localtime_r(&epoch_seconds, &local_time) == nullptr) {
    return std::nullopt;
  }
  return local_time;
}

// Local calendar date as `YYYYMMDD`. Digests are named after the local day
// they summarize.
inline std::string FormatLocalDate(std::chrono::system_clock::time_point timestamp) {
  const auto local_time = ToLocalTm(timestamp);
  if (!local_time.has_value()) {
    return "";
  }
  std::ostringstream out;
  out << std::put_time(&local_time.value(), "%Y%m%d");
  return out.str();
}

// Local wall clock as `HH:MM:SS`.
inline std::string FormatLocalClock(std::chrono::system_clock::time_point timestamp) {
  const auto local_time = ToLocalTm(timestamp);
  if (!local_time.has_value()) {
    return "";
  }
  std::ostringstream out;
  out << std::put_time(&local_time.value(), "%H:%M:%S");
  return out.str();
}

// First local midnight strictly after `timestamp`. mktime normalizes the day
// overflow and resolves DST with tm_isdst=-1.
inline std::chrono::system_clock::time_point NextLocalMidnight(
    std::chrono::system_clock::time_point timestamp) {
  auto local_time = ToLocalTm(timestamp);
  if (!local_time.has_value()) {
    return timestamp + std::chrono::hours(24);
  }
  local_time->tm_hour = 0;
  local_time->tm_min = 0;
  local_time->tm_sec = 0;
  local_time->tm_mday += 1;
  local_time->tm_isdst = -1;
  const std::time_t midnight = std::mktime(&local_time.value());
  if (midnight == static_cast<std::time_t>(-1)) {
    return timestamp + std::chrono::hours(24);
  }
  return std::chrono::system_clock::from_time_t(midnight);
}

inline std::string FormatMinutes(std::chrono::milliseconds duration, int precision = 2) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision)
      << std::chrono::duration<double, std::ratio<60>>(duration).count();
  return out.str();
}

} // namespace linkwatch::core

#endif // LINKWATCH_CORE_TIME_UTILS_HPP_
