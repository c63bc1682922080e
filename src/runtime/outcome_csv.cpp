#include "runtime/outcome_csv.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <string_view>
#include <utility>

namespace linkwatch::runtime {

namespace {

std::string Trim(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }
  std::size_t end = raw.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }
  return std::string(raw.substr(begin, end - begin));
}

std::vector<std::string> SplitFields(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  for (const char c : line) {
    if (c == ',') {
      fields.push_back(Trim(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  fields.push_back(Trim(current));
  return fields;
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseRow(const std::vector<std::string>& fields, health::ProbeOutcome& outcome,
              std::string& error) {
  if (fields.size() < 2U || fields.size() > 3U) {
    error = "expected 'ts_ms,status[,value]'";
    return false;
  }

  std::int64_t ts_ms = 0;
  const std::string& ts_text = fields[0];
  const auto [ts_ptr, ts_ec] = std::from_chars(ts_text.data(), ts_text.data() + ts_text.size(), ts_ms);
  if (ts_text.empty() || ts_ec != std::errc{} || ts_ptr != ts_text.data() + ts_text.size()) {
    error = "invalid ts_ms '" + ts_text + "'";
    return false;
  }
  const health::Clock::time_point ts{std::chrono::milliseconds(ts_ms)};

  const std::string status = ToLower(fields[1]);
  const std::string value = fields.size() == 3U ? fields[2] : std::string();

  if (status == "ok") {
    double latency_ms = 0.0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), latency_ms);
    if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size() ||
        !std::isfinite(latency_ms) || latency_ms < 0.0 ||
        latency_ms * 1000.0 >= health::kMaxLatencyUs) {
      error = "invalid latency '" + value + "' (expected milliseconds)";
      return false;
    }
    outcome = health::ProbeOutcome::Success(
        ts, std::chrono::microseconds(static_cast<std::int64_t>(std::llround(latency_ms * 1000.0))));
    return true;
  }

  if (status == "fail") {
    health::FailureKind kind = health::FailureKind::kOther;
    if (!value.empty() && !health::ParseFailureKind(ToLower(value), kind)) {
      error = "invalid failure kind '" + value + "' (expected timeout, unresolvable or other)";
      return false;
    }
    outcome = health::ProbeOutcome::Failure(ts, kind, "replayed");
    return true;
  }

  error = "invalid status '" + fields[1] + "' (expected ok or fail)";
  return false;
}

} // namespace

bool ParseOutcomeCsv(std::istream& input, std::vector<health::ProbeOutcome>& outcomes,
                     std::string& error) {
  outcomes.clear();

  std::string line;
  std::size_t line_number = 0;
  bool first_row = true;
  while (std::getline(input, line)) {
    ++line_number;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const std::vector<std::string> fields = SplitFields(trimmed);
    if (first_row && ToLower(fields.front()) == "ts_ms") {
      first_row = false;
      continue;
    }
    first_row = false;

    health::ProbeOutcome outcome =
        health::ProbeOutcome::Failure(health::Clock::time_point{}, health::FailureKind::kOther);
    std::string row_error;
    if (!ParseRow(fields, outcome, row_error)) {
      error = "line " + std::to_string(line_number) + ": " + row_error;
      return false;
    }
    if (!outcomes.empty() && outcome.ts() < outcomes.back().ts()) {
      error = "line " + std::to_string(line_number) + ": timestamps must not go backwards";
      return false;
    }
    outcomes.push_back(std::move(outcome));
  }

  if (input.bad()) {
    error = "failed while reading outcomes";
    return false;
  }
  return true;
}

} // namespace linkwatch::runtime
