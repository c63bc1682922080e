#pragma once

namespace linkwatch::core::errors {

// Stable process-exit contract for service managers and wrapper scripts.
//
// The first three values preserve conventional meanings:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Startup failures get their own codes so a supervisor can tell a bad config
// apart from an unwritable log directory without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kLogSinkUnavailable = 20,
  kProberUnavailable = 21,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace linkwatch::core::errors
