#pragma once

#include "core/logging/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace linkwatch::cli {

// `linkwatch run` inputs. Every field left unset falls back to the config
// file (when given) and then to the built-in defaults.
struct RunOptions {
  std::optional<std::filesystem::path> config_path;
  std::optional<std::string> target;
  std::optional<std::filesystem::path> output_dir;
  std::optional<std::uint64_t> interval_ms;
  std::optional<std::uint64_t> timeout_ms;
  std::optional<std::uint64_t> max_ticks;
  bool sim = false;
  std::optional<core::logging::LogLevel> log_level;
};

// Routes `linkwatch` subcommands and returns process exit codes with a
// stable contract for service managers and scripts (see
// core/errors/exit_codes.hpp).
int Dispatch(int argc, char** argv);

} // namespace linkwatch::cli
