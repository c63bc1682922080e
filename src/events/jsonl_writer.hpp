#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>

namespace linkwatch::events {

inline constexpr const char* kEventsFileName = "events.jsonl";

// Appends one JSON-serialized event per line to `<output_dir>/events.jsonl`.
//
// Contract:
// - Creates `output_dir` if needed.
// - Opens the file in append mode per call, so records survive a crash and
//   a restarted monitor keeps extending the same stream.
// - Writes exactly one line per call.
// - Not synchronized; concurrent writers go through Emitter.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

} // namespace linkwatch::events
