#include "events/jsonl_writer.hpp"

#include "core/fs_utils.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace linkwatch::events {

bool AppendEventJsonl(const Event& event, const fs::path& output_dir, fs::path& written_path,
                      std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  written_path = output_dir / kEventsFileName;
  std::ofstream out_file(written_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open event stream '" + written_path.string() + "' for append";
    return false;
  }

  out_file << ToJson(event) << '\n';
  out_file.flush();
  if (!out_file) {
    error = "failed while appending to event stream '" + written_path.string() + "'";
    return false;
  }
  return true;
}

} // namespace linkwatch::events
