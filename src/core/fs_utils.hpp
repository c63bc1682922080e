#ifndef LINKWATCH_CORE_FS_UTILS_HPP_
#define LINKWATCH_CORE_FS_UTILS_HPP_

#include <filesystem>
#include <string>
#include <system_error>

namespace linkwatch::core {

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create output directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace linkwatch::core

#endif // LINKWATCH_CORE_FS_UTILS_HPP_
