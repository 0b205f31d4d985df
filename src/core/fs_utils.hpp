#ifndef AGENTWATCH_CORE_FS_UTILS_HPP_
#define AGENTWATCH_CORE_FS_UTILS_HPP_

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace agentwatch::core {

// Creates every missing directory above `path`. A bare file name needs nothing.
inline bool EnsureParentDirectory(const std::filesystem::path& path, std::string& error) {
  if (path.empty()) {
    error = "path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file: " + path.string();
    return false;
  }
  return true;
}

} // namespace agentwatch::core

#endif // AGENTWATCH_CORE_FS_UTILS_HPP_
