#ifndef AGENTWATCH_TESTS_COMMON_TEMP_DIR_HPP_
#define AGENTWATCH_TESTS_COMMON_TEMP_DIR_HPP_

#include "common/assertions.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace agentwatch::tests::common {

// Fresh directory under the system temp root. The counter keeps directories
// created within the same millisecond apart.
inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  static std::atomic<unsigned> sequence{0};
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(now_ms) + "-" +
       std::to_string(sequence.fetch_add(1)));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root: " + root.string());
  }
  return root;
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

// Temp directory removed when the scope ends.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) : path_(CreateUniqueTempDir(prefix)) {}
  ~ScopedTempDir() {
    RemovePathBestEffort(path_);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

  std::filesystem::path DbPath() const {
    return path_ / "agentwatch.db";
  }

private:
  std::filesystem::path path_;
};

} // namespace agentwatch::tests::common

#endif // AGENTWATCH_TESTS_COMMON_TEMP_DIR_HPP_
