#ifndef LFSPACK_TESTS_COMMON_TEMP_DIR_HPP_
#define LFSPACK_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace lfspack::tests::common {

inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(now_ms));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root: " + root.string());
  }
  return root;
}

// Restores the previous working directory on scope exit. The pack and boot
// flows resolve the repository from the current directory.
class ScopedCurrentPath {
public:
  explicit ScopedCurrentPath(const std::filesystem::path& target) {
    std::error_code ec;
    original_path_ = std::filesystem::current_path(ec);
    if (ec) {
      Fail("failed to read current path");
    }
    std::filesystem::current_path(target, ec);
    if (ec) {
      Fail("failed to switch current path to: " + target.string());
    }
  }

  ~ScopedCurrentPath() {
    std::error_code ec;
    std::filesystem::current_path(original_path_, ec);
  }

  ScopedCurrentPath(const ScopedCurrentPath&) = delete;
  ScopedCurrentPath& operator=(const ScopedCurrentPath&) = delete;

private:
  std::filesystem::path original_path_;
};

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

} // namespace lfspack::tests::common

#endif // LFSPACK_TESTS_COMMON_TEMP_DIR_HPP_
