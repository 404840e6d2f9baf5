#ifndef LFSPACK_CORE_FS_UTILS_HPP_
#define LFSPACK_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace lfspack::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

// Temp files created next to `output_path` always carry this marker so a
// store scan can ignore leftovers from an interrupted restore.
inline bool IsAtomicTempPath(const std::filesystem::path& path) {
  return path.filename().string().find(".tmp.") != std::string::npos;
}

inline std::filesystem::path MakeAtomicTempPath(const std::filesystem::path& output_path) {
  return detail::BuildAtomicTempPath(output_path);
}

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  return parent_dir.empty() || EnsureDirectory(parent_dir, error);
}

// Moves a fully written temp file onto its final name.
//
// When rename-over-existing is refused we remove the destination and retry.
// On failure the temp file is deleted so no partial output is ever published.
inline bool PublishTempFile(const std::filesystem::path& temp_path,
                            const std::filesystem::path& output_path, std::string& error) {
  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      std::error_code cleanup_ec;
      out_file.close();
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  return PublishTempFile(temp_path, output_path, error);
}

} // namespace lfspack::core

#endif // LFSPACK_CORE_FS_UTILS_HPP_
