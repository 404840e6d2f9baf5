#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lfspack::store {

// Default store location relative to a repository root.
inline constexpr std::string_view kDefaultStoreDir = ".git/lfs";

// One content-addressed LFS object as found on disk.
struct ObjectEntry {
  std::filesystem::path path;
  // Path below the store root in generic form, e.g. `objects/ab/cd/<oid>`.
  // Archives record entries under this name.
  std::string relative_path;
  std::string oid;
  std::uint64_t size_bytes = 0;
};

struct ScanResult {
  std::vector<ObjectEntry> objects;
  // Files under `objects/` that do not follow the `aa/bb/<oid>` layout.
  std::vector<std::filesystem::path> ignored;
};

// True for a 64-character lowercase hex SHA-256 object id.
bool IsValidOid(std::string_view oid);

// `objects/<oid[0:2]>/<oid[2:4]>/<oid>` below the store root.
std::string RelativeObjectPath(std::string_view oid);

// Walks `<store_root>/objects` and returns every well-formed object sorted by
// relative path, which is the stable encounter order packing preserves.
//
// - A store root that does not exist is an error.
// - A store root without an `objects/` directory yields an empty result.
// - Leftover temp files from an interrupted restore are skipped silently.
bool ScanObjectStore(const std::filesystem::path& store_root, ScanResult& result,
                     std::string& error);

} // namespace lfspack::store
