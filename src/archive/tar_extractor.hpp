#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace lfspack::archive {

struct ExtractStats {
  // Objects written into the destination by this call.
  std::uint64_t restored = 0;
  // Objects already present with the archived size; left untouched.
  std::uint64_t already_present = 0;
  // Bytes written into the destination by this call.
  std::uint64_t restored_bytes = 0;
  // Pax and other metadata entries that carry no file payload for us.
  std::uint64_t ignored_entries = 0;
};

// Accepts relative, `..`-free names with forward slashes only. A leading
// `./` is tolerated. Anything else could escape the destination root.
bool IsSafeEntryName(std::string_view name);

// Extracts a gzip-compressed ustar archive below `dest_root`.
//
// Each file is written to a temp sibling and renamed into place, so a reader
// never observes a partially written object and re-running the extraction is
// safe. A file that already exists with the archived size is skipped.
//
// A corrupt or truncated archive returns false. Files published before the
// fault stay in place and `stats` reflects them.
bool ExtractTarGz(const std::filesystem::path& archive_path,
                  const std::filesystem::path& dest_root, ExtractStats& stats,
                  std::string& error);

} // namespace lfspack::archive
