#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lfspack::archive {

struct TarSource {
  std::filesystem::path path;
  // Name recorded in the archive (generic separators, relative).
  std::string entry_name;
  // Size expected on disk. A mismatch while copying is an error so the
  // header never disagrees with the payload.
  std::uint64_t size_bytes = 0;
};

// Writes an uncompressed ustar archive.
//
// Contract:
// - Entries are written in the given order, each padded to 512 bytes, and the
//   archive ends with two zero blocks.
// - Headers carry mode 0644, zero owner ids and zero mtime so the same inputs
//   always produce the same bytes.
// - Any existing file at `output_path` is replaced.
// - Returns false and populates `error` on the first read/write failure. A
//   partially written archive may remain on disk.
bool WriteTarArchive(const std::vector<TarSource>& sources, const std::filesystem::path& output_path,
                     std::string& error);

} // namespace lfspack::archive
