#pragma once

#include "core/logging/logger.hpp"
#include "packing/bin_planner.hpp"
#include "store/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lfspack::pack {

inline constexpr std::string_view kArchivePrefix = "lfspack-";
inline constexpr std::string_view kArchiveSuffix = ".tar.gz";

// `lfspack-<number>.tar.gz`
std::string ArchiveFileName(std::uint32_t number);

struct PackOptions {
  std::filesystem::path output_dir;
  std::uint64_t max_bin_bytes = packing::kDefaultMaxBinBytes;
  core::logging::Logger* logger = nullptr;
};

struct ArchiveRecord {
  std::uint32_t number = 0;
  std::filesystem::path path;
  std::uint64_t object_count = 0;
  // Sum of object sizes, before tar framing and compression.
  std::uint64_t payload_bytes = 0;
  std::uint64_t compressed_bytes = 0;
};

struct PackResult {
  std::vector<ArchiveRecord> archives;
  std::uint64_t pack_count = 0;
  std::vector<store::ObjectEntry> skipped;
  std::uint64_t max_bin_bytes = 0;
};

// Packs `objects` into `lfspack-<n>.tar.gz` files under `options.output_dir`.
//
// Every bin is written as a tar archive first; gzip compression runs over all
// archives once the last bin is closed. Empty input (or input made only of
// oversized objects) creates no files.
//
// Any I/O failure aborts the run. Archives written before the failure are
// left behind; callers treat the output directory as unusable.
bool PackObjects(const std::vector<store::ObjectEntry>& objects, const PackOptions& options,
                 PackResult& result, std::string& error);

} // namespace lfspack::pack
