#pragma once

#include "pack/packer.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lfspack::artifacts {

inline constexpr std::string_view kManifestFileName = "lfspack-manifest.json";
inline constexpr std::string_view kManifestSchemaVersion = "1.0";

struct ManifestArchive {
  std::string name;
  std::uint64_t objects = 0;
  std::uint64_t payload_bytes = 0;
};

struct ManifestSkipped {
  std::string oid;
  std::uint64_t size_bytes = 0;
};

// Record of one pack run, committed next to the archives. `boot` reads it
// back to learn which branch to restore.
struct PackManifest {
  std::string schema_version = std::string(kManifestSchemaVersion);
  std::string source_branch;
  std::uint64_t max_bin_bytes = 0;
  std::uint64_t pack_count = 0;
  std::vector<ManifestArchive> archives;
  std::vector<ManifestSkipped> skipped;
};

PackManifest BuildPackManifest(const pack::PackResult& result, std::string source_branch);

// Pretty-printed JSON with a stable field order.
std::string ToJson(const PackManifest& manifest);

// Writes `<output_dir>/lfspack-manifest.json` atomically.
bool WritePackManifest(const std::filesystem::path& output_dir, const PackManifest& manifest,
                       std::filesystem::path& written_path, std::string& error);

// Validates the schema version and every required field.
bool ParsePackManifest(std::string_view text, PackManifest& manifest, std::string& error);

bool LoadPackManifest(const std::filesystem::path& manifest_path, PackManifest& manifest,
                      std::string& error);

} // namespace lfspack::artifacts
