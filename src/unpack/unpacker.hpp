#pragma once

#include "core/logging/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lfspack::unpack {

struct ArchiveFailure {
  std::filesystem::path archive;
  std::string error;
};

struct UnpackResult {
  std::uint64_t archives_total = 0;
  // Objects written by this run.
  std::uint64_t restored = 0;
  // Objects found in place with the archived size and left untouched.
  std::uint64_t already_present = 0;
  std::vector<ArchiveFailure> failures;

  std::uint64_t ObjectsAvailable() const {
    return restored + already_present;
  }
};

// Parses `lfspack-<n>.tar.gz` and returns `n`.
std::optional<std::uint32_t> ParseArchiveNumber(std::string_view file_name);

// Lists pack archives in `dir`, ordered by archive number.
bool FindPackArchives(const std::filesystem::path& dir, std::vector<std::filesystem::path>& archives,
                      std::string& error);

// Extracts every archive into `store_root`.
//
// A failing archive does not stop the others: objects from healthy archives
// are restored and each failure is recorded in `result.failures`. Returns
// false when at least one archive failed.
bool UnpackArchives(const std::vector<std::filesystem::path>& archives,
                    const std::filesystem::path& store_root, core::logging::Logger* logger,
                    UnpackResult& result, std::string& error);

} // namespace lfspack::unpack
