#include "unpack/unpacker.hpp"

#include "archive/tar_extractor.hpp"
#include "pack/packer.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace lfspack::unpack {

std::optional<std::uint32_t> ParseArchiveNumber(std::string_view file_name) {
  const std::string_view prefix = pack::kArchivePrefix;
  const std::string_view suffix = pack::kArchiveSuffix;
  if (file_name.size() <= prefix.size() + suffix.size() ||
      file_name.substr(0, prefix.size()) != prefix ||
      file_name.substr(file_name.size() - suffix.size()) != suffix) {
    return std::nullopt;
  }

  const std::string_view digits =
      file_name.substr(prefix.size(), file_name.size() - prefix.size() - suffix.size());
  std::uint32_t number = 0;
  const auto parsed = std::from_chars(digits.data(), digits.data() + digits.size(), number);
  if (parsed.ec != std::errc() || parsed.ptr != digits.data() + digits.size() || number == 0U) {
    return std::nullopt;
  }
  return number;
}

bool FindPackArchives(const fs::path& dir, std::vector<fs::path>& archives, std::string& error) {
  archives.clear();

  std::error_code ec;
  if (!fs::is_directory(dir, ec) || ec) {
    error = "archive directory not found: " + dir.string();
    return false;
  }

  std::vector<std::pair<std::uint32_t, fs::path>> numbered;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    const auto number = ParseArchiveNumber(entry.path().filename().string());
    if (number.has_value()) {
      numbered.emplace_back(*number, entry.path());
    }
  }
  if (ec) {
    error = "failed while listing archive directory '" + dir.string() + "': " + ec.message();
    return false;
  }

  std::sort(numbered.begin(), numbered.end());
  for (auto& item : numbered) {
    archives.push_back(std::move(item.second));
  }
  return true;
}

bool UnpackArchives(const std::vector<fs::path>& archives, const fs::path& store_root,
                    core::logging::Logger* logger, UnpackResult& result, std::string& error) {
  result = UnpackResult{};
  result.archives_total = archives.size();

  for (const auto& archive_path : archives) {
    archive::ExtractStats stats;
    std::string archive_error;
    const bool ok = archive::ExtractTarGz(archive_path, store_root, stats, archive_error);

    // Objects published before a fault are valid and count either way.
    result.restored += stats.restored;
    result.already_present += stats.already_present;

    if (!ok) {
      if (logger != nullptr) {
        logger->Error("archive extraction failed",
                      {{"archive", archive_path.filename().string()}, {"error", archive_error}});
      }
      result.failures.push_back(ArchiveFailure{archive_path, archive_error});
      continue;
    }

    if (logger != nullptr) {
      logger->Info("archive extracted",
                   {{"archive", archive_path.filename().string()},
                    {"restored", stats.restored},
                    {"already_present", stats.already_present}});
    }
  }

  if (!result.failures.empty()) {
    error = std::to_string(result.failures.size()) + " of " +
            std::to_string(result.archives_total) + " archives failed to extract (first: " +
            result.failures.front().error + ")";
    return false;
  }
  return true;
}

} // namespace lfspack::unpack
