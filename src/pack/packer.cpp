#include "pack/packer.hpp"

#include "archive/gzip_file.hpp"
#include "archive/tar_writer.hpp"
#include "core/fs_utils.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace lfspack::pack {

namespace {

std::string TarFileName(std::uint32_t number) {
  return std::string(kArchivePrefix) + std::to_string(number) + ".tar";
}

std::vector<archive::TarSource> BuildTarSources(const packing::Bin& bin) {
  std::vector<archive::TarSource> sources;
  sources.reserve(bin.objects.size());
  for (const auto& object : bin.objects) {
    archive::TarSource source;
    source.path = object.path;
    source.entry_name = object.relative_path;
    source.size_bytes = object.size_bytes;
    sources.push_back(std::move(source));
  }
  return sources;
}

} // namespace

std::string ArchiveFileName(std::uint32_t number) {
  return TarFileName(number) + ".gz";
}

bool PackObjects(const std::vector<store::ObjectEntry>& objects, const PackOptions& options,
                 PackResult& result, std::string& error) {
  result = PackResult{};

  if (options.output_dir.empty()) {
    error = "pack output directory cannot be empty";
    return false;
  }

  packing::BinPlan plan;
  if (!packing::PlanBins(objects, options.max_bin_bytes, plan, error)) {
    return false;
  }
  result.pack_count = plan.pack_count;
  result.skipped = plan.skipped;
  result.max_bin_bytes = plan.max_bin_bytes;

  if (options.logger != nullptr) {
    for (const auto& skipped : plan.skipped) {
      options.logger->Warn("object reaches bin bound; left for individual download",
                           {{"oid", skipped.oid},
                            {"size_bytes", skipped.size_bytes}});
    }
  }

  if (plan.bins.empty()) {
    return true;
  }

  if (!core::EnsureDirectory(options.output_dir, error)) {
    return false;
  }

  std::vector<fs::path> tar_paths;
  tar_paths.reserve(plan.bins.size());
  for (const auto& bin : plan.bins) {
    const fs::path tar_path = options.output_dir / TarFileName(bin.number);
    if (!archive::WriteTarArchive(BuildTarSources(bin), tar_path, error)) {
      return false;
    }
    tar_paths.push_back(tar_path);

    ArchiveRecord record;
    record.number = bin.number;
    record.object_count = bin.objects.size();
    record.payload_bytes = bin.payload_bytes;
    result.archives.push_back(std::move(record));

    if (options.logger != nullptr) {
      options.logger->Info("archive written",
                           {{"archive", tar_path.filename().string()},
                            {"objects", bin.objects.size()},
                            {"payload_bytes", bin.payload_bytes}});
    }
  }

  std::error_code ec;
  for (std::size_t i = 0; i < tar_paths.size(); ++i) {
    ArchiveRecord& record = result.archives[i];
    if (!archive::GzipCompressFile(tar_paths[i], record.path, error)) {
      return false;
    }
    record.compressed_bytes = static_cast<std::uint64_t>(fs::file_size(record.path, ec));
    if (ec) {
      error = "failed to read compressed archive size: " + record.path.string();
      return false;
    }
    if (options.logger != nullptr) {
      options.logger->Debug("archive compressed",
                            {{"archive", record.path.filename().string()},
                             {"compressed_bytes", record.compressed_bytes}});
    }
  }

  return true;
}

} // namespace lfspack::pack
