#include "archive/tar_extractor.hpp"

#include "archive/gzip_file.hpp"
#include "archive/tar_format.hpp"
#include "core/fs_utils.hpp"

#include <array>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace lfspack::archive {

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

// Pulls exact byte counts out of the decompressed stream and turns a short
// read into a "truncated archive" error.
class TarStream {
public:
  explicit TarStream(GzipFile& file) : file_(file) {}

  bool ReadExact(char* buffer, std::size_t size, std::string& error) {
    std::size_t total = 0;
    while (total < size) {
      std::size_t got = 0;
      if (!file_.Read(buffer + total, size - total, got, error)) {
        return false;
      }
      if (got == 0U) {
        error = "archive is truncated";
        return false;
      }
      total += got;
    }
    return true;
  }

  // Sets `at_eof` when the stream ends exactly on a block boundary.
  bool ReadBlock(Block& block, bool& at_eof, std::string& error) {
    at_eof = false;
    std::size_t got = 0;
    if (!file_.Read(block.data(), block.size(), got, error)) {
      return false;
    }
    if (got == 0U) {
      at_eof = true;
      return true;
    }
    return got == block.size() || ReadExact(block.data() + got, block.size() - got, error);
  }

  bool Skip(std::uint64_t count, std::string& error) {
    std::array<char, kCopyBufferSize> sink{};
    while (count > 0U) {
      const std::size_t chunk =
          count < sink.size() ? static_cast<std::size_t>(count) : sink.size();
      if (!ReadExact(sink.data(), chunk, error)) {
        return false;
      }
      count -= chunk;
    }
    return true;
  }

  // Reads to the end so zlib verifies the gzip trailer CRC.
  bool Drain(std::string& error) {
    std::array<char, kCopyBufferSize> sink{};
    while (true) {
      std::size_t got = 0;
      if (!file_.Read(sink.data(), sink.size(), got, error)) {
        return false;
      }
      if (got == 0U) {
        return true;
      }
    }
  }

private:
  GzipFile& file_;
};

std::string NormalizeEntryName(std::string_view name) {
  while (name.size() >= 2U && name.substr(0, 2) == "./") {
    name.remove_prefix(2);
  }
  return std::string(name);
}

bool WritePayloadToTemp(TarStream& stream, const fs::path& temp_path, std::uint64_t size,
                        std::string& error) {
  std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open temp file for extraction: " + temp_path.string();
    return false;
  }

  std::array<char, kCopyBufferSize> buffer{};
  while (size > 0U) {
    const std::size_t chunk =
        size < buffer.size() ? static_cast<std::size_t>(size) : buffer.size();
    if (!stream.ReadExact(buffer.data(), chunk, error)) {
      return false;
    }
    out_file.write(buffer.data(), static_cast<std::streamsize>(chunk));
    if (!out_file) {
      error = "failed while writing extracted object: " + temp_path.string();
      return false;
    }
    size -= chunk;
  }

  out_file.flush();
  if (!out_file) {
    error = "failed while flushing extracted object: " + temp_path.string();
    return false;
  }
  return true;
}

bool RestoreFile(TarStream& stream, const EntryHeader& header, const fs::path& dest_root,
                 ExtractStats& stats, std::string& error) {
  const fs::path destination = dest_root / fs::path(header.name);

  std::error_code ec;
  if (fs::is_directory(destination, ec)) {
    error = "archive entry collides with a directory: " + destination.string();
    return false;
  }
  ec.clear();
  if (fs::is_regular_file(destination, ec) && !ec) {
    const std::uintmax_t existing_size = fs::file_size(destination, ec);
    if (!ec && existing_size == header.size_bytes) {
      ++stats.already_present;
      return stream.Skip(header.size_bytes + PaddingFor(header.size_bytes), error);
    }
  }

  if (!core::EnsureParentDirectory(destination, error)) {
    return false;
  }

  const fs::path temp_path = core::MakeAtomicTempPath(destination);
  if (!WritePayloadToTemp(stream, temp_path, header.size_bytes, error)) {
    std::error_code cleanup_ec;
    (void)fs::remove(temp_path, cleanup_ec);
    error = header.name + ": " + error;
    return false;
  }
  if (!core::PublishTempFile(temp_path, destination, error)) {
    return false;
  }

  ++stats.restored;
  stats.restored_bytes += header.size_bytes;
  return stream.Skip(PaddingFor(header.size_bytes), error);
}

} // namespace

bool IsSafeEntryName(std::string_view name) {
  const std::string normalized = NormalizeEntryName(name);
  if (normalized.empty() || normalized.front() == '/') {
    return false;
  }
  if (normalized.find('\\') != std::string::npos || normalized.find(':') != std::string::npos) {
    return false;
  }

  std::size_t start = 0;
  while (start <= normalized.size()) {
    const std::size_t slash = normalized.find('/', start);
    const std::size_t end = slash == std::string::npos ? normalized.size() : slash;
    const std::string_view component(normalized.data() + start, end - start);
    if (component == "..") {
      return false;
    }
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  return true;
}

bool ExtractTarGz(const fs::path& archive_path, const fs::path& dest_root, ExtractStats& stats,
                  std::string& error) {
  stats = ExtractStats{};

  std::error_code ec;
  if (!fs::is_regular_file(archive_path, ec) || ec) {
    error = "archive not found: " + archive_path.string();
    return false;
  }

  GzipFile file;
  if (!file.Open(archive_path, GzipFile::Mode::kRead, error)) {
    return false;
  }
  TarStream stream(file);

  Block block{};
  while (true) {
    bool at_eof = false;
    if (!stream.ReadBlock(block, at_eof, error)) {
      error = archive_path.filename().string() + ": " + error;
      return false;
    }
    if (at_eof) {
      error = archive_path.filename().string() + ": archive ended without end-of-archive marker";
      return false;
    }
    if (IsZeroBlock(block)) {
      break;
    }

    EntryHeader header;
    if (!DecodeHeader(block, header, error)) {
      error = archive_path.filename().string() + ": " + error;
      return false;
    }

    const bool is_file = header.type == static_cast<char>(EntryType::kRegular) ||
                         header.type == static_cast<char>(EntryType::kRegularLegacy);
    if (is_file || header.type == static_cast<char>(EntryType::kDirectory)) {
      if (!IsSafeEntryName(header.name)) {
        error = archive_path.filename().string() + ": unsafe entry name: " + header.name;
        return false;
      }
      header.name = NormalizeEntryName(header.name);
    }

    bool ok = true;
    if (is_file) {
      ok = RestoreFile(stream, header, dest_root, stats, error);
    } else if (header.type == static_cast<char>(EntryType::kDirectory)) {
      fs::create_directories(dest_root / fs::path(header.name), ec);
      if (ec) {
        error = "failed to create directory '" + header.name + "': " + ec.message();
        ok = false;
      } else {
        ok = stream.Skip(header.size_bytes + PaddingFor(header.size_bytes), error);
      }
    } else {
      ++stats.ignored_entries;
      ok = stream.Skip(header.size_bytes + PaddingFor(header.size_bytes), error);
    }
    if (!ok) {
      error = archive_path.filename().string() + ": " + error;
      return false;
    }
  }

  if (!stream.Drain(error)) {
    error = archive_path.filename().string() + ": " + error;
    return false;
  }
  if (!file.Close(error)) {
    return false;
  }
  return true;
}

} // namespace lfspack::archive
