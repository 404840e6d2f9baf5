#include "archive/tar_writer.hpp"

#include "archive/tar_format.hpp"

#include <array>
#include <fstream>

namespace fs = std::filesystem;

namespace lfspack::archive {

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

bool CopyPayload(const TarSource& source, std::ofstream& out_file, std::string& error) {
  std::ifstream in_file(source.path, std::ios::binary);
  if (!in_file) {
    error = "failed to open object for archiving: " + source.path.string();
    return false;
  }

  std::uint64_t copied = 0;
  std::array<char, kCopyBufferSize> buffer{};
  while (in_file.good()) {
    in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    copied += static_cast<std::uint64_t>(read_count);
    if (copied > source.size_bytes) {
      error = "object grew while archiving: " + source.path.string();
      return false;
    }
    out_file.write(buffer.data(), read_count);
    if (!out_file) {
      error = "failed while writing archive payload for object: " + source.path.string();
      return false;
    }
  }

  if (!in_file.eof()) {
    error = "failed while reading object for archiving: " + source.path.string();
    return false;
  }
  if (copied != source.size_bytes) {
    error = "object shrank while archiving: " + source.path.string();
    return false;
  }
  return true;
}

void WriteZeros(std::ofstream& out_file, std::uint64_t count) {
  static const Block kZeroBlock{};
  while (count > 0U) {
    const std::uint64_t chunk = count < kBlockSize ? count : kBlockSize;
    out_file.write(kZeroBlock.data(), static_cast<std::streamsize>(chunk));
    count -= chunk;
  }
}

} // namespace

bool WriteTarArchive(const std::vector<TarSource>& sources, const fs::path& output_path,
                     std::string& error) {
  if (output_path.empty()) {
    error = "archive output path cannot be empty";
    return false;
  }

  std::ofstream out_file(output_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open archive output: " + output_path.string();
    return false;
  }

  Block header_block{};
  for (const auto& source : sources) {
    if (!EncodeFileHeader(source.entry_name, source.size_bytes, header_block, error)) {
      return false;
    }
    out_file.write(header_block.data(), static_cast<std::streamsize>(header_block.size()));
    if (!out_file) {
      error = "failed while writing archive header for: " + source.entry_name;
      return false;
    }

    if (!CopyPayload(source, out_file, error)) {
      return false;
    }
    WriteZeros(out_file, PaddingFor(source.size_bytes));
  }

  WriteZeros(out_file, kBlockSize * kEndBlocks);
  out_file.flush();
  if (!out_file) {
    error = "failed while finalizing archive: " + output_path.string();
    return false;
  }

  return true;
}

} // namespace lfspack::archive
