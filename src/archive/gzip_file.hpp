#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace lfspack::archive {

// Owns one zlib gzip stream opened for either reading or writing.
class GzipFile {
public:
  enum class Mode {
    kRead,
    kWrite,
  };

  GzipFile() = default;
  ~GzipFile();

  GzipFile(const GzipFile&) = delete;
  GzipFile& operator=(const GzipFile&) = delete;

  bool Open(const std::filesystem::path& path, Mode mode, std::string& error);

  // Reads up to `size` decompressed bytes. `read_count` is 0 at end of
  // stream. A corrupt stream or CRC mismatch is reported as an error.
  bool Read(char* buffer, std::size_t size, std::size_t& read_count, std::string& error);

  bool Write(const char* data, std::size_t size, std::string& error);

  // Flushes the gzip trailer when writing. Safe to call more than once.
  bool Close(std::string& error);

  bool IsOpen() const {
    return handle_ != nullptr;
  }

private:
  std::string DescribeError() const;

  void* handle_ = nullptr;
  std::filesystem::path path_;
};

// Compresses `input_path` into `input_path + ".gz"` and removes the input on
// success, matching `gzip <file>`. On failure the partial `.gz` is removed and
// the input is left in place.
bool GzipCompressFile(const std::filesystem::path& input_path,
                      std::filesystem::path& output_path, std::string& error);

} // namespace lfspack::archive
