#include "archive/gzip_file.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <fstream>
#include <system_error>

#include <zlib.h>

namespace fs = std::filesystem;

namespace lfspack::archive {

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

gzFile AsGz(void* handle) {
  return static_cast<gzFile>(handle);
}

} // namespace

GzipFile::~GzipFile() {
  if (handle_ != nullptr) {
    (void)gzclose(AsGz(handle_));
    handle_ = nullptr;
  }
}

bool GzipFile::Open(const fs::path& path, Mode mode, std::string& error) {
  if (handle_ != nullptr) {
    error = "gzip stream already open: " + path_.string();
    return false;
  }

  const char* flags = mode == Mode::kRead ? "rb" : "wb6";
  gzFile handle = gzopen(path.string().c_str(), flags);
  if (handle == nullptr) {
    error = "failed to open gzip file '" + path.string() + "'";
    return false;
  }
  if (mode == Mode::kRead && gzbuffer(handle, static_cast<unsigned>(kCopyBufferSize)) != 0) {
    (void)gzclose(handle);
    error = "failed to size gzip buffer for '" + path.string() + "'";
    return false;
  }

  handle_ = handle;
  path_ = path;
  return true;
}

std::string GzipFile::DescribeError() const {
  int errnum = Z_OK;
  const char* message = gzerror(AsGz(handle_), &errnum);
  if (errnum == Z_ERRNO) {
    return std::error_code(errno, std::generic_category()).message();
  }
  return message != nullptr ? message : "unknown zlib error";
}

bool GzipFile::Read(char* buffer, std::size_t size, std::size_t& read_count, std::string& error) {
  read_count = 0;
  if (handle_ == nullptr) {
    error = "gzip stream is not open";
    return false;
  }

  const auto request = static_cast<unsigned>(std::min<std::size_t>(size, INT_MAX));
  const int got = gzread(AsGz(handle_), buffer, request);
  if (got < 0) {
    error = "failed to decompress '" + path_.string() + "': " + DescribeError();
    return false;
  }
  if (got == 0) {
    // zlib reports a stream cut short as a clean end of input plus Z_BUF_ERROR.
    int errnum = Z_OK;
    (void)gzerror(AsGz(handle_), &errnum);
    if (errnum == Z_BUF_ERROR) {
      error = "failed to decompress '" + path_.string() + "': " + DescribeError();
      return false;
    }
  }
  read_count = static_cast<std::size_t>(got);
  return true;
}

bool GzipFile::Write(const char* data, std::size_t size, std::string& error) {
  if (handle_ == nullptr) {
    error = "gzip stream is not open";
    return false;
  }

  while (size > 0U) {
    const auto chunk = static_cast<unsigned>(std::min<std::size_t>(size, INT_MAX));
    const int written = gzwrite(AsGz(handle_), data, chunk);
    if (written <= 0) {
      error = "failed to compress into '" + path_.string() + "': " + DescribeError();
      return false;
    }
    data += written;
    size -= static_cast<std::size_t>(written);
  }
  return true;
}

bool GzipFile::Close(std::string& error) {
  if (handle_ == nullptr) {
    return true;
  }
  const int status = gzclose(AsGz(handle_));
  handle_ = nullptr;
  if (status != Z_OK) {
    error = "failed to finalize gzip file '" + path_.string() + "' (zlib status " +
            std::to_string(status) + ")";
    return false;
  }
  return true;
}

bool GzipCompressFile(const fs::path& input_path, fs::path& output_path, std::string& error) {
  output_path = input_path;
  output_path += ".gz";

  std::ifstream in_file(input_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open file for compression: " + input_path.string();
    return false;
  }

  auto discard_output = [&output_path]() {
    std::error_code cleanup_ec;
    (void)fs::remove(output_path, cleanup_ec);
  };

  {
    GzipFile out;
    if (!out.Open(output_path, GzipFile::Mode::kWrite, error)) {
      return false;
    }

    std::array<char, kCopyBufferSize> buffer{};
    while (in_file.good()) {
      in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      const std::streamsize read_count = in_file.gcount();
      if (read_count <= 0) {
        continue;
      }
      if (!out.Write(buffer.data(), static_cast<std::size_t>(read_count), error)) {
        std::string close_error;
        (void)out.Close(close_error);
        discard_output();
        return false;
      }
    }

    if (!in_file.eof()) {
      std::string close_error;
      (void)out.Close(close_error);
      discard_output();
      error = "failed while reading file for compression: " + input_path.string();
      return false;
    }
    if (!out.Close(error)) {
      discard_output();
      return false;
    }
  }

  in_file.close();
  std::error_code ec;
  fs::remove(input_path, ec);
  if (ec) {
    error = "compressed '" + input_path.string() + "' but failed to remove it: " + ec.message();
    return false;
  }
  return true;
}

} // namespace lfspack::archive
