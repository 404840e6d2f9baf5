#include "archive/tar_format.hpp"

#include <algorithm>
#include <cstring>

namespace lfspack::archive {

namespace {

constexpr std::string_view kUstarMagic = "ustar";
// 11 octal digits plus NUL is the largest size the plain field can hold.
constexpr std::uint64_t kMaxOctalSize = 077777777777ULL;

void WriteField(Block& block, std::size_t offset, std::size_t width, std::string_view value) {
  // An empty view may carry a null data pointer.
  if (value.empty()) {
    return;
  }
  std::memcpy(block.data() + offset, value.data(), std::min(width, value.size()));
}

void WriteOctal(Block& block, std::size_t offset, std::size_t width, std::uint64_t value) {
  // width-1 digits, zero padded, NUL terminated.
  std::string digits(width - 1, '0');
  for (std::size_t i = digits.size(); i > 0 && value != 0U; --i) {
    digits[i - 1] = static_cast<char>('0' + (value & 7U));
    value >>= 3;
  }
  WriteField(block, offset, width, digits);
  block[offset + width - 1] = '\0';
}

// GNU base-256 encoding for sizes the octal field cannot hold.
void WriteBase256(Block& block, std::size_t offset, std::size_t width, std::uint64_t value) {
  for (std::size_t i = width; i > 1; --i) {
    block[offset + i - 1] = static_cast<char>(value & 0xFFU);
    value >>= 8;
  }
  block[offset] = static_cast<char>(0x80);
}

unsigned int ComputeChecksum(const Block& block) {
  unsigned int sum = 0;
  for (std::size_t i = 0; i < kBlockSize; ++i) {
    if (i >= header::kChecksumOffset && i < header::kChecksumOffset + header::kChecksumSize) {
      sum += static_cast<unsigned char>(' ');
    } else {
      sum += static_cast<unsigned char>(block[i]);
    }
  }
  return sum;
}

std::string ReadString(const Block& block, std::size_t offset, std::size_t width) {
  const char* begin = block.data() + offset;
  const char* end = std::find(begin, begin + width, '\0');
  return std::string(begin, end);
}

bool ReadNumber(const Block& block, std::size_t offset, std::size_t width, std::uint64_t& value) {
  value = 0;
  const auto lead = static_cast<unsigned char>(block[offset]);
  if ((lead & 0x80U) != 0U) {
    if ((lead & 0x40U) != 0U) {
      return false; // negative base-256
    }
    value = lead & 0x3FU;
    for (std::size_t i = 1; i < width; ++i) {
      if ((value >> 56) != 0U) {
        return false;
      }
      value = (value << 8) | static_cast<unsigned char>(block[offset + i]);
    }
    return true;
  }

  std::size_t i = 0;
  while (i < width && block[offset + i] == ' ') {
    ++i;
  }
  bool any_digit = false;
  for (; i < width; ++i) {
    const char c = block[offset + i];
    if (c == '\0' || c == ' ') {
      break;
    }
    if (c < '0' || c > '7') {
      return false;
    }
    if ((value >> 61) != 0U) {
      return false;
    }
    value = (value << 3) | static_cast<std::uint64_t>(c - '0');
    any_digit = true;
  }
  return any_digit;
}

} // namespace

bool EncodeFileHeader(std::string_view name, std::uint64_t size_bytes, Block& block,
                      std::string& error) {
  block.fill('\0');

  if (name.empty()) {
    error = "tar entry name cannot be empty";
    return false;
  }

  std::string_view prefix;
  std::string_view base = name;
  if (name.size() > header::kNameSize) {
    // Split at the last '/' that leaves both halves within their fields.
    std::size_t split = std::string_view::npos;
    for (std::size_t pos = name.find('/'); pos != std::string_view::npos;
         pos = name.find('/', pos + 1)) {
      if (pos <= header::kPrefixSize && name.size() - pos - 1 <= header::kNameSize) {
        split = pos;
      }
    }
    if (split == std::string_view::npos || split == 0U) {
      error = "tar entry name too long for ustar: " + std::string(name);
      return false;
    }
    prefix = name.substr(0, split);
    base = name.substr(split + 1);
  }

  WriteField(block, header::kNameOffset, header::kNameSize, base);
  WriteOctal(block, header::kModeOffset, header::kModeSize, 0644);
  WriteOctal(block, header::kUidOffset, header::kIdSize, 0);
  WriteOctal(block, header::kGidOffset, header::kIdSize, 0);
  if (size_bytes > kMaxOctalSize) {
    WriteBase256(block, header::kSizeOffset, header::kSizeSize, size_bytes);
  } else {
    WriteOctal(block, header::kSizeOffset, header::kSizeSize, size_bytes);
  }
  WriteOctal(block, header::kMtimeOffset, header::kMtimeSize, 0);
  block[header::kTypeFlagOffset] = static_cast<char>(EntryType::kRegular);
  WriteField(block, header::kMagicOffset, 6, std::string_view("ustar\0", 6));
  WriteField(block, header::kVersionOffset, 2, "00");
  WriteField(block, header::kPrefixOffset, header::kPrefixSize, prefix);

  // Six octal digits, NUL, space.
  WriteOctal(block, header::kChecksumOffset, 7, ComputeChecksum(block));
  block[header::kChecksumOffset + 7] = ' ';
  return true;
}

bool DecodeHeader(const Block& block, EntryHeader& entry, std::string& error) {
  entry = EntryHeader{};

  std::uint64_t stored_checksum = 0;
  if (!ReadNumber(block, header::kChecksumOffset, header::kChecksumSize, stored_checksum)) {
    error = "tar header has an unreadable checksum field";
    return false;
  }
  if (stored_checksum != ComputeChecksum(block)) {
    error = "tar header checksum mismatch";
    return false;
  }

  if (ReadString(block, header::kMagicOffset, kUstarMagic.size()) != kUstarMagic) {
    error = "tar header is not in ustar format";
    return false;
  }

  if (!ReadNumber(block, header::kSizeOffset, header::kSizeSize, entry.size_bytes)) {
    error = "tar header has an invalid size field";
    return false;
  }

  const std::string prefix = ReadString(block, header::kPrefixOffset, header::kPrefixSize);
  const std::string name = ReadString(block, header::kNameOffset, header::kNameSize);
  entry.name = prefix.empty() ? name : prefix + "/" + name;
  entry.type = block[header::kTypeFlagOffset];
  return true;
}

bool IsZeroBlock(const Block& block) {
  return std::all_of(block.begin(), block.end(), [](char c) { return c == '\0'; });
}

} // namespace lfspack::archive
