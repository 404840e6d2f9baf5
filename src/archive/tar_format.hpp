#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lfspack::archive {

// POSIX.1-1988 ustar layout. Only the fields lfspack reads or writes are
// named here.
inline constexpr std::size_t kBlockSize = 512;
inline constexpr std::size_t kEndBlocks = 2;

namespace header {
constexpr std::size_t kNameOffset = 0;
constexpr std::size_t kNameSize = 100;
constexpr std::size_t kModeOffset = 100;
constexpr std::size_t kModeSize = 8;
constexpr std::size_t kUidOffset = 108;
constexpr std::size_t kGidOffset = 116;
constexpr std::size_t kIdSize = 8;
constexpr std::size_t kSizeOffset = 124;
constexpr std::size_t kSizeSize = 12;
constexpr std::size_t kMtimeOffset = 136;
constexpr std::size_t kMtimeSize = 12;
constexpr std::size_t kChecksumOffset = 148;
constexpr std::size_t kChecksumSize = 8;
constexpr std::size_t kTypeFlagOffset = 156;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kVersionOffset = 263;
constexpr std::size_t kPrefixOffset = 345;
constexpr std::size_t kPrefixSize = 155;
} // namespace header

enum class EntryType : char {
  kRegular = '0',
  kRegularLegacy = '\0',
  kDirectory = '5',
  kPaxExtended = 'x',
  kPaxGlobal = 'g',
};

using Block = std::array<char, kBlockSize>;

struct EntryHeader {
  std::string name;
  std::uint64_t size_bytes = 0;
  char type = static_cast<char>(EntryType::kRegular);
};

// Fills `block` with a ustar header for a regular file. Names longer than
// 100 bytes are split into prefix/name at a '/' boundary. Mode is 0644,
// owner ids and mtime are zero so identical inputs produce identical archives.
bool EncodeFileHeader(std::string_view name, std::uint64_t size_bytes, Block& block,
                      std::string& error);

// Parses and checksum-verifies one header block.
bool DecodeHeader(const Block& block, EntryHeader& entry, std::string& error);

bool IsZeroBlock(const Block& block);

// Bytes of zero padding that follow a payload of `size_bytes`.
constexpr std::uint64_t PaddingFor(std::uint64_t size_bytes) {
  return (kBlockSize - (size_bytes % kBlockSize)) % kBlockSize;
}

} // namespace lfspack::archive
