#include "archive/tar_format.hpp"
#include "archive/tar_extractor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <string>

using lfspack::archive::Block;

TEST_CASE("Tar header encodes a short object path", "[archive][tar]") {
  const std::string name =
      "objects/ab/cd/abcd000000000000000000000000000000000000000000000000000000000000";
  Block block{};
  std::string error;
  REQUIRE(lfspack::archive::EncodeFileHeader(name, 1536, block, error));

  REQUIRE(std::string(block.data() + 257, 5) == "ustar");
  REQUIRE(block[156] == '0');
  REQUIRE(std::string(block.data() + 124, 11) == "00000003000");

  lfspack::archive::EntryHeader entry;
  REQUIRE(lfspack::archive::DecodeHeader(block, entry, error));
  REQUIRE(entry.name == name);
  REQUIRE(entry.size_bytes == 1536U);
  REQUIRE(entry.type == '0');
}

TEST_CASE("Tar header leaves the prefix empty for names that fit", "[archive][tar]") {
  Block block;
  block.fill('x');
  std::string error;
  // Dirty input block: every unused byte must come back zeroed, prefix included.
  REQUIRE(lfspack::archive::EncodeFileHeader("objects/ab/cd/abcd", 7, block, error));
  for (std::size_t i = 345; i < 345 + 155; ++i) {
    REQUIRE(block[i] == '\0');
  }
  REQUIRE(std::string(block.data()) == "objects/ab/cd/abcd");

  // A name of exactly 100 bytes still fits the name field without a split.
  const std::string full = "objects/" + std::string(92, 'e');
  REQUIRE(lfspack::archive::EncodeFileHeader(full, 0, block, error));
  REQUIRE(std::string(block.data(), 100) == full);
  REQUIRE(block[345] == '\0');

  lfspack::archive::EntryHeader entry;
  REQUIRE(lfspack::archive::DecodeHeader(block, entry, error));
  REQUIRE(entry.name == full);
}

TEST_CASE("Tar header splits long names into prefix and name", "[archive][tar]") {
  const std::string name = std::string(80, 'd') + "/" + std::string(90, 'f');
  Block block{};
  std::string error;
  REQUIRE(lfspack::archive::EncodeFileHeader(name, 0, block, error));
  REQUIRE(std::string(block.data() + 345) == std::string(80, 'd'));

  lfspack::archive::EntryHeader entry;
  REQUIRE(lfspack::archive::DecodeHeader(block, entry, error));
  REQUIRE(entry.name == name);

  REQUIRE_FALSE(lfspack::archive::EncodeFileHeader(std::string(120, 'x'), 0, block, error));
  REQUIRE(error.find("too long") != std::string::npos);
}

TEST_CASE("Tar header carries sizes beyond the octal field", "[archive][tar]") {
  const std::uint64_t huge = 10ULL * 1024ULL * 1024ULL * 1024ULL;
  Block block{};
  std::string error;
  REQUIRE(lfspack::archive::EncodeFileHeader("objects/big", huge, block, error));
  REQUIRE((static_cast<unsigned char>(block[124]) & 0x80U) != 0U);

  lfspack::archive::EntryHeader entry;
  REQUIRE(lfspack::archive::DecodeHeader(block, entry, error));
  REQUIRE(entry.size_bytes == huge);
}

TEST_CASE("Tar header rejects a corrupted checksum", "[archive][tar]") {
  Block block{};
  std::string error;
  REQUIRE(lfspack::archive::EncodeFileHeader("objects/x", 10, block, error));
  block[0] = 'y';

  lfspack::archive::EntryHeader entry;
  REQUIRE_FALSE(lfspack::archive::DecodeHeader(block, entry, error));
  REQUIRE(error == "tar header checksum mismatch");
}

TEST_CASE("Tar padding rounds payloads to whole blocks", "[archive][tar]") {
  STATIC_REQUIRE(lfspack::archive::PaddingFor(0) == 0U);
  STATIC_REQUIRE(lfspack::archive::PaddingFor(1) == 511U);
  STATIC_REQUIRE(lfspack::archive::PaddingFor(512) == 0U);
  STATIC_REQUIRE(lfspack::archive::PaddingFor(513) == 511U);

  Block zero{};
  REQUIRE(lfspack::archive::IsZeroBlock(zero));
  zero[511] = 1;
  REQUIRE_FALSE(lfspack::archive::IsZeroBlock(zero));
}

TEST_CASE("Extraction accepts only contained entry names", "[archive][tar]") {
  REQUIRE(lfspack::archive::IsSafeEntryName("objects/ab/cd/abcd"));
  REQUIRE(lfspack::archive::IsSafeEntryName("./objects/ab"));

  REQUIRE_FALSE(lfspack::archive::IsSafeEntryName(""));
  REQUIRE_FALSE(lfspack::archive::IsSafeEntryName("/etc/passwd"));
  REQUIRE_FALSE(lfspack::archive::IsSafeEntryName("objects/../../hooks/pre-commit"));
  REQUIRE_FALSE(lfspack::archive::IsSafeEntryName(".."));
  REQUIRE_FALSE(lfspack::archive::IsSafeEntryName("objects\\ab"));
  REQUIRE_FALSE(lfspack::archive::IsSafeEntryName("C:/temp"));
}
