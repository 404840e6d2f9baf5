#ifndef LFSPACK_TESTS_COMMON_STORE_FIXTURES_HPP_
#define LFSPACK_TESTS_COMMON_STORE_FIXTURES_HPP_

#include "assertions.hpp"
#include "store/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lfspack::tests::common {

// Index-prefixed ids keep encounter order equal to creation order.
inline std::string SampleOid(std::size_t index) {
  constexpr std::string_view kHex = "0123456789abcdef";
  std::string oid(64, 'c');
  oid[0] = kHex[(index / 16U) % 16U];
  oid[1] = kHex[index % 16U];
  oid[63] = kHex[index % 16U];
  return oid;
}

inline std::string SamplePayload(std::size_t index, std::uint64_t size) {
  std::string payload(static_cast<std::size_t>(size), '\0');
  for (std::size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<char>((i * 31U + index * 7U) % 251U);
  }
  return payload;
}

// Writes one object per entry of `sizes` under `store_root/objects`.
inline void WriteSampleStore(const std::filesystem::path& store_root,
                             const std::vector<std::uint64_t>& sizes) {
  for (std::size_t i = 0; i < sizes.size(); ++i) {
    WriteFileOrFail(store_root / lfspack::store::RelativeObjectPath(SampleOid(i)),
                    SamplePayload(i, sizes[i]));
  }
}

inline void AssertSampleObjectRestored(const std::filesystem::path& store_root, std::size_t index,
                                       std::uint64_t size) {
  const std::filesystem::path path =
      store_root / lfspack::store::RelativeObjectPath(SampleOid(index));
  if (ReadFileToString(path) != SamplePayload(index, size)) {
    Fail("restored object differs: " + path.string());
  }
}

} // namespace lfspack::tests::common

#endif // LFSPACK_TESTS_COMMON_STORE_FIXTURES_HPP_
