#pragma once

#include "store/object_store.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lfspack::packing {

// 256 MiB, the bound used when no `--max-bin-bytes` is given.
inline constexpr std::uint64_t kDefaultMaxBinBytes = 256ULL * 1024ULL * 1024ULL;

// One group of objects destined for a single archive.
struct Bin {
  // 1-based, in closing order. Archive `lfspack-<number>.tar.gz` holds it.
  std::uint32_t number = 0;
  std::vector<store::ObjectEntry> objects;
  std::uint64_t payload_bytes = 0;
};

struct BinPlan {
  std::vector<Bin> bins;
  // Objects whose size alone reaches the bound. They stay in the store
  // untouched and are fetched individually later.
  std::vector<store::ObjectEntry> skipped;
  // Objects placed in some bin.
  std::uint64_t pack_count = 0;
  std::uint64_t max_bin_bytes = 0;
};

// Greedy single-pass packing in encounter order:
// - an object with `size >= max_bin_bytes` is skipped;
// - otherwise it joins the open bin if the bin stays within the bound, or
//   closes the open bin and starts a new one.
//
// The policy is first-fit-by-accumulation, not an optimal solver. It never
// reorders objects and never backtracks, so the plan is reproducible for a
// given object order. Fails only when `max_bin_bytes` is zero.
bool PlanBins(const std::vector<store::ObjectEntry>& objects, std::uint64_t max_bin_bytes,
              BinPlan& plan, std::string& error);

} // namespace lfspack::packing
