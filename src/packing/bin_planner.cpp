#include "packing/bin_planner.hpp"

namespace lfspack::packing {

bool PlanBins(const std::vector<store::ObjectEntry>& objects, std::uint64_t max_bin_bytes,
              BinPlan& plan, std::string& error) {
  plan = BinPlan{};
  if (max_bin_bytes == 0U) {
    error = "max bin size must be a positive number of bytes";
    return false;
  }
  plan.max_bin_bytes = max_bin_bytes;

  Bin* current = nullptr;
  for (const auto& object : objects) {
    if (object.size_bytes >= max_bin_bytes) {
      plan.skipped.push_back(object);
      continue;
    }

    // An open bin never exceeds the bound, so the subtraction cannot wrap.
    if (current == nullptr || object.size_bytes > max_bin_bytes - current->payload_bytes) {
      Bin next;
      next.number = static_cast<std::uint32_t>(plan.bins.size() + 1U);
      plan.bins.push_back(std::move(next));
      current = &plan.bins.back();
    }

    current->objects.push_back(object);
    current->payload_bytes += object.size_bytes;
    ++plan.pack_count;
  }

  return true;
}

} // namespace lfspack::packing
