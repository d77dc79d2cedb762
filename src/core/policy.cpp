#include <sanctum/core/policy.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstddef>

namespace sanctum::core {

void apply_policy(std::span<const DetectedItem> items,
                  std::span<Region> regions,
                  const TemplatePolicy& policy) {
  if (items.size() != regions.size()) {
    spdlog::warn("apply_policy: {} items but {} regions, using common prefix",
                 items.size(), regions.size());
  }
  const std::size_t n = std::min(items.size(), regions.size());
  for (std::size_t i = 0; i < n; ++i) {
    if (regions[i].pii_type != PiiType::Url) continue;
    regions[i].selected =
        policy.flag_query_params_only ? items[i].has_query_params : true;
  }
}

}  // namespace sanctum::core
