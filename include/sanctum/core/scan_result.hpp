#pragma once

#include <sanctum/core/pii.hpp>
#include <sanctum/core/region.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sanctum::core {

/// Result of one detection pass over one image's tokens.
/// regions[i] was built from items[i]; regions carry the policy's selection.
struct ScanResult {
  std::uint64_t image_id{0};
  std::vector<DetectedItem> items;
  std::vector<Region> regions;

  /// Which file or capture the tokens came from. Set by the application or batch runner.
  std::optional<std::string> source_id;
};

}  // namespace sanctum::core
