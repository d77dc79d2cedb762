#pragma once

#include <sanctum/core/pii.hpp>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sanctum::core {

/// Redaction-ready rectangle derived from a DetectedItem or drawn by hand.
/// pii_type is nullopt for manual regions. Value type, independent of the tokens it came from.
struct Region {
  std::optional<PiiType> pii_type;
  std::string label_text;
  int x{0};
  int y{0};
  int w{0};
  int h{0};
  bool selected{true};
  bool manual{false};
};

/// Minimal rectangle enclosing all boxes of item (gaps between boxes included).
/// An item without boxes gives a zero-size region at the origin.
[[nodiscard]] Region merge_boxes(const DetectedItem& item);

/// One region per item, same order.
[[nodiscard]] std::vector<Region> build_regions(std::span<const DetectedItem> items);

/// User-drawn region: no PII type, label "Manual Region", selected.
[[nodiscard]] Region create_manual_region(int x, int y, int w, int h);

}  // namespace sanctum::core
