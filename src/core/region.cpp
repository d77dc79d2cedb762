#include <sanctum/core/region.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace sanctum::core {

Region merge_boxes(const DetectedItem& item) {
  Region r;
  r.pii_type = item.pii_type;
  r.label_text = item.matched_text;
  r.selected = true;
  r.manual = false;

  if (item.boxes.empty()) {
    spdlog::debug("merge_boxes: {} item '{}' has no boxes, emitting empty region",
                  to_string(item.pii_type), item.matched_text);
    return r;
  }

  int min_x = item.boxes.front().x;
  int min_y = item.boxes.front().y;
  int max_x = item.boxes.front().x + item.boxes.front().w;
  int max_y = item.boxes.front().y + item.boxes.front().h;
  for (const auto& b : item.boxes) {
    min_x = std::min(min_x, b.x);
    min_y = std::min(min_y, b.y);
    max_x = std::max(max_x, b.x + b.w);
    max_y = std::max(max_y, b.y + b.h);
  }

  r.x = min_x;
  r.y = min_y;
  r.w = max_x - min_x;
  r.h = max_y - min_y;
  return r;
}

std::vector<Region> build_regions(std::span<const DetectedItem> items) {
  std::vector<Region> regions;
  regions.reserve(items.size());
  for (const auto& item : items) {
    regions.push_back(merge_boxes(item));
  }
  return regions;
}

Region create_manual_region(int x, int y, int w, int h) {
  Region r;
  r.pii_type = std::nullopt;
  r.label_text = "Manual Region";
  r.x = x;
  r.y = y;
  r.w = w;
  r.h = h;
  r.selected = true;
  r.manual = true;
  return r;
}

}  // namespace sanctum::core
