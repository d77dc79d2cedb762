#pragma once

#include <sanctum/core/token.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sanctum::core {

/// Kind of personally-identifiable information found in OCR text.
enum class PiiType : std::uint8_t {
  Email,
  Ip,
  Domain,
  Url,
  Phone,
  Face,  // reserved, no detector emits it
  Custom,
};

/// Half-open byte span [start, end) in the assembled text.
struct TextSpan {
  std::size_t start{0};
  std::size_t end{0};

  [[nodiscard]] bool empty() const noexcept { return end <= start; }
  [[nodiscard]] bool overlaps(const TextSpan& other) const noexcept {
    return start < other.end && other.start < end;
  }

  friend bool operator==(const TextSpan&, const TextSpan&) = default;
};

/// A located PII instance: type, text, and the boxes of every token the match touches.
/// For Custom items matched_text holds the rule name, not the matched substring.
struct DetectedItem {
  PiiType pii_type{PiiType::Custom};
  std::string matched_text;
  std::vector<BBox> boxes;
  bool has_query_params{false};  // Url only
  TextSpan span{};
};

[[nodiscard]] std::string_view to_string(PiiType type) noexcept;

/// Parses the lower-case names produced by to_string ("email", "ip", ...).
[[nodiscard]] std::optional<PiiType> pii_type_from_string(std::string_view name) noexcept;

}  // namespace sanctum::core
