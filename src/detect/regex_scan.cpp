#include "regex_scan.hpp"
#include <algorithm>

namespace sanctum::detect::detail {

namespace {

/// Start of the next window: the last separator at or before limit that lies
/// after pos, so the next window begins on a token boundary. Falls back to a
/// hard cut inside an over-long token.
std::size_t next_window_start(const std::string& text, std::size_t pos, std::size_t limit) {
  const auto space = text.rfind(' ', limit);
  if (space != std::string::npos && space > pos) return space;
  return limit;
}

}  // namespace

std::expected<std::vector<RegexMatch>, core::DetectionError> find_all(
    const std::regex& re, const std::string& text, std::size_t group) {
  std::vector<RegexMatch> out;
  std::size_t pos = 0;
  std::size_t last_end = 0;
  try {
    while (pos < text.size()) {
      const std::size_t end = std::min(text.size(), pos + kScanWindowBytes);
      // Matches starting before owned_end belong to this window; later ones to the next.
      const std::size_t owned_end =
          end == text.size() ? text.size()
                             : next_window_start(text, pos, end - kScanWindowOverlap);

      auto flags = std::regex_constants::match_default;
      if (pos > 0) flags |= std::regex_constants::match_prev_avail;
      if (end < text.size()) flags |= std::regex_constants::match_not_eol;
      const auto first = text.begin() + static_cast<std::ptrdiff_t>(pos);
      const auto last = text.begin() + static_cast<std::ptrdiff_t>(end);
      for (auto it = std::sregex_iterator(first, last, re, flags); it != std::sregex_iterator();
           ++it) {
        const std::smatch& m = *it;
        if (group >= m.size() || !m[group].matched || m.length(group) == 0) continue;
        const auto start = pos + static_cast<std::size_t>(m.position(group));
        if (start >= owned_end) break;
        if (start < last_end) continue;
        const auto len = static_cast<std::size_t>(m.length(group));
        out.push_back({core::TextSpan{start, start + len}, m.str(group)});
        last_end = start + len;
      }
      pos = owned_end;
    }
  } catch (const std::regex_error&) {
    return std::unexpected(core::DetectionError::RegexFailed);
  }
  return out;
}

std::optional<core::DetectedItem> make_item(core::PiiType type,
                                            std::string matched_text,
                                            core::TextSpan span,
                                            const core::AssembledText& assembled,
                                            std::span<const core::Token> tokens) {
  auto boxes = core::boxes_for_span(assembled, tokens, span);
  if (boxes.empty()) return std::nullopt;

  core::DetectedItem item;
  item.pii_type = type;
  item.matched_text = std::move(matched_text);
  item.boxes = std::move(boxes);
  item.span = span;
  return item;
}

bool contains(std::span<const std::string> list, std::string_view value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

}  // namespace sanctum::detect::detail
