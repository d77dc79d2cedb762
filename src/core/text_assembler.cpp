#include <sanctum/core/text_assembler.hpp>
#include <algorithm>
#include <cstddef>

namespace sanctum::core {

AssembledText assemble_text(std::span<const Token> tokens) {
  AssembledText out;
  std::size_t total = 0;
  for (const auto& t : tokens) total += t.text.size();
  if (!tokens.empty()) total += tokens.size() - 1;
  out.text.reserve(total);
  out.offset_index.reserve(total);

  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (i > 0) {
      out.text.push_back(' ');
      out.offset_index.emplace_back(std::nullopt);
    }
    out.text.append(tokens[i].text);
    out.offset_index.insert(out.offset_index.end(), tokens[i].text.size(),
                            std::optional<std::size_t>(i));
  }
  return out;
}

std::vector<BBox> boxes_for_span(const AssembledText& assembled,
                                 std::span<const Token> tokens,
                                 TextSpan span) {
  const std::size_t end = std::min(span.end, assembled.offset_index.size());
  std::vector<std::size_t> owners;
  for (std::size_t i = span.start; i < end; ++i) {
    const auto& owner = assembled.offset_index[i];
    if (owner && *owner < tokens.size()) owners.push_back(*owner);
  }
  std::sort(owners.begin(), owners.end());
  owners.erase(std::unique(owners.begin(), owners.end()), owners.end());

  std::vector<BBox> boxes;
  boxes.reserve(owners.size());
  for (const auto idx : owners) boxes.push_back(tokens[idx].bbox);
  return boxes;
}

}  // namespace sanctum::core
