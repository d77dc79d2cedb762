#pragma once

#include <sanctum/core/pii.hpp>
#include <sanctum/core/token.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sanctum::core {

/// Token texts joined with single spaces, plus a per-byte reverse index.
/// offset_index[i] is the index of the token owning byte i of text, or nullopt
/// for an inserted separator. Invariant: offset_index.size() == text.size().
struct AssembledText {
  std::string text;
  std::vector<std::optional<std::size_t>> offset_index;
};

/// Joins tokens in order with one space between consecutive tokens.
/// Pure and total; empty input gives empty text and index.
[[nodiscard]] AssembledText assemble_text(std::span<const Token> tokens);

/// Boxes of the distinct tokens owning any byte of span, in increasing token order.
/// Separator bytes are ignored; an end past the text is clamped.
[[nodiscard]] std::vector<BBox> boxes_for_span(const AssembledText& assembled,
                                               std::span<const Token> tokens,
                                               TextSpan span);

}  // namespace sanctum::core
