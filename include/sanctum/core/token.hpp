#pragma once

#include <string>

namespace sanctum::core {

/// Axis-aligned pixel rectangle, origin top-left.
struct BBox {
  int x{0};
  int y{0};
  int w{0};
  int h{0};

  friend bool operator==(const BBox&, const BBox&) = default;
};

/// One OCR-recognized word: text, pixel box, confidence (0-100).
/// Tokens are kept in the order the OCR engine emitted them.
struct Token {
  std::string text;
  BBox bbox{};
  int confidence{0};
};

}  // namespace sanctum::core
