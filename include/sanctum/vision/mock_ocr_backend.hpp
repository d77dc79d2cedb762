#pragma once

#include <sanctum/vision/ocr_backend.hpp>
#include <sanctum/core/token.hpp>
#include <vector>

namespace sanctum::vision {

/// Backend that returns a configurable token list (for tests/demo).
/// The threshold filter is applied the same way a real engine applies it.
class MockOcrBackend : public IOcrBackend {
 public:
  /// Set tokens to return on next recognize() / recognize_batch() call(s).
  void set_tokens(std::vector<core::Token> tokens);

  [[nodiscard]] std::expected<std::vector<core::Token>, core::DetectionError>
  recognize(const core::Image& input, int confidence_threshold) override;

 private:
  std::vector<core::Token> tokens_to_return_;
};

}  // namespace sanctum::vision
