#include <sanctum/vision/mock_ocr_backend.hpp>
#include <sanctum/core/error.hpp>
#include <vector>

namespace sanctum::vision {

void MockOcrBackend::set_tokens(std::vector<core::Token> tokens) {
  tokens_to_return_ = std::move(tokens);
}

std::expected<std::vector<core::Token>, core::DetectionError>
MockOcrBackend::recognize(const core::Image& input, int confidence_threshold) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  std::vector<core::Token> out;
  for (const auto& t : tokens_to_return_) {
    if (accept_token(t.text, t.confidence, confidence_threshold)) out.push_back(t);
  }
  return out;
}

}  // namespace sanctum::vision
