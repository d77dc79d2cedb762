#include <sanctum/vision/ocr_backend.hpp>
#include <sanctum/core/error.hpp>
#include <algorithm>
#include <cctype>
#include <span>
#include <vector>

namespace sanctum::vision {

bool accept_token(std::string_view text, int confidence, int threshold) noexcept {
  const bool blank = std::all_of(text.begin(), text.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; });
  if (blank) return false;
  if (confidence == -1) return false;
  return confidence >= threshold;
}

std::expected<void, core::DetectionError> IOcrBackend::validate_input(
    const core::Image& input) const {
  if (!input.valid()) {
    return std::unexpected(core::DetectionError::InvalidImage);
  }
  return {};
}

std::expected<std::vector<std::vector<core::Token>>, core::DetectionError>
IOcrBackend::recognize_batch(std::span<const core::Image> inputs, int confidence_threshold) {
  std::vector<std::vector<core::Token>> results;
  results.reserve(inputs.size());
  for (const auto& image : inputs) {
    auto single = recognize(image, confidence_threshold);
    if (!single) {
      return std::unexpected(single.error());
    }
    results.push_back(std::move(*single));
  }
  return results;
}

}  // namespace sanctum::vision
