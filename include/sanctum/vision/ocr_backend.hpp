#pragma once

#include <sanctum/core/error.hpp>
#include <sanctum/core/image.hpp>
#include <sanctum/core/token.hpp>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

namespace sanctum::vision {

/// Default confidence threshold (0-100) applied to OCR words.
inline constexpr int kDefaultOcrConfidence = 60;

/// Word filter shared by every OCR source: rejects empty or whitespace-only text,
/// confidence -1 (no recognition) and confidence below threshold.
[[nodiscard]] bool accept_token(std::string_view text, int confidence, int threshold) noexcept;

/// Abstract OCR engine: Image -> ordered word tokens above a confidence threshold.
/// Implement recognize(); optionally override validate_input, recognize_batch, warmup.
class IOcrBackend {
 public:
  virtual ~IOcrBackend() = default;

  /// Words in engine order, already filtered with accept_token(). Must be implemented.
  [[nodiscard]] virtual std::expected<std::vector<core::Token>, core::DetectionError>
  recognize(const core::Image& input, int confidence_threshold) = 0;

  /// Optional: validate image before recognize. Default: accept any valid() image.
  [[nodiscard]] virtual std::expected<void, core::DetectionError>
  validate_input(const core::Image& input) const;

  /// Optional: several images. Default: loop over recognize(), stop at the first error.
  [[nodiscard]] virtual std::expected<std::vector<std::vector<core::Token>>, core::DetectionError>
  recognize_batch(std::span<const core::Image> inputs, int confidence_threshold);

  /// Optional: one-time engine initialisation. Default: no-op.
  virtual void warmup() {}
};

}  // namespace sanctum::vision
