#pragma once

#include <sanctum/core/error.hpp>
#include <sanctum/core/image.hpp>
#include <sanctum/vision/ocr_backend.hpp>
#include <memory>
#include <string>

#ifdef SANCTUM_HAS_TESSERACT

namespace sanctum::vision {

/// Tesseract word-level OCR implementing IOcrBackend.
///
/// Input is converted to grayscale and binarised with Otsu's threshold before
/// recognition. Tokens are Tesseract's RIL_WORD results in iterator order, with
/// the word bounding box and the rounded word confidence.
///
/// Not thread-safe: use one backend per thread.
class TesseractOcrBackend : public IOcrBackend {
 public:
  /// \param language Tesseract language code(s), e.g. "eng" or "eng+deu".
  /// \param datapath tessdata directory; empty uses Tesseract's default lookup.
  /// \throws std::runtime_error if the engine cannot be initialised.
  explicit TesseractOcrBackend(std::string language = "eng", std::string datapath = {});

  ~TesseractOcrBackend() override;

  TesseractOcrBackend(const TesseractOcrBackend&) = delete;
  TesseractOcrBackend& operator=(const TesseractOcrBackend&) = delete;

  [[nodiscard]] std::expected<std::vector<core::Token>, core::DetectionError>
  recognize(const core::Image& input, int confidence_threshold) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace sanctum::vision

#endif  // SANCTUM_HAS_TESSERACT
