#include <sanctum/vision/tesseract_ocr_backend.hpp>

#ifdef SANCTUM_HAS_TESSERACT

#include "image_cv_utils.hpp"
#include <sanctum/core/error.hpp>
#include <sanctum/core/image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sanctum::vision {

namespace {

/// Grayscale + Otsu binarisation; Tesseract reads dark text on light background best.
cv::Mat binarize(const cv::Mat& src, core::PixelFormat format) {
  cv::Mat gray;
  switch (format) {
    case core::PixelFormat::Grayscale8:
      gray = src;
      break;
    case core::PixelFormat::RGB8:
      cv::cvtColor(src, gray, cv::COLOR_RGB2GRAY);
      break;
    case core::PixelFormat::BGR8:
      cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY);
      break;
    case core::PixelFormat::RGBA8:
      cv::cvtColor(src, gray, cv::COLOR_RGBA2GRAY);
      break;
    case core::PixelFormat::BGRA8:
      cv::cvtColor(src, gray, cv::COLOR_BGRA2GRAY);
      break;
    case core::PixelFormat::Unknown:
    default:
      return {};
  }
  cv::Mat binary;
  cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
  return binary;
}

struct TextDeleter {
  void operator()(char* p) const noexcept { delete[] p; }
};

}  // namespace

struct TesseractOcrBackend::Impl {
  tesseract::TessBaseAPI api;
};

TesseractOcrBackend::TesseractOcrBackend(std::string language, std::string datapath)
    : impl_(std::make_unique<Impl>()) {
  const char* path = datapath.empty() ? nullptr : datapath.c_str();
  if (impl_->api.Init(path, language.c_str()) != 0) {
    throw std::runtime_error("TesseractOcrBackend: could not initialise language '" + language + "'");
  }
  impl_->api.SetPageSegMode(tesseract::PSM_AUTO);
}

TesseractOcrBackend::~TesseractOcrBackend() {
  if (impl_) impl_->api.End();
}

std::expected<std::vector<core::Token>, core::DetectionError>
TesseractOcrBackend::recognize(const core::Image& input, int confidence_threshold) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto mat = detail::image_to_mat(input);
  if (!mat) {
    return std::unexpected(core::DetectionError::InvalidImage);
  }

  cv::Mat binary;
  try {
    binary = binarize(*mat, input.format());
  } catch (const cv::Exception& e) {
    spdlog::warn("TesseractOcrBackend: preprocessing failed: {}", e.what());
    return std::unexpected(core::DetectionError::OcrFailed);
  }
  if (binary.empty()) {
    return std::unexpected(core::DetectionError::InvalidImage);
  }

  tesseract::TessBaseAPI& api = impl_->api;
  api.SetImage(binary.data, binary.cols, binary.rows, 1, static_cast<int>(binary.step));
  if (api.Recognize(nullptr) != 0) {
    api.Clear();
    return std::unexpected(core::DetectionError::OcrFailed);
  }

  std::vector<core::Token> tokens;
  std::unique_ptr<tesseract::ResultIterator> it(api.GetIterator());
  const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
  if (it) {
    do {
      std::unique_ptr<char, TextDeleter> word(it->GetUTF8Text(level));
      if (!word) continue;
      const int conf = static_cast<int>(std::lround(it->Confidence(level)));
      if (!accept_token(word.get(), conf, confidence_threshold)) continue;

      int x1 = 0;
      int y1 = 0;
      int x2 = 0;
      int y2 = 0;
      if (!it->BoundingBox(level, &x1, &y1, &x2, &y2)) continue;
      tokens.push_back({word.get(), core::BBox{x1, y1, x2 - x1, y2 - y1}, conf});
    } while (it->Next(level));
  }
  api.Clear();
  return tokens;
}

}  // namespace sanctum::vision

#endif  // SANCTUM_HAS_TESSERACT
