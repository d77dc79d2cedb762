#include "image_cv_utils.hpp"
#include <sanctum/core/image.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace sanctum::vision::detail {

namespace sc = sanctum::core;

std::optional<cv::Mat> image_to_mat(const sc::Image& image) {
  if (!image.valid()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  auto* data = const_cast<std::byte*>(image.data().data());

  switch (image.format()) {
    case sc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, image.row_bytes());
    case sc::PixelFormat::RGB8:
    case sc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, image.row_bytes());
    case sc::PixelFormat::RGBA8:
    case sc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, image.row_bytes());
    case sc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

sc::Image mat_to_image(const cv::Mat& mat, sc::PixelFormat format) {
  if (mat.empty()) return sc::Image();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return sc::Image(w, h, format, std::move(buffer));
}

}  // namespace sanctum::vision::detail
