#include <sanctum/vision/load_image.hpp>
#include "image_cv_utils.hpp"
#include <sanctum/core/image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace sanctum::vision {

std::optional<sanctum::core::Image> load_image(const std::string& path) {
  cv::Mat mat = cv::imread(path);
  if (mat.empty()) return std::nullopt;

  sanctum::core::PixelFormat format = sanctum::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = sanctum::core::PixelFormat::Grayscale8;

  return detail::mat_to_image(mat, format);
}

bool save_image(const std::string& path, const sanctum::core::Image& image) {
  auto mat = detail::image_to_mat(image);
  if (!mat) return false;

  try {
    cv::Mat out = *mat;
    if (image.format() == sanctum::core::PixelFormat::RGB8) {
      cv::cvtColor(*mat, out, cv::COLOR_RGB2BGR);
    } else if (image.format() == sanctum::core::PixelFormat::RGBA8) {
      cv::cvtColor(*mat, out, cv::COLOR_RGBA2BGRA);
    }
    return cv::imwrite(path, out);
  } catch (const cv::Exception&) {
    return false;
  }
}

}  // namespace sanctum::vision
