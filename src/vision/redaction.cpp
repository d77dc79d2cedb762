#include <sanctum/vision/redaction.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace sanctum::vision {

namespace {

namespace sc = sanctum::core;

cv::Scalar fill_scalar(sc::PixelFormat format, const std::array<std::uint8_t, 3>& rgb) {
  const double r = rgb[0];
  const double g = rgb[1];
  const double b = rgb[2];
  switch (format) {
    case sc::PixelFormat::Grayscale8:
      return cv::Scalar((299 * r + 587 * g + 114 * b) / 1000.0);
    case sc::PixelFormat::RGB8:
      return cv::Scalar(r, g, b);
    case sc::PixelFormat::BGR8:
      return cv::Scalar(b, g, r);
    case sc::PixelFormat::RGBA8:
      return cv::Scalar(r, g, b, 255);
    case sc::PixelFormat::BGRA8:
      return cv::Scalar(b, g, r, 255);
    case sc::PixelFormat::Unknown:
    default:
      return cv::Scalar::all(0);
  }
}

void blur_roi(cv::Mat& roi, double sigma) {
  // Blur a detached copy so pixels outside the region never bleed in.
  cv::Mat patch = roi.clone();
  cv::Mat blurred;
  cv::GaussianBlur(patch, blurred, cv::Size(0, 0), sigma, sigma, cv::BORDER_REPLICATE);
  blurred.copyTo(roi);
}

void pixelate_roi(cv::Mat& roi, int pixel_size) {
  const int block = std::max(1, pixel_size);
  const cv::Size small_size(std::max(1, roi.cols / block), std::max(1, roi.rows / block));
  cv::Mat small;
  cv::resize(roi, small, small_size, 0, 0, cv::INTER_NEAREST);
  cv::Mat restored;
  cv::resize(small, restored, roi.size(), 0, 0, cv::INTER_NEAREST);
  restored.copyTo(roi);
}

}  // namespace

std::string_view to_string(RedactionStyle style) noexcept {
  switch (style) {
    case RedactionStyle::Solid:
      return "solid";
    case RedactionStyle::Blur:
      return "blur";
    case RedactionStyle::Pixelate:
      return "pixelate";
  }
  return "unknown";
}

std::optional<RedactionStyle> parse_style(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "solid") return RedactionStyle::Solid;
  if (lower == "blur") return RedactionStyle::Blur;
  if (lower == "pixelate") return RedactionStyle::Pixelate;
  return std::nullopt;
}

std::optional<core::BBox> clamp_region(const core::Region& region,
                                       std::uint32_t width,
                                       std::uint32_t height) noexcept {
  if (region.w <= 0 || region.h <= 0) return std::nullopt;

  const long long x1 = std::max<long long>(0, region.x);
  const long long y1 = std::max<long long>(0, region.y);
  const long long x2 = std::min<long long>(width, static_cast<long long>(region.x) + region.w);
  const long long y2 = std::min<long long>(height, static_cast<long long>(region.y) + region.h);
  if (x1 >= x2 || y1 >= y2) return std::nullopt;

  return core::BBox{static_cast<int>(x1), static_cast<int>(y1),
                    static_cast<int>(x2 - x1), static_cast<int>(y2 - y1)};
}

std::expected<core::Image, core::DetectionError> apply_redaction(
    const core::Image& input,
    std::span<const core::Region> regions,
    RedactionStyle style,
    const RedactionOptions& options) {
  auto src = detail::image_to_mat(input);
  if (!src) {
    return std::unexpected(core::DetectionError::InvalidImage);
  }

  cv::Mat out = src->clone();
  try {
    for (const auto& region : regions) {
      if (!region.selected) continue;
      const auto rect = clamp_region(region, input.width(), input.height());
      if (!rect) {
        spdlog::debug("apply_redaction: skipping region '{}' ({},{} {}x{}) outside image",
                      region.label_text, region.x, region.y, region.w, region.h);
        continue;
      }

      cv::Mat roi = out(cv::Rect(rect->x, rect->y, rect->w, rect->h));
      switch (style) {
        case RedactionStyle::Solid:
          roi.setTo(fill_scalar(input.format(), options.fill_rgb));
          break;
        case RedactionStyle::Blur:
          blur_roi(roi, options.blur_sigma);
          break;
        case RedactionStyle::Pixelate:
          pixelate_roi(roi, options.pixel_size);
          break;
      }
    }
  } catch (const cv::Exception& e) {
    spdlog::warn("apply_redaction: {}", e.what());
    return std::unexpected(core::DetectionError::InvalidImage);
  }

  return detail::mat_to_image(out, input.format());
}

}  // namespace sanctum::vision
