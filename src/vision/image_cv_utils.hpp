#pragma once

#include <sanctum/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace sanctum::vision::detail {

/// Non-owning cv::Mat view over image (CV_8UC1/3/4). Returns nullopt if the image
/// is invalid or its format unsupported.
std::optional<cv::Mat> image_to_mat(const sanctum::core::Image& image);

/// Copy cv::Mat (8-bit, 1/3/4 channels) into a packed Image.
sanctum::core::Image mat_to_image(const cv::Mat& mat, sanctum::core::PixelFormat format);

}  // namespace sanctum::vision::detail
