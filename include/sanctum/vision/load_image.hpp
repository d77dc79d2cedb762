#pragma once

#include <sanctum/core/image.hpp>
#include <optional>
#include <string>

namespace sanctum::vision {

/// Load an image file into an Image (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<sanctum::core::Image> load_image(const std::string& path);

/// Write image to path; the encoder is chosen from the extension. RGB8/RGBA8 are
/// converted to OpenCV's BGR order first. Returns false on failure.
bool save_image(const std::string& path, const sanctum::core::Image& image);

}  // namespace sanctum::vision
