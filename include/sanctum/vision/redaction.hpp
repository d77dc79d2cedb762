#pragma once

#include <sanctum/core/error.hpp>
#include <sanctum/core/image.hpp>
#include <sanctum/core/region.hpp>
#include <sanctum/core/token.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>

namespace sanctum::vision {

/// How a selected region is obscured.
enum class RedactionStyle : std::uint8_t {
  Solid,     // flat fill colour
  Blur,      // Gaussian blur of the region's own pixels
  Pixelate,  // nearest-neighbour down/up sampling
};

struct RedactionOptions {
  std::array<std::uint8_t, 3> fill_rgb{0, 0, 0};
  double blur_sigma{15.0};
  int pixel_size{10};
};

[[nodiscard]] std::string_view to_string(RedactionStyle style) noexcept;

/// Accepts "solid", "blur", "pixelate" (case-insensitive).
[[nodiscard]] std::optional<RedactionStyle> parse_style(std::string_view name);

/// Region rectangle clipped to a width x height image, or nullopt when the region
/// has non-positive size or lies entirely outside the image.
[[nodiscard]] std::optional<core::BBox> clamp_region(const core::Region& region,
                                                     std::uint32_t width,
                                                     std::uint32_t height) noexcept;

/// Returns a copy of input with every selected region obscured in style.
/// Unselected, empty and off-image regions are left untouched; input is never
/// modified. Unsupported or malformed images yield InvalidImage.
[[nodiscard]] std::expected<core::Image, core::DetectionError> apply_redaction(
    const core::Image& input,
    std::span<const core::Region> regions,
    RedactionStyle style,
    const RedactionOptions& options = {});

}  // namespace sanctum::vision
