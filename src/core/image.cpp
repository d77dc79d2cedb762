#include <sanctum/core/image.hpp>
#include <cstddef>

namespace sanctum::core {

std::size_t Image::channels(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Image::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  return static_cast<std::size_t>(width) * height * channels(format);
}

bool Image::valid() const noexcept {
  if (format_ == PixelFormat::Unknown || width_ == 0 || height_ == 0) return false;
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

std::span<const std::byte> Image::pixel(std::uint32_t x, std::uint32_t y) const noexcept {
  const std::size_t c = channels();
  const std::size_t offset = static_cast<std::size_t>(y) * row_bytes() + static_cast<std::size_t>(x) * c;
  return std::span<const std::byte>(buffer_.data() + offset, c);
}

std::span<std::byte> Image::pixel(std::uint32_t x, std::uint32_t y) noexcept {
  const std::size_t c = channels();
  const std::size_t offset = static_cast<std::size_t>(y) * row_bytes() + static_cast<std::size_t>(x) * c;
  return std::span<std::byte>(buffer_.data() + offset, c);
}

Image Image::filled(std::uint32_t width,
                    std::uint32_t height,
                    PixelFormat format,
                    std::uint8_t value) {
  std::vector<std::byte> buffer(min_bytes(width, height, format), std::byte{value});
  return Image(width, height, format, std::move(buffer));
}

}  // namespace sanctum::core
