#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sanctum::core {

/// Memory: Image owns a single contiguous, tightly packed buffer
/// (std::vector<std::byte>, rows of width * channels bytes); move semantics
/// and RAII throughout. Use data() for std::span views (non-owning).
/// Thread-safety: distinct Image instances are independent; sharing one Image
/// across threads requires external synchronization.

/// Pixel layout, 8 bits per channel.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Screenshot or other raster image: dimensions, format, and owned buffer.
class Image {
 public:
  Image() = default;

  Image(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  [[nodiscard]] std::size_t channels() const noexcept { return channels(format_); }
  [[nodiscard]] std::size_t row_bytes() const noexcept {
    return static_cast<std::size_t>(width_) * channels();
  }

  /// True if format is known and the buffer holds at least width*height pixels.
  [[nodiscard]] bool valid() const noexcept;

  /// Channel bytes of pixel (x, y). Caller guarantees valid() and in-range coordinates.
  [[nodiscard]] std::span<const std::byte> pixel(std::uint32_t x, std::uint32_t y) const noexcept;
  [[nodiscard]] std::span<std::byte> pixel(std::uint32_t x, std::uint32_t y) noexcept;

  /// Image of the given size with every channel of every pixel set to value.
  [[nodiscard]] static Image filled(std::uint32_t width,
                                    std::uint32_t height,
                                    PixelFormat format,
                                    std::uint8_t value);

  [[nodiscard]] static std::size_t channels(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace sanctum::core
