#pragma once

#include <string_view>

namespace sanctum::core {

/// Error codes; used with std::expected for recoverable failures.
enum class DetectionError {
  None = 0,
  InvalidRegex,
  RegexFailed,
  PhoneScanFailed,
  InvalidImage,
  LoadFailed,
  SaveFailed,
  OcrFailed,
  InvalidConfig,
};

[[nodiscard]] std::string_view to_string(DetectionError error) noexcept;

}  // namespace sanctum::core
