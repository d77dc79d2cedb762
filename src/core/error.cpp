#include <sanctum/core/error.hpp>

namespace sanctum::core {

std::string_view to_string(DetectionError error) noexcept {
  switch (error) {
    case DetectionError::None:
      return "none";
    case DetectionError::InvalidRegex:
      return "invalid regex";
    case DetectionError::RegexFailed:
      return "regex evaluation failed";
    case DetectionError::PhoneScanFailed:
      return "phone scan failed";
    case DetectionError::InvalidImage:
      return "invalid image";
    case DetectionError::LoadFailed:
      return "load failed";
    case DetectionError::SaveFailed:
      return "save failed";
    case DetectionError::OcrFailed:
      return "ocr failed";
    case DetectionError::InvalidConfig:
      return "invalid config";
  }
  return "unknown";
}

}  // namespace sanctum::core
