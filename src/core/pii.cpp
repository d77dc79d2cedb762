#include <sanctum/core/pii.hpp>

namespace sanctum::core {

std::string_view to_string(PiiType type) noexcept {
  switch (type) {
    case PiiType::Email:
      return "email";
    case PiiType::Ip:
      return "ip";
    case PiiType::Domain:
      return "domain";
    case PiiType::Url:
      return "url";
    case PiiType::Phone:
      return "phone";
    case PiiType::Face:
      return "face";
    case PiiType::Custom:
      return "custom";
  }
  return "unknown";
}

std::optional<PiiType> pii_type_from_string(std::string_view name) noexcept {
  if (name == "email") return PiiType::Email;
  if (name == "ip") return PiiType::Ip;
  if (name == "domain") return PiiType::Domain;
  if (name == "url") return PiiType::Url;
  if (name == "phone") return PiiType::Phone;
  if (name == "face") return PiiType::Face;
  if (name == "custom") return PiiType::Custom;
  return std::nullopt;
}

}  // namespace sanctum::core
