#pragma once

#include <sanctum/core/error.hpp>
#include <sanctum/core/pii.hpp>
#include <sanctum/core/text_assembler.hpp>
#include <sanctum/core/token.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sanctum::detect {

/// Numbering-plan hint selecting which phone grammar a scan pass uses.
enum class PhoneRegion : std::uint8_t {
  Generic,  // international "+CC ..." form only
  US,
  GB,
  CA,
  AU,
};

/// Passes run by detect_phones, in order.
inline constexpr std::array<PhoneRegion, 5> kPhoneRegionHints{
    PhoneRegion::Generic, PhoneRegion::US, PhoneRegion::GB, PhoneRegion::CA, PhoneRegion::AU,
};

/// Phone number candidate found by one region pass.
struct PhoneMatch {
  core::TextSpan span;
  std::string text;
};

[[nodiscard]] std::string_view to_string(PhoneRegion region) noexcept;

/// One pass of the grammar for region over text. Candidates touching a letter or
/// another digit on either side, or with a digit count the plan does not allow,
/// are rejected. A regex engine failure returns PhoneScanFailed.
[[nodiscard]] std::expected<std::vector<PhoneMatch>, core::DetectionError> scan_phone_region(
    const std::string& text, PhoneRegion region);

/// Phone numbers found by any pass of kPhoneRegionHints.
///
/// Overlapping hits from different passes are reported once: the earliest start
/// wins, and at equal starts a regional grammar beats the generic one. The same
/// number at two offsets gives two items, in text order. A failed pass is logged
/// and contributes nothing.
[[nodiscard]] std::vector<core::DetectedItem> detect_phones(const core::AssembledText& assembled,
                                                            std::span<const core::Token> tokens);

}  // namespace sanctum::detect
