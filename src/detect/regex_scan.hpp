#pragma once

#include <sanctum/core/error.hpp>
#include <sanctum/core/pii.hpp>
#include <sanctum/core/text_assembler.hpp>
#include <sanctum/core/token.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sanctum::detect::detail {

/// One regex hit: byte span in the scanned text and the matched bytes.
struct RegexMatch {
  core::TextSpan span;
  std::string text;
};

/// Bytes handed to std::regex per search. libstdc++'s executor recurses once per
/// consumed character, so the window bounds stack use on long screens.
inline constexpr std::size_t kScanWindowBytes = 4096;

/// Tail of each window re-scanned by the next one. Matches up to this length are
/// never cut; longer ones are truncated at the window end.
inline constexpr std::size_t kScanWindowOverlap = 512;

/// All non-empty, non-overlapping matches of re in text, left to right. When
/// group > 0 the span and text of that capture group are reported instead of the
/// whole match.
///
/// Text is searched in windows of kScanWindowBytes that start on a separator and
/// see the byte before them, so word boundaries and lookbehind-style leads behave
/// as in a single search. std::regex_error raised by the engine (complexity,
/// stack) becomes RegexFailed.
[[nodiscard]] std::expected<std::vector<RegexMatch>, core::DetectionError> find_all(
    const std::regex& re, const std::string& text, std::size_t group = 0);

/// DetectedItem for span, or nullopt when the span touches no token.
[[nodiscard]] std::optional<core::DetectedItem> make_item(core::PiiType type,
                                                          std::string matched_text,
                                                          core::TextSpan span,
                                                          const core::AssembledText& assembled,
                                                          std::span<const core::Token> tokens);

/// Exact, case-sensitive membership test.
[[nodiscard]] bool contains(std::span<const std::string> list, std::string_view value);

}  // namespace sanctum::detect::detail
