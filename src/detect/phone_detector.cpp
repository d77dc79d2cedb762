#include <sanctum/detect/phone_detector.hpp>
#include "regex_scan.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <regex>

namespace sanctum::detect {

namespace {

// The number itself is capture group 1. The lead consumes one non-alphanumeric
// byte (or matches at the start); the tail only looks ahead.
constexpr std::string_view kLead = R"((?:^|[^0-9A-Za-z+]))";
constexpr std::string_view kTail = R"((?![A-Za-z]|[-.]?[0-9]))";

struct PhoneGrammar {
  std::regex pattern;
  std::size_t min_digits;
  std::size_t max_digits;
};

std::regex bounded(std::string_view body) {
  std::string p;
  p.append(kLead).append("(").append(body).append(")").append(kTail);
  return std::regex(p);
}

const PhoneGrammar& grammar_for(PhoneRegion region) {
  static const PhoneGrammar generic{
      bounded(R"(\+[1-9][0-9]{0,2}(?:[-. ]?\(?[0-9]{1,4}\)?){1,5})"), 8, 15};
  // North American numbering plan, shared by US and CA.
  static const PhoneGrammar nanp{
      bounded(R"((?:\+?1[-. ]?)?(?:\([2-9][0-9]{2}\)|[2-9][0-9]{2})[-. ]?[0-9]{3}[-. ]?[0-9]{4})"
              R"(|[2-9][0-9]{2}-[0-9]{4})"),
      7, 11};
  static const PhoneGrammar gb{
      bounded(R"((?:\+44[-. ]?(?:\(0\)[-. ]?)?|0)[1-9][0-9]{1,4}[-. ]?[0-9]{3,4}[-. ]?[0-9]{3,4})"),
      10, 13};
  static const PhoneGrammar au{
      bounded(R"(\(0[2378]\)[-. ]?[0-9]{4}[-. ]?[0-9]{4})"
              R"(|(?:\+61[-. ]?|0)(?:4[0-9]{2}[-. ]?[0-9]{3}[-. ]?[0-9]{3})"
              R"(|[2378][-. ]?[0-9]{4}[-. ]?[0-9]{4}))"),
      10, 11};

  switch (region) {
    case PhoneRegion::Generic:
      return generic;
    case PhoneRegion::US:
    case PhoneRegion::CA:
      return nanp;
    case PhoneRegion::GB:
      return gb;
    case PhoneRegion::AU:
      return au;
  }
  return generic;
}

struct PhoneCandidate {
  PhoneMatch match;
  bool regional{false};
};

std::size_t count_digits(const std::string& s) {
  return static_cast<std::size_t>(std::count_if(
      s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; }));
}

}  // namespace

std::string_view to_string(PhoneRegion region) noexcept {
  switch (region) {
    case PhoneRegion::Generic:
      return "generic";
    case PhoneRegion::US:
      return "US";
    case PhoneRegion::GB:
      return "GB";
    case PhoneRegion::CA:
      return "CA";
    case PhoneRegion::AU:
      return "AU";
  }
  return "unknown";
}

std::expected<std::vector<PhoneMatch>, core::DetectionError> scan_phone_region(
    const std::string& text, PhoneRegion region) {
  const PhoneGrammar& grammar = grammar_for(region);
  auto matches = detail::find_all(grammar.pattern, text, 1);
  if (!matches) {
    return std::unexpected(core::DetectionError::PhoneScanFailed);
  }

  std::vector<PhoneMatch> out;
  for (auto& m : *matches) {
    const std::size_t digits = count_digits(m.text);
    if (digits < grammar.min_digits || digits > grammar.max_digits) continue;
    out.push_back({m.span, std::move(m.text)});
  }
  return out;
}

std::vector<core::DetectedItem> detect_phones(const core::AssembledText& assembled,
                                              std::span<const core::Token> tokens) {
  std::vector<PhoneCandidate> candidates;
  for (const auto region : kPhoneRegionHints) {
    auto matches = scan_phone_region(assembled.text, region);
    if (!matches) {
      spdlog::warn("detect_phones: {} pass skipped: {}", to_string(region),
                   core::to_string(matches.error()));
      continue;
    }
    for (auto& m : *matches) {
      candidates.push_back({std::move(m), region != PhoneRegion::Generic});
    }
  }

  // Overlapping hits from different passes are one number. The earliest start
  // wins, so a regional grammar never splits a longer international number; at the
  // same start a regional grammar beats the generic one, then the longer span.
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const PhoneCandidate& a, const PhoneCandidate& b) {
                     if (a.match.span.start != b.match.span.start) {
                       return a.match.span.start < b.match.span.start;
                     }
                     if (a.regional != b.regional) return a.regional;
                     return a.match.span.end > b.match.span.end;
                   });
  std::vector<PhoneMatch> kept;
  for (auto& c : candidates) {
    if (!kept.empty() && kept.back().span.overlaps(c.match.span)) continue;
    kept.push_back(std::move(c.match));
  }

  std::vector<core::DetectedItem> out;
  for (auto& m : kept) {
    auto item = detail::make_item(core::PiiType::Phone, std::move(m.text), m.span, assembled, tokens);
    if (item) out.push_back(std::move(*item));
  }
  return out;
}

}  // namespace sanctum::detect
