#include <sanctum/detect/domain_detector.hpp>
#include "regex_scan.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>

namespace sanctum::detect {

namespace {

const std::regex& domain_regex() {
  static const std::regex re(
      R"(\b(?:[A-Za-z0-9](?:[A-Za-z0-9-]{0,61}[A-Za-z0-9])?\.)+[A-Za-z]{2,}\b)");
  return re;
}

bool overlaps_any(const core::TextSpan& span, std::span<const core::TextSpan> excluded) {
  return std::any_of(excluded.begin(), excluded.end(),
                     [&span](const core::TextSpan& ex) { return span.overlaps(ex); });
}

}  // namespace

std::vector<core::TextSpan> exclusion_spans(std::span<const core::DetectedItem> items) {
  std::vector<core::TextSpan> spans;
  for (const auto& item : items) {
    switch (item.pii_type) {
      case core::PiiType::Email:
      case core::PiiType::Url:
      case core::PiiType::Ip:
        spans.push_back(item.span);
        break;
      case core::PiiType::Domain:
      case core::PiiType::Phone:
      case core::PiiType::Face:
      case core::PiiType::Custom:
        break;
    }
  }
  return spans;
}

std::vector<core::DetectedItem> detect_domains(const core::AssembledText& assembled,
                                               std::span<const core::Token> tokens,
                                               std::span<const std::string> ignore_domains,
                                               std::span<const core::TextSpan> excluded) {
  std::vector<core::DetectedItem> out;
  auto matches = detail::find_all(domain_regex(), assembled.text);
  if (!matches) {
    spdlog::warn("detect_domains: {}", core::to_string(matches.error()));
    return out;
  }

  for (auto& m : *matches) {
    if (overlaps_any(m.span, excluded)) continue;
    if (detail::contains(ignore_domains, m.text)) continue;
    auto item = detail::make_item(core::PiiType::Domain, std::move(m.text), m.span, assembled, tokens);
    if (item) out.push_back(std::move(*item));
  }
  return out;
}

}  // namespace sanctum::detect
