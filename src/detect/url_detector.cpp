#include <sanctum/detect/url_detector.hpp>
#include "regex_scan.hpp"
#include <spdlog/spdlog.h>
#include <regex>

namespace sanctum::detect {

namespace {

const std::regex& url_regex() {
  static const std::regex re(R"((?:https?://|www\.)[^\s<>"')]+)",
                             std::regex::ECMAScript | std::regex::icase);
  return re;
}

}  // namespace

std::vector<core::DetectedItem> detect_urls(const core::AssembledText& assembled,
                                            std::span<const core::Token> tokens) {
  std::vector<core::DetectedItem> out;
  auto matches = detail::find_all(url_regex(), assembled.text);
  if (!matches) {
    spdlog::warn("detect_urls: {}", core::to_string(matches.error()));
    return out;
  }

  for (auto& m : *matches) {
    const bool has_query = m.text.find('?') != std::string::npos;
    auto item = detail::make_item(core::PiiType::Url, std::move(m.text), m.span, assembled, tokens);
    if (!item) continue;
    item->has_query_params = has_query;
    out.push_back(std::move(*item));
  }
  return out;
}

}  // namespace sanctum::detect
