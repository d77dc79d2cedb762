#include <sanctum/detect/ip_detector.hpp>
#include "regex_scan.hpp"
#include <spdlog/spdlog.h>
#include <regex>

namespace sanctum::detect {

namespace {

// Octet alternatives are ordered longest first so "25" never stops short of "255".
const std::regex& ipv4_regex() {
  static const std::regex re(
      R"(\b(?:(?:25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9]?[0-9])\.){3})"
      R"((?:25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9]?[0-9])\b)");
  return re;
}

}  // namespace

std::vector<core::DetectedItem> detect_ipv4(const core::AssembledText& assembled,
                                            std::span<const core::Token> tokens) {
  std::vector<core::DetectedItem> out;
  auto matches = detail::find_all(ipv4_regex(), assembled.text);
  if (!matches) {
    spdlog::warn("detect_ipv4: {}", core::to_string(matches.error()));
    return out;
  }

  for (auto& m : *matches) {
    auto item = detail::make_item(core::PiiType::Ip, std::move(m.text), m.span, assembled, tokens);
    if (item) out.push_back(std::move(*item));
  }
  return out;
}

}  // namespace sanctum::detect
