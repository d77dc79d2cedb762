#include <sanctum/detect/email_detector.hpp>
#include "regex_scan.hpp"
#include <spdlog/spdlog.h>
#include <regex>

namespace sanctum::detect {

namespace {

const std::regex& email_regex() {
  static const std::regex re(R"(\b[A-Za-z0-9._%+-]+@(?:[A-Za-z0-9-]+\.)+[A-Za-z]{2,}\b)");
  return re;
}

}  // namespace

std::vector<core::DetectedItem> detect_emails(const core::AssembledText& assembled,
                                              std::span<const core::Token> tokens,
                                              std::span<const std::string> ignore_emails,
                                              std::span<const std::string> ignore_domains) {
  std::vector<core::DetectedItem> out;
  auto matches = detail::find_all(email_regex(), assembled.text);
  if (!matches) {
    spdlog::warn("detect_emails: {}", core::to_string(matches.error()));
    return out;
  }

  for (auto& m : *matches) {
    const auto at = m.text.find('@');
    const std::string domain = at == std::string::npos ? std::string() : m.text.substr(at + 1);
    if (detail::contains(ignore_emails, m.text) || detail::contains(ignore_domains, domain)) {
      continue;
    }
    auto item = detail::make_item(core::PiiType::Email, std::move(m.text), m.span, assembled, tokens);
    if (item) out.push_back(std::move(*item));
  }
  return out;
}

}  // namespace sanctum::detect
