#include <sanctum/detect/custom_rule_detector.hpp>
#include "regex_scan.hpp"
#include <spdlog/spdlog.h>

namespace sanctum::detect {

std::expected<std::regex, core::DetectionError> compile_rule(const core::CustomRule& rule) {
  if (rule.pattern.empty()) {
    return std::unexpected(core::DetectionError::InvalidRegex);
  }
  try {
    return std::regex(rule.pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    spdlog::debug("compile_rule '{}': {}", rule.name, e.what());
    return std::unexpected(core::DetectionError::InvalidRegex);
  }
}

std::vector<core::DetectedItem> detect_custom(const core::AssembledText& assembled,
                                              std::span<const core::Token> tokens,
                                              std::span<const core::CustomRule> rules) {
  std::vector<core::DetectedItem> out;
  for (const auto& rule : rules) {
    auto re = compile_rule(rule);
    if (!re) {
      spdlog::warn("custom rule '{}' skipped: {} ({})", rule.name, core::to_string(re.error()),
                   rule.pattern);
      continue;
    }
    auto matches = detail::find_all(*re, assembled.text);
    if (!matches) {
      spdlog::warn("custom rule '{}' skipped: {}", rule.name, core::to_string(matches.error()));
      continue;
    }
    for (const auto& m : *matches) {
      auto item = detail::make_item(core::PiiType::Custom, rule.name, m.span, assembled, tokens);
      if (item) out.push_back(std::move(*item));
    }
  }
  return out;
}

}  // namespace sanctum::detect
