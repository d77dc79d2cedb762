#pragma once

#include <sanctum/core/error.hpp>
#include <sanctum/core/pii.hpp>
#include <sanctum/core/policy.hpp>
#include <sanctum/core/text_assembler.hpp>
#include <sanctum/core/token.hpp>
#include <expected>
#include <regex>
#include <span>
#include <vector>

namespace sanctum::detect {

/// Compiles rule.pattern (ECMAScript). Returns InvalidRegex if it does not compile.
[[nodiscard]] std::expected<std::regex, core::DetectionError> compile_rule(
    const core::CustomRule& rule);

/// Runs every rule over the assembled text. Each match yields a Custom item whose
/// matched_text is the rule name. Rules that fail to compile or to evaluate are
/// logged and skipped; the remaining rules still run.
[[nodiscard]] std::vector<core::DetectedItem> detect_custom(const core::AssembledText& assembled,
                                                            std::span<const core::Token> tokens,
                                                            std::span<const core::CustomRule> rules);

}  // namespace sanctum::detect
