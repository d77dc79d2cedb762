#pragma once

#include <sanctum/core/pii.hpp>
#include <sanctum/core/text_assembler.hpp>
#include <sanctum/core/token.hpp>
#include <span>
#include <vector>

namespace sanctum::detect {

/// URLs starting with http://, https:// or www. (scheme case-insensitive), running
/// until whitespace, an angle bracket, a quote or a closing parenthesis.
/// has_query_params is set when the matched text contains '?'.
[[nodiscard]] std::vector<core::DetectedItem> detect_urls(const core::AssembledText& assembled,
                                                          std::span<const core::Token> tokens);

}  // namespace sanctum::detect
