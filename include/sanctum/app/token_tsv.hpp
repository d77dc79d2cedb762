#pragma once

#include <sanctum/core/error.hpp>
#include <sanctum/core/token.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace sanctum::app {

/// Parse Tesseract TSV output (`tesseract img out tsv`) into word tokens.
///
/// Columns: level page_num block_num par_num line_num word_num left top width
/// height conf text. The header row, non-word rows (level != 5), short rows and
/// rows rejected by vision::accept_token(text, conf, confidence_threshold) are
/// skipped. Confidence is rounded to the nearest integer.
[[nodiscard]] std::vector<sanctum::core::Token> parse_tokens_tsv(std::string_view tsv,
                                                                 int confidence_threshold);

/// Read path and parse it with parse_tokens_tsv. LoadFailed if it cannot be read.
[[nodiscard]] std::expected<std::vector<sanctum::core::Token>, sanctum::core::DetectionError>
load_tokens_tsv(const std::string& path, int confidence_threshold);

}  // namespace sanctum::app
