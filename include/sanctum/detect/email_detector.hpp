#pragma once

#include <sanctum/core/pii.hpp>
#include <sanctum/core/text_assembler.hpp>
#include <sanctum/core/token.hpp>
#include <span>
#include <string>
#include <vector>

namespace sanctum::detect {

/// Email addresses (local@label.tld, TLD of two or more letters).
/// A match is dropped when the whole address is in ignore_emails or the part
/// after '@' is in ignore_domains (exact comparison).
[[nodiscard]] std::vector<core::DetectedItem> detect_emails(
    const core::AssembledText& assembled,
    std::span<const core::Token> tokens,
    std::span<const std::string> ignore_emails = {},
    std::span<const std::string> ignore_domains = {});

}  // namespace sanctum::detect
