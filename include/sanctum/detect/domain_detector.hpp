#pragma once

#include <sanctum/core/pii.hpp>
#include <sanctum/core/text_assembler.hpp>
#include <sanctum/core/token.hpp>
#include <span>
#include <string>
#include <vector>

namespace sanctum::detect {

/// Spans of the Email, Url and Ip items in items; other types are ignored.
[[nodiscard]] std::vector<core::TextSpan> exclusion_spans(std::span<const core::DetectedItem> items);

/// Stand-alone host names (labels of letters, digits and hyphens, at most 63
/// characters, no leading or trailing hyphen, final label two or more letters).
///
/// A candidate sharing any byte with an excluded span is dropped, so the host part
/// of an email or URL is never reported twice. Build excluded with exclusion_spans()
/// over the email, URL and IP results of the same pass. Candidates whose text is in
/// ignore_domains are dropped too.
[[nodiscard]] std::vector<core::DetectedItem> detect_domains(
    const core::AssembledText& assembled,
    std::span<const core::Token> tokens,
    std::span<const std::string> ignore_domains = {},
    std::span<const core::TextSpan> excluded = {});

}  // namespace sanctum::detect
