#pragma once

#include <sanctum/core/pii.hpp>
#include <sanctum/core/text_assembler.hpp>
#include <sanctum/core/token.hpp>
#include <span>
#include <vector>

namespace sanctum::detect {

/// Dotted-quad IPv4 addresses; every octet must be 0-255 ("192.168.1.256" never matches).
[[nodiscard]] std::vector<core::DetectedItem> detect_ipv4(const core::AssembledText& assembled,
                                                          std::span<const core::Token> tokens);

}  // namespace sanctum::detect
