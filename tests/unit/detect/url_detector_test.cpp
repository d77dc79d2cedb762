#include <sanctum/core/text_assembler.hpp>
#include <sanctum/detect/url_detector.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace sc = sanctum::core;
namespace sd = sanctum::detect;

TEST(UrlDetector, QueryStringFlagged) {
  const std::vector<sc::Token> tokens{{"see", {0, 0, 20, 10}, 90},
                                      {"https://example.com/page?ref=abc", {30, 0, 200, 10}, 90},
                                      {"now", {240, 0, 20, 10}, 90}};
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_urls(a, tokens);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].pii_type, sc::PiiType::Url);
  EXPECT_EQ(items[0].matched_text, "https://example.com/page?ref=abc");
  EXPECT_TRUE(items[0].has_query_params);
}

TEST(UrlDetector, WwwWithoutQuery) {
  const std::vector<sc::Token> tokens{{"www.example.com/docs", {0, 0, 120, 10}, 90}};
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_urls(a, tokens);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_FALSE(items[0].has_query_params);
}

TEST(UrlDetector, SchemeCaseInsensitive) {
  const std::vector<sc::Token> tokens{{"HTTP://EXAMPLE.COM", {0, 0, 120, 10}, 90}};
  const auto a = sc::assemble_text(tokens);
  EXPECT_EQ(sd::detect_urls(a, tokens).size(), 1u);
}

TEST(UrlDetector, StopsAtClosingParenthesis) {
  const std::vector<sc::Token> tokens{{"(http://a.io/x)", {0, 0, 100, 10}, 90}};
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_urls(a, tokens);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].matched_text, "http://a.io/x");
}
