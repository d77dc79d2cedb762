#include <sanctum/core/text_assembler.hpp>
#include <sanctum/detect/email_detector.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sc = sanctum::core;
namespace sd = sanctum::detect;

namespace {

std::vector<sc::Token> line(std::vector<std::string> words) {
  std::vector<sc::Token> tokens;
  int x = 0;
  for (auto& w : words) {
    const int width = static_cast<int>(w.size()) * 8;
    tokens.push_back({std::move(w), sc::BBox{x, 10, width, 12}, 95});
    x += width + 8;
  }
  return tokens;
}

}  // namespace

TEST(EmailDetector, FindsAddressWithItsToken) {
  const auto tokens = line({"Contact", "bob@example.com", "today"});
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_emails(a, tokens);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].pii_type, sc::PiiType::Email);
  EXPECT_EQ(items[0].matched_text, "bob@example.com");
  ASSERT_EQ(items[0].boxes.size(), 1u);
  EXPECT_EQ(items[0].boxes[0], tokens[1].bbox);
  EXPECT_EQ(a.text.substr(items[0].span.start, items[0].span.end - items[0].span.start),
            "bob@example.com");
}

TEST(EmailDetector, IgnoredAddress) {
  const auto tokens = line({"bob@example.com", "ann@corp.io"});
  const auto a = sc::assemble_text(tokens);
  const std::vector<std::string> ignore{"bob@example.com"};
  const auto items = sd::detect_emails(a, tokens, ignore);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].matched_text, "ann@corp.io");
}

TEST(EmailDetector, IgnoredDomain) {
  const auto tokens = line({"bob@example.com", "ann@corp.io"});
  const auto a = sc::assemble_text(tokens);
  const std::vector<std::string> domains{"corp.io"};
  const auto items = sd::detect_emails(a, tokens, {}, domains);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].matched_text, "bob@example.com");
}

TEST(EmailDetector, NoMatchWithoutTld) {
  const auto tokens = line({"user@localhost", "plain", "text"});
  const auto a = sc::assemble_text(tokens);
  EXPECT_TRUE(sd::detect_emails(a, tokens).empty());
}

TEST(EmailDetector, LongScreenKeepsExactSpans) {
  std::vector<std::string> words;
  for (int i = 0; i < 2000; ++i) words.push_back("user" + std::to_string(i) + "@example.com");
  const auto tokens = line(words);
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_emails(a, tokens);
  ASSERT_EQ(items.size(), words.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    EXPECT_EQ(items[i].matched_text, words[i]);
    ASSERT_EQ(items[i].boxes.size(), 1u);
    EXPECT_EQ(items[i].boxes[0], tokens[i].bbox);
  }
}
