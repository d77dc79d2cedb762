#include <sanctum/core/text_assembler.hpp>
#include <sanctum/detect/phone_detector.hpp>
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
    tokens.push_back({std::move(w), sc::BBox{x, 0, width, 12}, 95});
    x += width + 8;
  }
  return tokens;
}

}  // namespace

TEST(PhoneDetector, SameNumberTwiceGivesTwoItems) {
  const auto tokens = line({"Call", "555-123-4567", "or", "555-123-4567"});
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_phones(a, tokens);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].matched_text, "555-123-4567");
  EXPECT_EQ(items[1].matched_text, "555-123-4567");
  ASSERT_EQ(items[0].boxes.size(), 1u);
  ASSERT_EQ(items[1].boxes.size(), 1u);
  EXPECT_NE(items[0].boxes[0], items[1].boxes[0]);
}

TEST(PhoneDetector, NumberSplitAcrossTokens) {
  const auto tokens = line({"Tel:", "(555)", "123-4567"});
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_phones(a, tokens);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].pii_type, sc::PiiType::Phone);
  EXPECT_EQ(items[0].matched_text, "(555) 123-4567");
  ASSERT_EQ(items[0].boxes.size(), 2u);
  EXPECT_EQ(items[0].boxes[0], tokens[1].bbox);
  EXPECT_EQ(items[0].boxes[1], tokens[2].bbox);
}

TEST(PhoneDetector, SevenDigitLocalNumber) {
  const auto tokens = line({"ext", "555-1234"});
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_phones(a, tokens);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].matched_text, "555-1234");
}

TEST(PhoneDetector, InternationalNumberReportedOnce) {
  // Matched by both the generic and GB passes; the generic grammar also runs on into "42".
  const auto tokens = line({"Tel", "+44", "20", "7946", "0958", "42", "people"});
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_phones(a, tokens);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].matched_text, "+44 20 7946 0958");
  EXPECT_EQ(items[0].boxes.size(), 4u);
  EXPECT_EQ(items[0].boxes.back(), tokens[4].bbox);
}

TEST(PhoneDetector, RegionalFragmentDoesNotSplitInternationalNumber) {
  const auto tokens = line({"Berlin", "+49", "30", "555-1234"});
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_phones(a, tokens);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].matched_text, "+49 30 555-1234");
  EXPECT_EQ(items[0].boxes.size(), 3u);
}

TEST(PhoneDetector, LongScreenFindsEveryNumber) {
  std::vector<std::string> words;
  for (int i = 0; i < 1000; ++i) words.emplace_back("555-123-4567");
  const auto tokens = line(std::move(words));
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_phones(a, tokens);
  ASSERT_EQ(items.size(), 1000u);
  for (std::size_t i = 0; i < items.size(); ++i) {
    EXPECT_EQ(items[i].matched_text, "555-123-4567");
    ASSERT_EQ(items[i].boxes.size(), 1u);
    EXPECT_EQ(items[i].boxes[0], tokens[i].bbox);
  }
}

TEST(PhoneDetector, AustralianLandline) {
  const auto tokens = line({"(02)", "9876", "5432"});
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_phones(a, tokens);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].matched_text, "(02) 9876 5432");
}

TEST(PhoneDetector, IpAddressIsNotAPhone) {
  const auto tokens = line({"192.168.1.1", "version", "2.4.10"});
  const auto a = sc::assemble_text(tokens);
  EXPECT_TRUE(sd::detect_phones(a, tokens).empty());
}

TEST(PhoneDetector, ScanRegionReportsSpan) {
  const std::string text = "x 555-123-4567";
  auto matches = sd::scan_phone_region(text, sd::PhoneRegion::US);
  ASSERT_TRUE(matches.has_value());
  ASSERT_EQ(matches->size(), 1u);
  EXPECT_EQ((*matches)[0].span, (sc::TextSpan{2, 14}));
  EXPECT_TRUE(sd::scan_phone_region(text, sd::PhoneRegion::Generic)->empty());
}
