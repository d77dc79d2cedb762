#include <sanctum/app/token_tsv.hpp>
#include <gtest/gtest.h>
#include <string>

namespace sa = sanctum::app;

namespace {

const std::string kTsv =
    "level\tpage_num\tblock_num\tpar_num\tline_num\tword_num\tleft\ttop\twidth\theight\tconf\ttext\n"
    "1\t1\t0\t0\t0\t0\t0\t0\t640\t480\t-1\t\n"
    "4\t1\t1\t1\t1\t0\t10\t20\t300\t14\t-1\t\n"
    "5\t1\t1\t1\t1\t1\t10\t20\t40\t14\t96.532104\tHello\n"
    "5\t1\t1\t1\t1\t2\t60\t20\t120\t14\t88\tbob@example.com\r\n"
    "5\t1\t1\t1\t1\t3\t190\t20\t20\t14\t31.0\tlow\n"
    "5\t1\t1\t1\t1\t4\t215\t20\t5\t14\t95\t \n"
    "5\t1\t1\t1\t1\t5\tbad\t20\t5\t14\t95\tbroken\n";

}  // namespace

TEST(TokenTsv, ParsesWordRows) {
  const auto tokens = sa::parse_tokens_tsv(kTsv, 60);
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0].text, "Hello");
  EXPECT_EQ(tokens[0].confidence, 97);
  EXPECT_EQ(tokens[0].bbox, (sanctum::core::BBox{10, 20, 40, 14}));
  EXPECT_EQ(tokens[1].text, "bob@example.com");
  EXPECT_EQ(tokens[1].confidence, 88);
}

TEST(TokenTsv, ThresholdZeroKeepsLowConfidence) {
  const auto tokens = sa::parse_tokens_tsv(kTsv, 0);
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[2].text, "low");
}

TEST(TokenTsv, EmptyInput) {
  EXPECT_TRUE(sa::parse_tokens_tsv("", 60).empty());
}

TEST(TokenTsv, MissingFile) {
  auto tokens = sa::load_tokens_tsv("/nonexistent/sanctum/tokens.tsv", 60);
  ASSERT_FALSE(tokens.has_value());
  EXPECT_EQ(tokens.error(), sanctum::core::DetectionError::LoadFailed);
}
