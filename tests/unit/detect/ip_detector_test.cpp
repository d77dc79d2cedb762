#include <sanctum/core/text_assembler.hpp>
#include <sanctum/detect/ip_detector.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace sc = sanctum::core;
namespace sd = sanctum::detect;

TEST(IpDetector, ValidAddress) {
  const std::vector<sc::Token> tokens{{"host", {0, 0, 30, 10}, 90}, {"192.168.1.1", {40, 0, 80, 10}, 90}};
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_ipv4(a, tokens);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].pii_type, sc::PiiType::Ip);
  EXPECT_EQ(items[0].matched_text, "192.168.1.1");
  EXPECT_EQ(items[0].boxes.size(), 1u);
}

TEST(IpDetector, OctetOutOfRangeRejected) {
  const std::vector<sc::Token> tokens{{"192.168.1.256", {0, 0, 80, 10}, 90}};
  const auto a = sc::assemble_text(tokens);
  EXPECT_TRUE(sd::detect_ipv4(a, tokens).empty());
}

TEST(IpDetector, Boundaries) {
  const std::vector<sc::Token> tokens{{"0.0.0.0", {0, 0, 50, 10}, 90},
                                      {"255.255.255.255", {60, 0, 90, 10}, 90},
                                      {"1.2.3", {160, 0, 30, 10}, 90}};
  const auto a = sc::assemble_text(tokens);
  const auto items = sd::detect_ipv4(a, tokens);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].matched_text, "0.0.0.0");
  EXPECT_EQ(items[1].matched_text, "255.255.255.255");
}
