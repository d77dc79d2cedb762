#include <sanctum/core/pii.hpp>
#include <sanctum/core/region.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace sc = sanctum::core;

namespace {

sc::DetectedItem item_with_boxes(std::vector<sc::BBox> boxes) {
  sc::DetectedItem item;
  item.pii_type = sc::PiiType::Phone;
  item.matched_text = "555-123-4567";
  item.boxes = std::move(boxes);
  return item;
}

}  // namespace

TEST(Region, SingleBox) {
  const auto r = sc::merge_boxes(item_with_boxes({{5, 6, 7, 8}}));
  EXPECT_EQ(r.x, 5);
  EXPECT_EQ(r.y, 6);
  EXPECT_EQ(r.w, 7);
  EXPECT_EQ(r.h, 8);
  EXPECT_EQ(r.pii_type, sc::PiiType::Phone);
  EXPECT_EQ(r.label_text, "555-123-4567");
  EXPECT_TRUE(r.selected);
  EXPECT_FALSE(r.manual);
}

TEST(Region, GapsBetweenBoxesIncluded) {
  const auto r = sc::merge_boxes(item_with_boxes({{0, 0, 10, 10}, {20, 0, 10, 10}, {40, 0, 30, 10}}));
  EXPECT_EQ(r.x, 0);
  EXPECT_EQ(r.y, 0);
  EXPECT_EQ(r.w, 70);
  EXPECT_EQ(r.h, 10);
}

TEST(Region, BoxesOnTwoLines) {
  const auto r = sc::merge_boxes(item_with_boxes({{100, 10, 40, 12}, {5, 30, 20, 12}}));
  EXPECT_EQ(r.x, 5);
  EXPECT_EQ(r.y, 10);
  EXPECT_EQ(r.w, 135);
  EXPECT_EQ(r.h, 32);
}

TEST(Region, NoBoxesGivesZeroRegion) {
  const auto r = sc::merge_boxes(item_with_boxes({}));
  EXPECT_EQ(r.x, 0);
  EXPECT_EQ(r.y, 0);
  EXPECT_EQ(r.w, 0);
  EXPECT_EQ(r.h, 0);
  EXPECT_EQ(r.pii_type, sc::PiiType::Phone);
}

TEST(Region, BuildRegionsKeepsOrder) {
  std::vector<sc::DetectedItem> items(2);
  items[0].pii_type = sc::PiiType::Email;
  items[0].boxes = {{1, 1, 1, 1}};
  items[1].pii_type = sc::PiiType::Url;
  items[1].boxes = {{2, 2, 2, 2}};
  const auto regions = sc::build_regions(items);
  ASSERT_EQ(regions.size(), 2u);
  EXPECT_EQ(regions[0].pii_type, sc::PiiType::Email);
  EXPECT_EQ(regions[1].pii_type, sc::PiiType::Url);
  EXPECT_EQ(regions[1].x, 2);
}

TEST(Region, ManualRegion) {
  const auto r = sc::create_manual_region(3, 4, 50, 60);
  EXPECT_FALSE(r.pii_type.has_value());
  EXPECT_EQ(r.label_text, "Manual Region");
  EXPECT_TRUE(r.manual);
  EXPECT_TRUE(r.selected);
  EXPECT_EQ(r.w, 50);
  EXPECT_EQ(r.h, 60);
}

TEST(PiiType, NamesRoundTrip) {
  for (auto t : {sc::PiiType::Email, sc::PiiType::Ip, sc::PiiType::Domain, sc::PiiType::Url,
                 sc::PiiType::Phone, sc::PiiType::Face, sc::PiiType::Custom}) {
    EXPECT_EQ(sc::pii_type_from_string(sc::to_string(t)), t);
  }
  EXPECT_FALSE(sc::pii_type_from_string("ssn").has_value());
}
