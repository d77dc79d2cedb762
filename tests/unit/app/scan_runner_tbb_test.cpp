#ifdef SANCTUM_HAS_TBB

#include <sanctum/app/config.hpp>
#include <sanctum/app/scan_runner.hpp>
#include <sanctum/app/scan_runner_tbb.hpp>
#include <sanctum/core/scan_result.hpp>
#include <sanctum/core/token.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace {

std::vector<sanctum::core::Token> screenshot_tokens(const std::string& email) {
  return {{"mail", {0, 0, 30, 10}, 90}, {email, {40, 0, 120, 10}, 90}, {"555-123-4567", {170, 0, 90, 10}, 90}};
}

}  // namespace

TEST(ScanRunnerTbbTest, CallbackPerWorkItemWithSourceId) {
  std::vector<std::pair<std::string, std::vector<sanctum::core::Token>>> work_items;
  work_items.emplace_back("shot_1.png", screenshot_tokens("a@example.com"));
  work_items.emplace_back("shot_2.png", screenshot_tokens("b@example.com"));
  work_items.emplace_back("shot_3.png", screenshot_tokens("c@example.com"));

  const auto tpl = sanctum::app::default_template();
  std::atomic<std::size_t> call_count{0};
  std::vector<std::string> ids;
  std::mutex mutex;
  sanctum::app::run_scan_batch_tbb(
      tpl, work_items,
      [&](const sanctum::core::ScanResult& r, const std::string& source_id) {
        call_count++;
        EXPECT_EQ(r.source_id.value_or(""), source_id);
        EXPECT_EQ(r.items.size(), 2u);
        std::lock_guard lock(mutex);
        ids.push_back(source_id);
      });
  EXPECT_EQ(call_count.load(), 3u);
  std::sort(ids.begin(), ids.end());
  EXPECT_EQ(ids, (std::vector<std::string>{"shot_1.png", "shot_2.png", "shot_3.png"}));
}

TEST(ScanRunnerTbbTest, MatchesSequentialScan) {
  std::vector<std::pair<std::string, std::vector<sanctum::core::Token>>> work_items;
  for (int i = 0; i < 16; ++i) {
    work_items.emplace_back(std::to_string(i), screenshot_tokens("user" + std::to_string(i) + "@corp.io"));
  }
  const auto tpl = sanctum::app::default_template();
  std::vector<sanctum::core::ScanResult> results(work_items.size());
  sanctum::app::run_scan_batch_tbb(tpl, work_items,
                                   [&results](const sanctum::core::ScanResult& r, const std::string&) {
                                     results[r.image_id] = r;
                                   });
  for (std::size_t i = 0; i < work_items.size(); ++i) {
    const auto expected = sanctum::app::run_scan(work_items[i].second, tpl);
    ASSERT_EQ(results[i].items.size(), expected.items.size());
    for (std::size_t k = 0; k < expected.items.size(); ++k) {
      EXPECT_EQ(results[i].items[k].matched_text, expected.items[k].matched_text);
    }
  }
}

TEST(ScanRunnerTbbTest, EmptyWorkItemsDoesNotCallCallback) {
  std::vector<std::pair<std::string, std::vector<sanctum::core::Token>>> work_items;
  std::atomic<std::size_t> calls{0};
  sanctum::app::run_scan_batch_tbb(
      sanctum::app::default_template(), work_items,
      [&calls](const sanctum::core::ScanResult&, const std::string&) { calls++; });
  EXPECT_EQ(calls.load(), 0u);
}

#endif  // SANCTUM_HAS_TBB
