#include <sanctum/app/scan_runner_tbb.hpp>

#ifdef SANCTUM_HAS_TBB

#include <sanctum/app/scan_runner.hpp>
#include <sanctum/core/scan_result.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace sanctum::app {

void run_scan_batch_tbb(
    const RedactionTemplate& tpl,
    const std::vector<std::pair<std::string, std::vector<sanctum::core::Token>>>& work_items,
    ScanResultCallbackWithSourceId callback) {
  if (work_items.empty() || !callback) return;

  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&tpl, &work_items, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const std::string& source_id = work_items[i].first;
          auto result = run_scan(work_items[i].second, tpl, nullptr, i);
          result.source_id = source_id;
          callback(result, source_id);
        }
      });
}

}  // namespace sanctum::app

#endif  // SANCTUM_HAS_TBB
