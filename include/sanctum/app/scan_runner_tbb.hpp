#pragma once

#include <sanctum/app/config.hpp>
#include <sanctum/core/scan_result.hpp>
#include <sanctum/core/token.hpp>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#ifdef SANCTUM_HAS_TBB

namespace sanctum::app {

/// Callback for each ScanResult in the TBB runner; receives result and source_id.
/// May be invoked from TBB worker threads; must be thread-safe.
using ScanResultCallbackWithSourceId =
    std::function<void(const sanctum::core::ScanResult&, const std::string& source_id)>;

/// Runs one detection pass per work item in parallel using TBB.
///
/// Each work item is (source_id, tokens). The result's image_id is the item's index
/// and its source_id is set to the item's id before callback(result, source_id).
/// Detection holds no shared mutable state, so items are fully independent; the same
/// template is read concurrently by every task.
///
/// \param tpl Template applied to every item. Read only.
/// \param work_items Flat list of (source_id, tokens) pairs. Read only.
/// \param callback Invoked once per item. Must be thread-safe.
void run_scan_batch_tbb(
    const RedactionTemplate& tpl,
    const std::vector<std::pair<std::string, std::vector<sanctum::core::Token>>>& work_items,
    ScanResultCallbackWithSourceId callback);

}  // namespace sanctum::app

#endif  // SANCTUM_HAS_TBB
