#include <sanctum/app/scan_runner.hpp>
#include <sanctum/core/region.hpp>
#include <sanctum/detect/custom_rule_detector.hpp>
#include <sanctum/detect/domain_detector.hpp>
#include <sanctum/detect/email_detector.hpp>
#include <sanctum/detect/ip_detector.hpp>
#include <sanctum/detect/phone_detector.hpp>
#include <sanctum/detect/url_detector.hpp>
#include <algorithm>
#include <chrono>
#include <iterator>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sanctum::app {

namespace sc = sanctum::core;

namespace {

void append(std::vector<sc::DetectedItem>& items, std::vector<sc::DetectedItem>&& more) {
  items.insert(items.end(), std::make_move_iterator(more.begin()),
               std::make_move_iterator(more.end()));
}

/// Times fn() and reports it as stage index when cb is set.
template <typename Fn>
void timed_stage(StageTimingCallback* cb, std::size_t index, Fn&& fn) {
  const auto start = std::chrono::steady_clock::now();
  fn();
  if (cb) {
    const auto end = std::chrono::steady_clock::now();
    const double ms = 1e-6 * static_cast<double>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    (*cb)(index, ms);
  }
}

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

std::vector<sc::DetectedItem> detect_pii(const sc::AssembledText& assembled,
                                         std::span<const sc::Token> tokens,
                                         const TemplateDetectors& detectors,
                                         const sc::TemplatePolicy& policy) {
  std::vector<sc::DetectedItem> items;
  if (assembled.text.empty()) return items;

  if (detectors.email) {
    append(items, detect::detect_emails(assembled, tokens, policy.ignore_emails, policy.ignore_domains));
  }
  if (detectors.ipv4) {
    append(items, detect::detect_ipv4(assembled, tokens));
  }
  if (detectors.url) {
    append(items, detect::detect_urls(assembled, tokens));
  }
  if (detectors.hostname) {
    const auto excluded = detect::exclusion_spans(items);
    append(items, detect::detect_domains(assembled, tokens, policy.ignore_domains, excluded));
  }
  if (detectors.phone) {
    append(items, detect::detect_phones(assembled, tokens));
  }
  if (detectors.custom) {
    append(items, detect::detect_custom(assembled, tokens, policy.custom_rules));
  }
  return items;
}

sc::ScanResult run_scan(std::span<const sc::Token> tokens,
                        const RedactionTemplate& tpl,
                        StageTimingCallback* timing_cb,
                        std::uint64_t image_id) {
  const sc::TemplatePolicy policy = to_policy(tpl);
  sc::ScanResult result;
  result.image_id = image_id;

  sc::AssembledText assembled;
  timed_stage(timing_cb, 0, [&] { assembled = sc::assemble_text(tokens); });
  timed_stage(timing_cb, 1, [&] { result.items = detect_pii(assembled, tokens, tpl.detectors, policy); });
  timed_stage(timing_cb, 2, [&] { result.regions = sc::build_regions(result.items); });
  timed_stage(timing_cb, 3, [&] { sc::apply_policy(result.items, result.regions, policy); });
  return result;
}

void run_scan_batch(const std::vector<std::vector<sc::Token>>& token_sets,
                    const RedactionTemplate& tpl,
                    ScanResultCallback callback,
                    const std::vector<std::string>* source_ids) {
  const std::size_t n = token_sets.size();
  const bool tag_source = source_ids && source_ids->size() == n;
  for (std::size_t i = 0; i < n; ++i) {
    auto result = run_scan(token_sets[i], tpl, nullptr, i);
    if (!callback) continue;
    if (tag_source && !(*source_ids)[i].empty()) result.source_id = (*source_ids)[i];
    callback(result);
  }
}

void run_scan_batch_parallel(const std::vector<std::vector<sc::Token>>& token_sets,
                             const RedactionTemplate& tpl,
                             ScanResultCallback callback,
                             std::size_t num_workers,
                             const std::vector<std::string>* source_ids) {
  const std::size_t n = token_sets.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_scan_batch(token_sets, tpl, std::move(callback), source_ids);
    return;
  }

  const bool tag_source = source_ids && source_ids->size() == n;

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      auto result = run_scan(token_sets[idx], tpl, nullptr, idx);
      if (tag_source && !(*source_ids)[idx].empty()) result.source_id = (*source_ids)[idx];
      callback(result);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

std::expected<RedactionOutcome, sc::DetectionError> run_redaction(
    sanctum::vision::IOcrBackend& ocr,
    const sc::Image& image,
    const RedactionTemplate& tpl,
    const sanctum::vision::RedactionOptions& options) {
  auto tokens = ocr.recognize(image, tpl.ocr_conf);
  if (!tokens) {
    return std::unexpected(tokens.error());
  }

  RedactionOutcome outcome;
  outcome.scan = run_scan(*tokens, tpl);

  auto redacted = sanctum::vision::apply_redaction(image, outcome.scan.regions, tpl.style, options);
  if (!redacted) {
    return std::unexpected(redacted.error());
  }
  outcome.image = std::move(*redacted);
  return outcome;
}

}  // namespace sanctum::app
