#pragma once

#include <sanctum/app/config.hpp>
#include <sanctum/core/error.hpp>
#include <sanctum/core/image.hpp>
#include <sanctum/core/pii.hpp>
#include <sanctum/core/policy.hpp>
#include <sanctum/core/scan_result.hpp>
#include <sanctum/core/text_assembler.hpp>
#include <sanctum/core/token.hpp>
#include <sanctum/vision/ocr_backend.hpp>
#include <sanctum/vision/redaction.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace sanctum::app {

/// Callback for each ScanResult; may be invoked from worker threads.
/// Must be thread-safe if using run_scan_batch_parallel.
using ScanResultCallback = std::function<void(const sanctum::core::ScanResult&)>;

/// Optional per-stage timing: (stage_index, duration_ms).
/// Stages: 0 assemble text, 1 detectors, 2 build regions, 3 policy.
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

inline constexpr std::size_t kScanStageCount = 4;

/// Runs the enabled detectors in canonical order (email, ip, url, domain, phone,
/// custom) and concatenates their results. Domain always runs after email, ip and
/// url so it can exclude their spans.
[[nodiscard]] std::vector<sanctum::core::DetectedItem> detect_pii(
    const sanctum::core::AssembledText& assembled,
    std::span<const sanctum::core::Token> tokens,
    const TemplateDetectors& detectors,
    const sanctum::core::TemplatePolicy& policy);

/// One detection pass: assemble -> detect -> build regions -> policy. No threading.
/// If timing_cb is non-null, it is invoked for each stage with (stage_index, duration_ms).
[[nodiscard]] sanctum::core::ScanResult run_scan(std::span<const sanctum::core::Token> tokens,
                                                 const RedactionTemplate& tpl,
                                                 StageTimingCallback* timing_cb = nullptr,
                                                 std::uint64_t image_id = 0);

/// Runs run_scan on each token set sequentially; image_id is the index in token_sets.
/// If source_ids is provided (same size as token_sets), each result is tagged with the
/// corresponding id before callback; empty string = leave unset.
void run_scan_batch(const std::vector<std::vector<sanctum::core::Token>>& token_sets,
                    const RedactionTemplate& tpl,
                    ScanResultCallback callback,
                    const std::vector<std::string>* source_ids = nullptr);

/// Same as run_scan_batch on a pool of worker threads. Results arrive in completion
/// order; callback may be invoked from any worker (must be thread-safe).
/// num_workers 0 = use hardware concurrency.
void run_scan_batch_parallel(const std::vector<std::vector<sanctum::core::Token>>& token_sets,
                             const RedactionTemplate& tpl,
                             ScanResultCallback callback,
                             std::size_t num_workers = 0,
                             const std::vector<std::string>* source_ids = nullptr);

/// Scan result plus the redacted copy of the input image.
struct RedactionOutcome {
  sanctum::core::ScanResult scan;
  sanctum::core::Image image;
};

/// OCR (at tpl.ocr_conf) -> run_scan -> apply_redaction in tpl.style.
[[nodiscard]] std::expected<RedactionOutcome, sanctum::core::DetectionError> run_redaction(
    sanctum::vision::IOcrBackend& ocr,
    const sanctum::core::Image& image,
    const RedactionTemplate& tpl,
    const sanctum::vision::RedactionOptions& options = {});

}  // namespace sanctum::app
