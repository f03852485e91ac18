#pragma once

#include <labscan/core/document.hpp>
#include <labscan/core/extraction_result.hpp>
#include <labscan/core/page.hpp>
#include <labscan/core/pipeline.hpp>
#include <labscan/vision/document_decoder.hpp>
#include <cstddef>
#include <stop_token>
#include <vector>

namespace labscan::app {

/// Optional per-stage timing: (stage_index, duration_ms).
using StageTimingCallback = labscan::core::StageTimingCallback;

struct RunOptions {
  std::size_t page_workers{1};  // 1 = sequential, 0 = hardware concurrency
  std::stop_token stop;
  /// Invoked after every stage of every page; must be thread-safe when page_workers != 1.
  StageTimingCallback* timing_cb{nullptr};
};

/// Runs the pipeline on each page. With more than one worker, pages are taken
/// from a shared queue by a small thread pool. Results come back in page
/// order regardless of completion order.
[[nodiscard]] std::vector<labscan::core::PageResult> extract_pages(
    labscan::core::Pipeline& pipeline,
    const std::vector<labscan::core::Page>& pages,
    const RunOptions& options = {});

/// Document in, aggregated result out. Never reports an error: a document
/// that cannot be decoded yields an empty result (no markers, no text,
/// confidence 0).
[[nodiscard]] labscan::core::ExtractionResult extract_document(
    const labscan::vision::DocumentDecoder& decoder,
    labscan::core::Pipeline& pipeline,
    const labscan::core::Document& document,
    const RunOptions& options = {});

}  // namespace labscan::app
