#pragma once

#include <labscan/core/extraction_result.hpp>
#include <labscan/core/page.hpp>
#include <labscan/core/pipeline.hpp>
#include <stop_token>
#include <vector>

#ifdef LABSCAN_HAS_TBB

namespace labscan::app {

/// Same contract as extract_pages, scheduled on the TBB task arena instead of
/// a private thread pool. Results are in page order.
///
/// The pipeline is invoked from several TBB tasks at once, so every stage and
/// collaborator must be thread-safe (the bundled ones are).
[[nodiscard]] std::vector<labscan::core::PageResult> extract_pages_tbb(
    labscan::core::Pipeline& pipeline,
    const std::vector<labscan::core::Page>& pages,
    std::stop_token stop = {});

}  // namespace labscan::app

#endif  // LABSCAN_HAS_TBB
