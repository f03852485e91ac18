#pragma once

#include <labscan/core/extraction_result.hpp>
#include <vector>

namespace labscan::app {

/// Merge per-page results into one document result.
///
/// - markers: page order, deduplicated by lowercase name; a later page's
///   reading replaces an earlier one but keeps the earlier position
/// - raw_text: non-empty page texts joined by a blank line, each prefixed
///   "--- Page N ---" when the document has more than one page; nullopt if none
/// - confidence: mean over all pages (zero-confidence pages included),
///   clamped to [0, 1] and rounded to 2 decimals
[[nodiscard]] labscan::core::ExtractionResult aggregate(
    std::vector<labscan::core::PageResult> pages);

}  // namespace labscan::app
