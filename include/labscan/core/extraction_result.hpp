#pragma once

#include <labscan/core/biomarker.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labscan::core {

/// Which strategy produced a page's markers (terminal state of the per-page chain).
enum class ExtractionSource : std::uint8_t {
  StructuredParser,
  PatternFallback,
  VisionFallback,
  Empty,  // every strategy exhausted; not an error
};

[[nodiscard]] std::string_view to_string(ExtractionSource source) noexcept;

/// Terminal result for one page.
struct PageResult {
  std::size_t page_index{0};
  std::vector<Biomarker> markers;
  std::optional<std::string> raw_text;
  double confidence{0.0};
  ExtractionSource source{ExtractionSource::Empty};
};

/// Final output for one document. markers empty + confidence 0 means
/// "nothing could be read", which callers surface without treating it as an error.
struct ExtractionResult {
  std::vector<Biomarker> markers;
  std::optional<std::string> raw_text;  // page-delimited when more than one page
  double confidence{0.0};               // always within [0, 1]
  std::size_t page_count{0};
};

}  // namespace labscan::core
