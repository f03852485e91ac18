#pragma once

#include <labscan/core/alias_table.hpp>
#include <labscan/core/biomarker.hpp>
#include <cstddef>
#include <regex>
#include <string_view>
#include <vector>

namespace labscan::extract {

/// Deterministic line-by-line extraction used when the language model finds nothing.
///
/// Each line is tried against two patterns, first match wins:
///   1. "<name> <value> [unit] [(low-high)]"   e.g. "Glucose 95 mg/dL (70-100)"
///   2. "<name>: <value> [unit]"               e.g. "HDL: 55 mg/dL"
/// Results are deduplicated by normalized name, first occurrence kept. No flags.
/// Lines without a digit, or longer than kMaxLineLength code points, are skipped.
class PatternExtractor {
 public:
  /// std::regex matching recurses per character; longer lines can exhaust the stack.
  static constexpr std::size_t kMaxLineLength = 512;

  /// aliases must outlive the extractor.
  explicit PatternExtractor(const labscan::core::AliasTable& aliases);

  [[nodiscard]] std::vector<labscan::core::Biomarker> extract(std::string_view raw_text) const;

  /// True if the lowercased name contains a known lab vocabulary token ("hdl", "vitamin d", ...).
  [[nodiscard]] static bool is_known_marker_name(std::string_view name);

 private:
  const labscan::core::AliasTable* aliases_;
  std::regex value_line_;
  std::regex colon_line_;
};

}  // namespace labscan::extract
