#include <labscan/extract/pattern_fallback_stage.hpp>
#include <labscan/core/alias_table.hpp>
#include <utility>

namespace labscan::extract {

namespace lc = labscan::core;

PatternFallbackStage::PatternFallbackStage(PatternExtractor extractor, std::size_t min_text_chars)
    : extractor_(std::move(extractor)), min_text_chars_(min_text_chars) {}

std::expected<lc::StageOutput, lc::PipelineError> PatternFallbackStage::process(
    const lc::PageContext& input) {
  if (lc::utf8_length(input.recognized_text) <= min_text_chars_) {
    return lc::StageOutput{input};
  }

  auto markers = extractor_.extract(input.recognized_text);
  if (markers.empty()) {
    return lc::StageOutput{input};
  }

  lc::PageResult result;
  result.markers = std::move(markers);
  result.raw_text = input.recognized_text;
  result.confidence = kConfidence;
  result.source = lc::ExtractionSource::PatternFallback;
  return lc::StageOutput{std::move(result)};
}

}  // namespace labscan::extract
