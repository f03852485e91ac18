#include <labscan/extract/vision_fallback_stage.hpp>
#include <utility>

namespace labscan::extract {

namespace lc = labscan::core;

VisionFallbackStage::VisionFallbackStage(VisionExtractor extractor)
    : extractor_(std::move(extractor)) {}

std::expected<lc::StageOutput, lc::PipelineError> VisionFallbackStage::process(
    const lc::PageContext& input) {
  if (!input.page || input.page->empty()) {
    return std::unexpected(lc::PipelineError::InvalidPage);
  }

  auto outcome = extractor_.extract(*input.page, input.stop);
  if (!outcome) {
    return std::unexpected(outcome.error());
  }

  lc::PageResult result;
  result.markers = std::move(outcome->markers);
  result.confidence = outcome->confidence;
  result.source = result.markers.empty() ? lc::ExtractionSource::Empty
                                         : lc::ExtractionSource::VisionFallback;
  if (!input.recognized_text.empty()) {
    result.raw_text = input.recognized_text;
  } else {
    result.raw_text = std::move(outcome->raw_text);
  }
  return lc::StageOutput{std::move(result)};
}

}  // namespace labscan::extract
