#include <labscan/extract/structured_parse_stage.hpp>
#include <labscan/core/alias_table.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace labscan::extract {

namespace lc = labscan::core;

StructuredParseStage::StructuredParseStage(StructuredParser parser, std::size_t min_text_chars)
    : parser_(std::move(parser)), min_text_chars_(min_text_chars) {}

std::expected<lc::StageOutput, lc::PipelineError> StructuredParseStage::process(
    const lc::PageContext& input) {
  if (lc::utf8_length(input.recognized_text) <= min_text_chars_) {
    spdlog::debug("structured parse skipped: {} chars of text", input.recognized_text.size());
    return lc::StageOutput{input};
  }

  auto outcome = parser_.parse(input.recognized_text, input.stop);
  if (!outcome) {
    return std::unexpected(outcome.error());
  }
  if (outcome->markers.empty()) {
    return lc::StageOutput{input};
  }

  lc::PageResult result;
  result.markers = std::move(outcome->markers);
  result.raw_text = input.recognized_text;
  result.confidence = outcome->confidence;
  result.source = lc::ExtractionSource::StructuredParser;
  return lc::StageOutput{std::move(result)};
}

}  // namespace labscan::extract
