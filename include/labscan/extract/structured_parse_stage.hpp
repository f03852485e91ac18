#pragma once

#include <labscan/core/error.hpp>
#include <labscan/core/pipeline_stage.hpp>
#include <labscan/extract/structured_parser.hpp>
#include <cstddef>
#include <expected>

namespace labscan::extract {

/// Sends recognized text longer than min_text_chars to the structured parser.
/// Markers end the chain (StructuredParser source); no markers or a failed
/// call pass the page on to the next fallback.
class StructuredParseStage : public labscan::core::IPipelineStage {
 public:
  explicit StructuredParseStage(StructuredParser parser, std::size_t min_text_chars = 50);

  [[nodiscard]] std::string_view name() const noexcept override { return "structured_parse"; }

  [[nodiscard]] std::expected<labscan::core::StageOutput,
                              labscan::core::PipelineError>
  process(const labscan::core::PageContext& input) override;

 private:
  StructuredParser parser_;
  std::size_t min_text_chars_;
};

}  // namespace labscan::extract
