#pragma once

#include <labscan/core/error.hpp>
#include <labscan/core/pipeline_stage.hpp>
#include <labscan/extract/vision_extractor.hpp>
#include <expected>

namespace labscan::extract {

/// Terminal stage: sends the page image to the vision model and always ends
/// the chain. OCR text, when there is any, is kept as the page's raw text in
/// preference to what the vision model read.
class VisionFallbackStage : public labscan::core::IPipelineStage {
 public:
  explicit VisionFallbackStage(VisionExtractor extractor);

  [[nodiscard]] std::string_view name() const noexcept override { return "vision_fallback"; }

  [[nodiscard]] std::expected<labscan::core::StageOutput,
                              labscan::core::PipelineError>
  process(const labscan::core::PageContext& input) override;

 private:
  VisionExtractor extractor_;
};

}  // namespace labscan::extract
