#pragma once

#include <labscan/core/error.hpp>
#include <labscan/core/pipeline_stage.hpp>
#include <labscan/vision/text_recognizer.hpp>
#include <expected>

namespace labscan::vision {

/// Pipeline stage: grid-search OCR, store best text in the context, continue.
/// Always passes through; empty text is left for later stages to judge.
class RecognitionStage : public labscan::core::IPipelineStage {
 public:
  explicit RecognitionStage(GridSearchRecognizer recognizer);

  [[nodiscard]] std::string_view name() const noexcept override { return "recognition"; }

  [[nodiscard]] std::expected<labscan::core::StageOutput,
                              labscan::core::PipelineError>
  process(const labscan::core::PageContext& input) override;

 private:
  GridSearchRecognizer recognizer_;
};

}  // namespace labscan::vision
