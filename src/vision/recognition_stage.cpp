#include <labscan/vision/recognition_stage.hpp>
#include <utility>

namespace labscan::vision {

RecognitionStage::RecognitionStage(GridSearchRecognizer recognizer)
    : recognizer_(std::move(recognizer)) {}

std::expected<labscan::core::StageOutput, labscan::core::PipelineError>
RecognitionStage::process(const labscan::core::PageContext& input) {
  if (!input.page || input.page->empty()) {
    return std::unexpected(labscan::core::PipelineError::InvalidPage);
  }

  labscan::core::PageContext out = input;
  out.recognized_text = recognizer_.recognize(*input.page).text();
  return labscan::core::StageOutput{std::move(out)};
}

}  // namespace labscan::vision
