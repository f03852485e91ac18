#include <labscan/vision/mock_recognition_engine.hpp>
#include <labscan/core/error.hpp>
#include <labscan/core/page.hpp>
#include <utility>

namespace labscan::vision {

void MockRecognitionEngine::set_text(std::string text) {
  std::lock_guard lock(mutex_);
  default_text_ = std::move(text);
}

void MockRecognitionEngine::set_text_for_mode(LayoutMode mode, std::string text) {
  std::lock_guard lock(mutex_);
  mode_text_[mode] = std::move(text);
}

void MockRecognitionEngine::set_raw_page_text(std::string text) {
  std::lock_guard lock(mutex_);
  raw_page_text_ = std::move(text);
  has_raw_page_text_ = true;
}

void MockRecognitionEngine::fail_mode(LayoutMode mode) {
  std::lock_guard lock(mutex_);
  failing_modes_[mode] = true;
}

std::expected<std::string, labscan::core::PipelineError>
MockRecognitionEngine::recognize(const labscan::core::Page& page, LayoutMode mode) {
  ++calls_;
  if (page.empty()) {
    return std::unexpected(labscan::core::PipelineError::InvalidPage);
  }
  if (fail_all_.load()) {
    return std::unexpected(labscan::core::PipelineError::RecognitionFailed);
  }

  std::lock_guard lock(mutex_);
  const bool preprocessed = page.format() == labscan::core::PixelFormat::Grayscale8;
  if (!preprocessed && has_raw_page_text_) {
    return raw_page_text_;
  }
  if (preprocessed) {
    if (failing_modes_.contains(mode)) {
      return std::unexpected(labscan::core::PipelineError::RecognitionFailed);
    }
    if (const auto it = mode_text_.find(mode); it != mode_text_.end()) {
      return it->second;
    }
  }
  return default_text_;
}

}  // namespace labscan::vision
