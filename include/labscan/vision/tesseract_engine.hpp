#pragma once

#include <labscan/vision/recognition_engine.hpp>
#include <string>

namespace labscan::vision {

/// Tesseract-backed recognition (LSTM + legacy, OEM default).
///
/// Each thread keeps one initialized TessBaseAPI per (datapath, language) and
/// reuses it across calls, setting the segmentation mode per call, so one
/// engine can be shared by concurrent page workers. Throws std::runtime_error from the constructor if
/// the language data cannot be loaded.
class TesseractEngine : public IRecognitionEngine {
 public:
  explicit TesseractEngine(std::string language = "eng", std::string datapath = {});

  [[nodiscard]] std::expected<std::string, labscan::core::PipelineError>
  recognize(const labscan::core::Page& page, LayoutMode mode) override;

  [[nodiscard]] const std::string& language() const noexcept { return language_; }

 private:
  std::string language_;
  std::string datapath_;
};

}  // namespace labscan::vision
