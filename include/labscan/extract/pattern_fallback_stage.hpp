#pragma once

#include <labscan/core/error.hpp>
#include <labscan/core/pipeline_stage.hpp>
#include <labscan/extract/pattern_extractor.hpp>
#include <cstddef>
#include <expected>

namespace labscan::extract {

/// Regex pass over recognized text longer than min_text_chars. Any match ends
/// the chain with a fixed confidence (PatternFallback source).
class PatternFallbackStage : public labscan::core::IPipelineStage {
 public:
  static constexpr double kConfidence = 0.5;

  explicit PatternFallbackStage(PatternExtractor extractor, std::size_t min_text_chars = 50);

  [[nodiscard]] std::string_view name() const noexcept override { return "pattern_fallback"; }

  [[nodiscard]] std::expected<labscan::core::StageOutput,
                              labscan::core::PipelineError>
  process(const labscan::core::PageContext& input) override;

 private:
  PatternExtractor extractor_;
  std::size_t min_text_chars_;
};

}  // namespace labscan::extract
