#include <labscan/vision/text_recognizer.hpp>
#include <labscan/core/alias_table.hpp>
#include <labscan/core/error.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

namespace labscan::vision {

namespace {

using labscan::core::PipelineError;

/// Run one engine call; exceptions from the engine count as a failed attempt.
std::expected<std::string, PipelineError> attempt(IRecognitionEngine& engine,
                                                  const labscan::core::Page& page,
                                                  LayoutMode mode) {
  try {
    return engine.recognize(page, mode);
  } catch (const std::exception& e) {
    spdlog::debug("recognition engine threw: {}", e.what());
    return std::unexpected(PipelineError::RecognitionFailed);
  }
}

}  // namespace

std::size_t score_text(std::string_view text) noexcept {
  std::size_t code_points = 0;
  std::size_t digits = 0;
  for (const char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    if ((c & 0xC0) != 0x80) ++code_points;
    if (c >= '0' && c <= '9') ++digits;
  }
  return code_points + 2 * digits;
}

GridSearchRecognizer::GridSearchRecognizer(std::shared_ptr<IRecognitionEngine> engine,
                                           Preprocessor preprocessor)
    : engine_(std::move(engine)), preprocessor_(std::move(preprocessor)) {}

RecognitionOutcome GridSearchRecognizer::recognize(const labscan::core::Page& page) const {
  RecognitionOutcome outcome;
  if (!engine_) {
    return outcome;
  }

  for (const auto strategy : kPreprocessStrategies) {
    auto processed = preprocessor_.apply(page, strategy);
    if (!processed) {
      spdlog::debug("page {}: preprocessing strategy={} failed: {}", page.index(),
                    to_string(strategy), labscan::core::to_string(processed.error()));
      outcome.failures += kLayoutModes.size();
      continue;
    }

    for (const auto mode : kLayoutModes) {
      auto text = attempt(*engine_, *processed, mode);
      if (!text) {
        spdlog::debug("page {}: recognition failed strategy={} mode={}: {}", page.index(),
                      to_string(strategy), to_string(mode),
                      labscan::core::to_string(text.error()));
        ++outcome.failures;
        continue;
      }

      RecognitionCandidate candidate;
      candidate.strategy = strategy;
      candidate.mode = mode;
      candidate.text = labscan::core::trim_copy(*text);
      candidate.score = score_text(candidate.text);

      if (candidate.score > outcome.score()) {
        spdlog::debug("page {}: better OCR result strategy={} mode={} score={}", page.index(),
                      to_string(strategy), to_string(mode), candidate.score);
        outcome.best = candidate;
      }
      outcome.attempts.push_back(std::move(candidate));
    }
  }

  if (!outcome.best) {
    auto text = attempt(*engine_, page, LayoutMode::AutoSegment);
    if (text) {
      RecognitionCandidate candidate;
      candidate.mode = LayoutMode::AutoSegment;
      candidate.preprocessed = false;
      candidate.text = labscan::core::trim_copy(*text);
      candidate.score = score_text(candidate.text);
      if (!candidate.text.empty()) outcome.best = candidate;
      outcome.attempts.push_back(std::move(candidate));
    } else {
      spdlog::error("page {}: all recognition attempts failed", page.index());
      ++outcome.failures;
    }
  }

  spdlog::info("page {}: OCR extracted {} characters (best of {} attempts, {} failed)",
               page.index(), outcome.text().size(), outcome.attempts.size() + outcome.failures,
               outcome.failures);
  return outcome;
}

}  // namespace labscan::vision
